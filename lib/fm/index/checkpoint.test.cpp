/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/file.hpp>
#include <fm/index/checkpoint-writer.hpp>
#include <fm/chain/node-mock.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

namespace {
    index::block_log make_log(const index::height_t height, const std::string &method)
    {
        index::block_log log { height };
        log.actions.emplace_back(index::action_record { method, { "alice.near" }, {}, chain::node_mock::make_hash(method) });
        return log;
    }

    index::checkpoint sample_checkpoint()
    {
        index::checkpoint cp {};
        cp.first_block = 100;
        cp.last_block = 106;
        cp.last_handled_block = 105;
        cp.current_block = 200;
        cp.last_block_hash = chain::node_mock::make_hash("block-105");
        cp.missed_blocks = { 103 };
        cp.data.merge({ "alice.near", "aurora" }, { "123456" }, make_log(101, "ft_transfer"));
        return cp;
    }
}

suite index_checkpoint_suite = [] {
    "index::checkpoint"_test = [] {
        "merge"_test = [] {
            index::dataset ds {};
            ds.merge({ "a.near" }, {}, make_log(10, "ft_transfer"));
            ds.merge({ "b.near" }, { "p1" }, make_log(12, "finish_deposit"));
            ds.merge({ "a.near" }, { "p1" }, make_log(11, "withdraw"));
            test_same(std::set<std::string> { "a.near", "b.near" }, ds.accounts);
            test_same(std::set<std::string> { "p1" }, ds.proofs);
            test_same(size_t { 3 }, ds.logs.size());
            test_same(index::height_t { 11 }, ds.logs.at(1).height);
            // a second merge of the same height replaces the group
            ds.merge({}, {}, make_log(12, "ft_transfer_call"));
            test_same(size_t { 3 }, ds.logs.size());
            test_same(std::string { "ft_transfer_call" }, ds.logs.back().actions.at(0).method);
            // empty groups are not recorded
            ds.merge({}, {}, index::block_log { 13 });
            test_same(size_t { 3 }, ds.logs.size());
        };
        "missing file gives a default"_test = [] {
            const auto cp = index::checkpoint::load("./tmp/no-such-checkpoint.bin");
            expect(cp == index::checkpoint {});
        };
        "save and load"_test = [] {
            file::tmp path { "checkpoint-test.bin" };
            const auto cp = sample_checkpoint();
            cp.save(path);
            const auto loaded = index::checkpoint::load(path);
            expect(loaded == cp);
            test_same(index::height_t { 105 }, loaded.last_handled_block);
            test_same(std::set<index::height_t> { 103 }, loaded.missed_blocks);
        };
        "unreadable file is fatal"_test = [] {
            file::tmp path { "checkpoint-bad.bin" };
            file::write(path, std::string_view { "garbage" });
            expect(throws<error>([&] { index::checkpoint::load(path); }));
        };
        "inconsistent checkpoint is rejected"_test = [] {
            file::tmp path { "checkpoint-inconsistent.bin" };
            auto cp = sample_checkpoint();
            cp.first_block = 150;
            cp.save(path);
            expect(throws<error>([&] { index::checkpoint::load(path); }));
        };
        "override_start"_test = [] {
            auto cp = sample_checkpoint();
            cp.override_start(300);
            test_same(index::height_t { 300 }, cp.last_block);
            test_same(index::height_t { 100 }, *cp.first_block);
            expect(!cp.last_block_hash);
            auto cp2 = sample_checkpoint();
            cp2.override_start(50);
            test_same(index::height_t { 50 }, cp2.last_block);
            expect(!cp2.first_block);
            expect(nothrow([&] { cp2.validate(); }));
        };
        "stats"_test = [] {
            const auto cp = sample_checkpoint();
            const auto short_stats = index::stats(cp);
            expect(short_stats.find("accounts: 2") != std::string::npos) << short_stats;
            expect(short_stats.find("alice.near") == std::string::npos);
            const auto full_stats = index::stats(cp, true);
            expect(full_stats.find("account: alice.near") != std::string::npos) << full_stats;
            expect(full_stats.find("proof: 123456") != std::string::npos);
            expect(full_stats.find("method: ft_transfer") != std::string::npos);
        };
    };

    "index::checkpoint_writer"_test = [] {
        "latest snapshot wins"_test = [] {
            file::tmp path { "checkpoint-writer.bin" };
            {
                index::checkpoint_writer w { path };
                for (index::height_t h = 1; h <= 20; ++h) {
                    index::checkpoint cp {};
                    cp.first_block = 1;
                    cp.last_handled_block = h;
                    cp.last_block = h + 1;
                    w.submit(std::move(cp));
                }
                w.flush();
                expect(w.num_saves() >= 1);
                expect(w.num_saves() <= 20);
                test_same(index::height_t { 20 }, index::checkpoint::load(path).last_handled_block);
            }
        };
        "pending snapshot is written at destruction"_test = [] {
            file::tmp path { "checkpoint-writer-dtor.bin" };
            {
                index::checkpoint_writer w { path };
                w.submit(sample_checkpoint());
            }
            expect(index::checkpoint::load(path) == sample_checkpoint());
        };
        "save failures surface in flush"_test = [] {
            file::tmp dir_path { "checkpoint-writer-dir" };
            std::filesystem::create_directories(dir_path.path());
            index::checkpoint_writer w { dir_path.path() };
            w.submit(sample_checkpoint());
            expect(throws<error>([&] { w.flush(); }));
            std::filesystem::remove_all(dir_path.path());
            std::filesystem::remove(dir_path.path() + ".tmp");
        };
    };
};
