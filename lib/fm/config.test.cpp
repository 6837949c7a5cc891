/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/config.hpp>
#include <fm/file.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite config_suite = [] {
    "config"_test = [] {
        "config_json"_test = [] {
            const config_json cfg { json::object { { "rpcUrl", "http://127.0.0.1:3030" }, { "requestDelayMs", 70 } } };
            test_same(std::string_view { "http://127.0.0.1:3030" }, std::string_view { cfg.at("rpcUrl").as_string() });
            test_same(uint64_t { 70 }, json::as_uint(cfg.at("requestDelayMs")));
            expect(throws<error>([&] { static_cast<void>(cfg.at("missing")); }));
            test_same(size_t { 2 }, cfg.json().size());
        };
        "configs_mock"_test = [] {
            const configs_mock cfgs { configs_mock::map_type {
                { "node", config_json { json::object { { "commitRetries", 3 } } } }
            } };
            test_same(uint64_t { 3 }, json::as_uint(cfgs.at("node").at("commitRetries")));
            expect(throws<error>([&] { static_cast<void>(cfgs.at("indexer")); }));
        };
        "configs_dir"_test = [] {
            file::tmp node_cfg { "cfg-test/node.json" };
            file::tmp mig_cfg { "cfg-test/migration.json" };
            file::tmp other { "cfg-test/readme.txt" };
            file::write(node_cfg.path(), std::string_view { R"({"rpcUrl":"https://rpc.testnet.near.org","commitRetries":"10"})" });
            file::write(mig_cfg.path(), std::string_view { R"({"batchSize":750})" });
            file::write(other.path(), std::string_view { "not a config" });
            const configs_dir cfgs { std::filesystem::path { node_cfg.path() }.parent_path().string() };
            test_same(uint64_t { 10 }, json::as_uint(cfgs.at("node").at("commitRetries")));
            test_same(uint64_t { 750 }, json::as_uint(cfgs.at("migration").at("batchSize")));
            expect(throws<error>([&] { static_cast<void>(cfgs.at("readme")); }));
        };
        "config_file must be an object"_test = [] {
            file::tmp bad { "cfg-bad.json" };
            file::write(bad.path(), std::string_view { "[1,2,3]" });
            expect(throws<error>([&] { config_file cfg { bad.path() }; }));
        };
        "shipped network configs"_test = [] {
            for (const auto *net: { "mainnet", "testnet", "localnet" }) {
                const configs_dir cfgs { install_path(fmt::format("etc/{}", net)) };
                expect(!cfgs.at("node").at("rpcUrl").as_string().empty()) << net;
                expect(json::as_uint(cfgs.at("migration").at("batchSize")) > 0) << net;
                expect(!cfgs.at("indexer").at("contract").as_string().empty()) << net;
            }
        };
    };
};
