/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/chain/client.hpp>
#include <fm/chain/node-mock.hpp>
#include <fm/near/transaction.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;
using namespace std::chrono_literals;

namespace {
    near::signer test_signer()
    {
        return near::signer::from_seed("migrator.near", chain::node_mock::make_hash("migrator seed"));
    }

    chain::client_settings fast_settings(const size_t retries=10)
    {
        chain::client_settings s {};
        s.request_delay = 1ms;
        s.commit_retries = retries;
        return s;
    }

    migration::input_data sample_payload()
    {
        migration::input_data in {};
        in.accounts.emplace_back("alice.near", u128 { 10, 0 });
        return in;
    }
}

suite chain_client_suite = [] {
    "chain::client"_test = [] {
        "settings from config"_test = [] {
            const config_json cfg { json::object { { "requestDelayMs", 90 }, { "commitRetries", 4 } } };
            const auto s = chain::client_settings::from_config(cfg);
            test_same(90, static_cast<int>(s.request_delay.count()));
            test_same(size_t { 4 }, s.commit_retries);
            test_same(near::max_gas, s.commit_gas);
            expect(throws<error>([] { chain::client_settings::from_config(config_json { json::object { { "commitRetries", 0 } } }); }));
        };
        "rate limit"_test = [] {
            chain::node_mock node {};
            node.add_block(100);
            chain::client_settings s {};
            s.request_delay = 20ms;
            chain::client c { node, s };
            static constexpr size_t num_calls = 5;
            for (size_t i = 0; i < num_calls; ++i)
                expect(static_cast<bool>(c.block_at(100)));
            const auto &times = node.request_times();
            test_same(num_calls, times.size());
            for (size_t i = 1; i < times.size(); ++i)
                expect(times[i] - times[i - 1] >= 20ms) << i;
        };
        "latest_height"_test = [] {
            chain::node_mock node {};
            node.add_block(10);
            node.add_block(12);
            chain::client c { node, fast_settings() };
            test_same(chain::height_t { 12 }, c.latest_height());
            node.set_final_height(11);
            test_same(chain::height_t { 10 }, c.latest_height());
        };
        "block_at"_test = [] {
            chain::node_mock node {};
            const auto chunk_hash = chain::node_mock::make_hash("chunk");
            node.add_block(10);
            node.add_block(11, { chain::chunk_info { chunk_hash } });
            chain::client c { node, fast_settings() };
            const auto blk = c.block_at(11);
            expect(static_cast<bool>(blk));
            test_same(chain::height_t { 11 }, blk->height);
            test_same(c.block_at(10)->hash, blk->prev_hash);
            test_same(size_t { 1 }, blk->chunks.size());
            expect(c.unresolved_blocks().empty());

            const auto missing = c.block_at(12);
            expect(!missing);
            test_same(chain::height_t { 12 }, missing.error().height());
            expect(throws<chain::block_unavailable>([&] { static_cast<void>(missing.value()); }));
            test_same(std::set<chain::height_t> { 12 }, c.unresolved_blocks());
            // the client itself does not retry
            node.fail_next_requests(1);
            expect(!c.block_at(11));
            test_same(std::set<chain::height_t> { 11, 12 }, c.unresolved_blocks());
            c.resolve(11);
            test_same(std::set<chain::height_t> { 12 }, c.unresolved_blocks());
        };
        "chunk"_test = [] {
            chain::node_mock node {};
            const auto chunk_hash = chain::node_mock::make_hash("chunk");
            node.add_block(1, { chain::chunk_info { chunk_hash } });
            chain::client c { node, fast_settings() };
            expect(static_cast<bool>(c.chunk(chunk_hash)));
            const auto missing = c.chunk(chain::node_mock::make_hash("other"));
            expect(!missing);
            expect(throws<chain::chunk_unavailable>([&] { static_cast<void>(*missing); }));
        };
        "parse_call"_test = [] {
            const auto eff = chain::client::parse_call("ft_transfer", buffer { std::string_view { R"({"receiver_id":"bob.near","amount":"1"})" } });
            test_same(std::vector<std::string> { "bob.near" }, eff.accounts);
            expect(chain::client::parse_call("submit", buffer {}).empty());
        };
        "commit_transaction"_test = [] {
            chain::node_mock node {};
            node.add_block(1);
            const auto signer = test_signer();
            node.add_access_key(signer.account_id, signer.pk, 41);
            chain::client c { node, fast_settings() };
            const auto res = c.commit_transaction(signer, "aurora", "migrate", sample_payload().encode());
            expect(res.success);
            test_same(uint64_t { 42 }, node.nonce(signer.account_id));
            test_same(u128 { 10, 0 }, node.contract().accounts.at("alice.near"));
        };
        "commit retries transient failures"_test = [] {
            chain::node_mock node {};
            node.add_block(1);
            const auto signer = test_signer();
            node.add_access_key(signer.account_id, signer.pk);
            node.fail_next_commits(3);
            chain::client c { node, fast_settings() };
            expect(c.commit_transaction(signer, "aurora", "migrate", sample_payload().encode()).success);
            test_same(size_t { 4 }, node.num_commits());
            // every attempt signs a fresh nonce
            test_same(uint64_t { 4 }, node.nonce(signer.account_id));
        };
        "commit budget exhaustion is fatal"_test = [] {
            chain::node_mock node {};
            node.add_block(1);
            const auto signer = test_signer();
            node.add_access_key(signer.account_id, signer.pk);
            node.fail_next_commits(100);
            chain::client c { node, fast_settings(10) };
            expect(throws<fatal_error>([&] { c.commit_transaction(signer, "aurora", "migrate", sample_payload().encode()); }));
            test_same(size_t { 10 }, node.num_commits());
            expect(node.contract().accounts.empty());
        };
        "commit with an unknown key"_test = [] {
            chain::node_mock node {};
            node.add_block(1);
            chain::client c { node, fast_settings(3) };
            expect(throws<fatal_error>([&] { c.commit_transaction(test_signer(), "aurora", "migrate", sample_payload().encode()); }));
        };
        "request_view"_test = [] {
            chain::node_mock node {};
            node.contract().accounts.emplace("alice.near", u128 { 5, 0 });
            chain::client c { node, fast_settings() };
            const auto res = c.request_view("aurora", "ft_balance_of", buffer { std::string_view { R"({"account_id":"alice.near"})" } });
            test_same(std::string_view { "\"5\"" }, res.str());
            const auto check = migration::decode_check_result(c.request_view("aurora", "check_migration_correctness", sample_payload().encode()));
            expect(std::holds_alternative<migration::check::account_amount>(check));
            expect(throws<chain::rpc_error>([&] { c.request_view("aurora", "no_such_method", buffer {}); }));
        };
        "tx_status"_test = [] {
            chain::node_mock node {};
            const auto tx_hash = chain::node_mock::make_hash("tx");
            chain::tx_outcome out {};
            out.tx_hash = tx_hash;
            out.success = true;
            node.set_tx_outcome(tx_hash, out);
            chain::client c { node, fast_settings() };
            expect(c.tx_status(tx_hash, "alice.near")->success);
            expect(!c.tx_status(chain::node_mock::make_hash("other"), "alice.near"));
        };
    };
};
