/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/base64.hpp>
#include <fm/file.hpp>
#include <fm/snapshot/decoder.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;
using namespace ft_migrator::snapshot;

namespace {
    uint8_vector le_u128(const uint64_t v)
    {
        uint8_vector res(16);
        for (size_t i = 0; i < 8; ++i)
            res[i] = static_cast<uint8_t>(v >> (i * 8));
        return res;
    }

    uint8_vector le_u64(const uint64_t v)
    {
        uint8_vector res(8);
        for (size_t i = 0; i < 8; ++i)
            res[i] = static_cast<uint8_t>(v >> (i * 8));
        return res;
    }

    json::object item(const buffer key, const buffer val)
    {
        return json::object { { "key", base64::encode(key) }, { "value", base64::encode(val) } };
    }

    json::value export_doc(json::array &&values, const uint64_t height=1234)
    {
        return json::object { { "result", json::object { { "block_height", height }, { "values", std::move(values) } } } };
    }
}

suite snapshot_decoder_suite = [] {
    "snapshot::decoder"_test = [] {
        "classify"_test = [] {
            test_same(key_kind::contract_totals, classify(uint8_vector::from_hex("070601")).kind);
            const auto acc = classify(make_key(fungible_token_field, "alice.near"));
            test_same(key_kind::account_balance, acc.kind);
            test_same(std::string { "alice.near" }, acc.suffix);
            const auto proof = classify(make_key(used_event_field, "777"));
            test_same(key_kind::used_proof, proof.kind);
            test_same(std::string { "777" }, proof.suffix);
            test_same(key_kind::account_counter, classify(uint8_vector::from_hex("070604")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector::from_hex("07060400")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector::from_hex("070602")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector::from_hex("070603")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector::from_hex("0701")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector::from_hex("080601")).kind);
            test_same(key_kind::unrecognized, classify(uint8_vector {}).kind);
        };
        "decode"_test = [] {
            uint8_vector totals {};
            totals << le_u128(30) << le_u128(5) << le_u64(100);
            json::array values {};
            values.emplace_back(item(make_key(fungible_token_field), totals));
            values.emplace_back(item(make_key(fungible_token_field, "alice.near"), le_u128(10)));
            values.emplace_back(item(make_key(fungible_token_field, "bob.near"), le_u128(20)));
            values.emplace_back(item(make_key(used_event_field, "42"), uint8_vector::from_hex("01")));
            values.emplace_back(item(make_key(accounts_counter_field), le_u64(2)));
            values.emplace_back(item(uint8_vector::from_hex("0701AA"), uint8_vector::from_hex("FF")));
            const auto res = decode(export_doc(std::move(values)));
            test_same(uint64_t { 1234 }, res.block_height);
            test_same(size_t { 6 }, res.num_values);
            const auto &st = res.state;
            test_same(u128 { 30 }, st.totals.supply_on_near);
            test_same(u128 { 5 }, st.totals.supply_on_aurora);
            test_same(uint64_t { 100 }, *st.totals.storage_usage);
            test_same(size_t { 2 }, st.accounts.size());
            test_same(u128 { 10 }, st.accounts.at("alice.near"));
            test_same(u128 { 20 }, st.accounts.at("bob.near"));
            test_same(uint64_t { 2 }, st.accounts_counter);
            test_same(std::vector<std::string> { "42" }, st.proofs);
        };
        "bare result object"_test = [] {
            json::array values {};
            values.emplace_back(item(make_key(accounts_counter_field), le_u64(0)));
            const json::value doc = json::object { { "block_height", "77" }, { "values", std::move(values) } };
            const auto res = decode(doc);
            test_same(uint64_t { 77 }, res.block_height);
            expect(res.state.accounts.empty());
        };
        "accounts counter mismatch is fatal"_test = [] {
            json::array values {};
            values.emplace_back(item(make_key(fungible_token_field, "alice.near"), le_u128(10)));
            values.emplace_back(item(make_key(fungible_token_field, "bob.near"), le_u128(20)));
            values.emplace_back(item(make_key(accounts_counter_field), le_u64(3)));
            auto doc = export_doc(std::move(values));
            expect(throws<format_error>([&] { decode(doc); }));
            // the failure does not depend on the order of the values
            json::array reordered {};
            reordered.emplace_back(item(make_key(accounts_counter_field), le_u64(1)));
            reordered.emplace_back(item(make_key(fungible_token_field, "alice.near"), le_u128(10)));
            reordered.emplace_back(item(make_key(fungible_token_field, "bob.near"), le_u128(20)));
            doc = export_doc(std::move(reordered));
            expect(throws<format_error>([&] { decode(doc); }));
        };
        "a missing counter with accounts is fatal"_test = [] {
            json::array values {};
            values.emplace_back(item(make_key(fungible_token_field, "alice.near"), le_u128(10)));
            const auto doc = export_doc(std::move(values));
            expect(throws<format_error>([&] { decode(doc); }));
        };
        "malformed items"_test = [] {
            const auto fails = [](json::object &&bad) {
                json::array values {};
                values.emplace_back(std::move(bad));
                const auto doc = export_doc(std::move(values));
                return throws<format_error>([&] { decode(doc); });
            };
            expect(fails(item(make_key(accounts_counter_field), uint8_vector::from_hex("0100000000"))));
            expect(fails(item(make_key(fungible_token_field, "alice.near"), uint8_vector::from_hex("01"))));
            expect(fails(item(make_key(fungible_token_field), uint8_vector::from_hex("00"))));
            expect(fails(item(make_key(fungible_token_field, "Not An Account"), le_u128(1))));
            expect(fails(json::object { { "key", "!!notbase64" }, { "value", "AA==" } }));
            expect(fails(json::object { { "key", "BwYE" }, { "value", "AQAAAAAAAAA=garbage" } }));
            expect(fails(json::object { { "key", "A" }, { "value", "AA==" } }));
            expect(fails(json::object { { "key", "BwYE" }, { "value", "AQAAAAAAAA" } }));
            expect(fails(item(make_key(used_event_field, std::string_view { "\xFF\xFE" }), uint8_vector::from_hex("01"))));
            expect(fails(item(make_key(used_event_field, std::string_view { "12\xC3" }), uint8_vector::from_hex("01"))));
            expect(fails(json::object { { "key", 12 }, { "value", "AA==" } }));
            expect(fails(json::object { { "key", "BwYE" } }));
            expect(throws<format_error>([] { decode(json::value(json::object { { "values", json::array {} } })); }));
            expect(throws<format_error>([] { decode(json::value(json::array {})); }));
        };
        "decode_file"_test = [] {
            const auto res = decode_file("./data/snapshot-sample.json");
            test_same(uint64_t { 80000000 }, res.block_height);
            test_same(size_t { 7 }, res.num_values);
            test_same(size_t { 2 }, res.state.accounts.size());
            test_same(std::vector<std::string> { "1234567890" }, res.state.proofs);
            test_same(u128 { 30 }, res.state.totals.supply_on_near);
            expect(throws<format_error>([] { decode_file("./data/does-not-exist.json"); }));
        };
        "convert"_test = [] {
            file::tmp out { "snapshot-convert.bin" };
            test_same(out.path(), convert("./data/snapshot-sample.json", out.path()));
            const auto st = migration::state_data::load(out.path());
            expect(st == decode_file("./data/snapshot-sample.json").state);
            test_same(std::string { "contract_state80000000.bin" }, default_output_path(80000000));
        };
    };
};
