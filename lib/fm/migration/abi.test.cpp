/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/migration/abi.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;
using namespace ft_migrator::migration;

suite migration_abi_suite = [] {
    "migration::abi"_test = [] {
        "input_data layout"_test = [] {
            input_data in {};
            in.accounts.emplace_back("a", u128 { 1 });
            in.total_supply = u128 { 5 };
            in.statistics_aurora_accounts_counter = 1;
            in.used_proofs.emplace_back("p");
            const auto exp = uint8_vector::from_hex(
                "01000000" "01000000" "61" "01000000000000000000000000000000"
                "01" "05000000000000000000000000000000"
                "00"
                "01" "0100000000000000"
                "01000000" "01000000" "70");
            test_same(exp, in.encode());
            expect(in == input_data::decode(exp));
        };
        "empty input_data"_test = [] {
            const input_data in {};
            test_same(uint8_vector::from_hex("00000000" "00" "00" "00" "00000000"), in.encode());
        };
        "input_data rejects trailing bytes"_test = [] {
            auto bytes = input_data {}.encode();
            bytes.emplace_back(0);
            expect(throws<borsh::decode_error>([&] { input_data::decode(bytes); }));
        };
        "input_data rejects oversized lists"_test = [] {
            expect(throws<borsh::decode_error>([] { input_data::decode(uint8_vector::from_hex("FFFFFF00")); }));
        };
        "check results"_test = [] {
            const std::vector<check_result> results {
                check::success {},
                check::account_not_exist { { "alice.near", "bob.near" } },
                check::account_amount { { { "alice.near", u128 { 7 } } } },
                check::total_supply { u128 { 0, 1 } },
                check::storage_usage { 1234 },
                check::statistics_counter { 3 },
                check::proof { { "1234" } }
            };
            for (size_t i = 0; i < results.size(); ++i) {
                const auto bytes = encode(results[i]);
                test_same(static_cast<uint8_t>(i), bytes.at(0));
                expect(decode_check_result(bytes) == results[i]) << fmt::format("variant {}", i);
            }
        };
        "check result tags"_test = [] {
            test_same(uint8_vector::from_hex("00"), encode(check::success {}));
            test_same(uint8_vector::from_hex("04" "D204000000000000"), encode(check::storage_usage { 1234 }));
            expect(throws<borsh::decode_error>([] { decode_check_result(uint8_vector::from_hex("07")); }));
            expect(throws<borsh::decode_error>([] { decode_check_result(uint8_vector::from_hex("05" "01")); }));
        };
        "mismatch_count"_test = [] {
            test_same(size_t { 0 }, mismatch_count(check::success {}));
            test_same(size_t { 2 }, mismatch_count(check::account_not_exist { { "a.near", "b.near" } }));
            test_same(size_t { 1 }, mismatch_count(check::account_amount { { { "a.near", u128 { 1 } } } }));
            test_same(size_t { 1 }, mismatch_count(check::total_supply { u128 { 9 } }));
            test_same(size_t { 3 }, mismatch_count(check::proof { { "1", "2", "3" } }));
        };
        "describe"_test = [] {
            test_same(std::string { "Success" }, describe(check::success {}));
            test_same(std::string { "AccountNotExist(1): [alice.near]" }, describe(check::account_not_exist { { "alice.near" } }));
            test_same(std::string { "AccountAmount(2): [a.near: 1, b.near: 2]" },
                describe(check::account_amount { { { "a.near", u128 { 1 } }, { "b.near", u128 { 2 } } } }));
            test_same(std::string { "TotalSupply: 18446744073709551616" }, describe(check::total_supply { u128 { 0, 1 } }));
            test_same(std::string { "StatisticsCounter: 3" }, describe(check::statistics_counter { 3 }));
        };
    };
};
