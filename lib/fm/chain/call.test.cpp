/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/encoder.hpp>
#include <fm/chain/call.hpp>
#include <fm/sha2.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

namespace {
    buffer text(const std::string_view s)
    {
        return buffer { s };
    }
}

suite chain_call_suite = [] {
    "chain::call"_test = [] {
        "ft_transfer"_test = [] {
            const auto v = chain::call::decode("ft_transfer", text(R"({"receiver_id":"bob.near","amount":"1000000000000000000000000","memo":"hi"})"));
            expect(std::holds_alternative<chain::call::ft_transfer>(v));
            const auto &t = std::get<chain::call::ft_transfer>(v);
            test_same(std::string { "bob.near" }, t.receiver_id);
            test_same(u128::from_string("1000000000000000000000000"), t.amount);
            test_same(std::string { "hi" }, *t.memo);
            const auto eff = chain::call::effect_of(v);
            test_same(std::vector<std::string> { "bob.near" }, eff.accounts);
            expect(!eff.proof);
        };
        "ft_transfer_call"_test = [] {
            const auto eff = chain::call::parse("ft_transfer_call", text(R"({"receiver_id":"dex.near","amount":"5","msg":""})"));
            test_same(std::vector<std::string> { "dex.near" }, eff.accounts);
        };
        "numeric amounts"_test = [] {
            const auto v = chain::call::decode("ft_transfer", text(R"({"receiver_id":"bob.near","amount":42})"));
            test_same(u128 { 42, 0 }, std::get<chain::call::ft_transfer>(v).amount);
        };
        "malformed arguments give an empty effect"_test = [] {
            expect(chain::call::parse("ft_transfer", text("not json")).empty());
            expect(chain::call::parse("ft_transfer", text(R"({"amount":"1"})")).empty());
            expect(chain::call::parse("ft_transfer", text(R"({"receiver_id":"Bad..Id","amount":"1"})")).empty());
            expect(chain::call::parse("ft_transfer_call", text(R"({"receiver_id":"dex.near","amount":"1"})")).empty());
            expect(chain::call::parse("finish_deposit", uint8_vector::from_hex("0102")).empty());
            expect(throws<error>([] { chain::call::decode("ft_transfer", text("[]")); }));
        };
        "unrecognized methods are ignored"_test = [] {
            expect(!chain::call::recognized("submit"));
            const auto v = chain::call::decode("submit", uint8_vector::from_hex("F86B"));
            expect(std::holds_alternative<chain::call::ignored>(v));
            test_same(std::string { "submit" }, std::get<chain::call::ignored>(v).method);
            expect(chain::call::parse("submit", uint8_vector::from_hex("F86B")).empty());
        };
        "withdraw"_test = [] {
            borsh::encoder enc {};
            enc.fixed(uint8_vector::from_hex("00112233445566778899AABBCCDDEEFF00112233")).u128(u128 { 77, 0 });
            const auto v = chain::call::decode("withdraw", enc.bytes());
            const auto &w = std::get<chain::call::withdraw>(v);
            test_same(u128 { 77, 0 }, w.amount);
            test_same(uint8_t { 0x33 }, w.recipient_address[19]);
            expect(chain::call::effect_of(v).empty());
        };
        "finish_deposit"_test = [] {
            borsh::encoder enc {};
            enc.string("alice.near").u128(u128 { 100, 0 }).string("1234567").string("relayer.near").u128(u128 { 1, 0 }).none();
            const auto eff = chain::call::parse("finish_deposit", enc.bytes());
            test_same(std::vector<std::string> { "alice.near", "relayer.near" }, eff.accounts);
            test_same(std::string { "1234567" }, *eff.proof);
            borsh::encoder with_msg {};
            with_msg.string("alice.near").u128(u128 { 100, 0 }).string("77").string("relayer.near").u128(u128 {}).u8(1).bytes(text("msg"));
            const auto v = chain::call::decode("finish_deposit", with_msg.bytes());
            test_same(std::string_view { "msg" }, std::get<chain::call::finish_deposit>(v).msg->str());
        };
        "deposit proof key"_test = [] {
            const auto header = uint8_vector::from_hex("F90211A0");
            borsh::encoder enc {};
            enc.u64(3).bytes(text("log")).u64(9).bytes(text("receipt")).bytes(header).u32(2).bytes(text("n1")).bytes(text("n2"));
            const auto v = chain::call::decode("deposit", enc.bytes());
            const auto &d = std::get<chain::call::deposit>(v);
            test_same(uint64_t { 3 }, d.log_index);
            test_same(uint64_t { 9 }, d.receipt_index);
            test_same(size_t { 2 }, d.proof.size());

            borsh::encoder key_data {};
            key_data.u64(3).u64(9).fixed(header);
            const auto h = sha2::digest(key_data.bytes());
            std::string expected {};
            for (const auto b: h)
                expected += fmt::format("{}", static_cast<unsigned>(b));
            test_same(expected, d.proof_key());
            const auto eff = chain::call::effect_of(v);
            expect(eff.accounts.empty());
            test_same(expected, *eff.proof);
        };
        "deposit with an impossible node count"_test = [] {
            borsh::encoder enc {};
            enc.u64(0).bytes(text("")).u64(0).bytes(text("")).bytes(text("")).u32(1000000);
            expect(throws<borsh::decode_error>([&] { chain::call::decode("deposit", enc.bytes()); }));
        };
    };
};
