/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/borsh/encoder.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite borsh_codec_suite = [] {
    "borsh::codec"_test = [] {
        "integers are little-endian"_test = [] {
            borsh::encoder enc {};
            enc.u8(0xAB).u32(0x01020304).u64(0x1122334455667788ULL);
            test_same(uint8_vector::from_hex("AB040302018877665544332211"), enc.bytes());
        };
        "u128"_test = [] {
            borsh::encoder enc {};
            enc.u128(u128 { 1, 2 });
            test_same(uint8_vector::from_hex("0100000000000000" "0200000000000000"), enc.bytes());
            borsh::decoder dec { enc.bytes() };
            test_same(u128 { 1, 2 }, dec.u128());
            expect(dec.at_end());
        };
        "strings and bytes have u32 length prefixes"_test = [] {
            borsh::encoder enc {};
            enc.string("alice.near").bytes(uint8_vector::from_hex("DEAD"));
            test_same(uint8_vector::from_hex("0A000000616C6963652E6E656172" "02000000DEAD"), enc.bytes());
            borsh::decoder dec { enc.bytes() };
            test_same(std::string { "alice.near" }, dec.string());
            test_same(uint8_vector::from_hex("DEAD"), dec.bytes());
            expect(nothrow([&] { dec.ensure_end(); }));
        };
        "option and vec"_test = [] {
            borsh::encoder enc {};
            const std::vector<std::string> proofs { "a", "bc" };
            enc.option<uint64_t>(std::optional<uint64_t> { 7 }, [](auto &e, const auto &v) { e.u64(v); })
                .option<uint64_t>(std::optional<uint64_t> {}, [](auto &e, const auto &v) { e.u64(v); })
                .vec(proofs, [](auto &e, const auto &p) { e.string(p); });
            borsh::decoder dec { enc.bytes() };
            expect(dec.option());
            test_same(uint64_t { 7 }, dec.u64());
            expect(!dec.option());
            test_same(uint32_t { 2 }, dec.u32());
            test_same(std::string { "a" }, dec.string());
            test_same(std::string { "bc" }, dec.string());
            expect(dec.at_end());
        };
        "truncated input"_test = [] {
            const auto data = uint8_vector::from_hex("05000000616263");
            borsh::decoder dec { data };
            expect(throws<borsh::decode_error>([&] { dec.string(); }));
        };
        "invalid tags"_test = [] {
            const auto data = uint8_vector::from_hex("02");
            expect(throws<borsh::decode_error>([&] { borsh::decoder { data }.option(); }));
            expect(throws<borsh::decode_error>([&] { borsh::decoder { data }.boolean(); }));
        };
        "trailing bytes"_test = [] {
            const auto data = uint8_vector::from_hex("0100");
            borsh::decoder dec { data };
            dec.u8();
            expect(throws<borsh::decode_error>([&] { dec.ensure_end(); }));
        };
    };
};
