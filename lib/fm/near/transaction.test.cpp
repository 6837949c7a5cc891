/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/decoder.hpp>
#include <fm/near/transaction.hpp>
#include <fm/sha2.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite near_transaction_suite = [] {
    "near::transaction"_test = [] {
        const auto signer = near::signer::from_seed("migrator.near", sha2::digest(std::string_view { "migrator" }));
        near::transaction tx {
            .signer_id = signer.account_id,
            .pk = signer.pk,
            .nonce = 42,
            .receiver_id = "aurora",
            .block_hash = near::hash { buffer { sha2::digest(std::string_view { "block" }) } },
            .actions = { near::function_call_action { .method = "migrate", .args = uint8_vector::from_hex("0102") } }
        };
        "borsh layout"_test = [&] {
            const auto bytes = tx.encode();
            borsh::decoder dec { bytes };
            test_same(std::string { "migrator.near" }, dec.string());
            test_same(uint8_t { 0 }, dec.u8());
            test_same(buffer { signer.pk.key }, dec.fixed(32));
            test_same(uint64_t { 42 }, dec.u64());
            test_same(std::string { "aurora" }, dec.string());
            test_same(buffer { tx.block_hash }, dec.fixed(32));
            test_same(uint32_t { 1 }, dec.u32());
            test_same(uint8_t { 2 }, dec.u8());
            test_same(std::string { "migrate" }, dec.string());
            test_same(uint8_vector::from_hex("0102"), dec.bytes());
            test_same(near::max_gas, dec.u64());
            test_same(u128 {}, dec.u128());
            expect(dec.at_end());
        };
        "signature covers the transaction hash"_test = [&] {
            const auto signed_tx = near::sign(tx, signer);
            test_same(tx.digest(), signed_tx.tx_hash);
            const auto tx_bytes = tx.encode();
            test_same(tx_bytes.size() + 1 + 64, signed_tx.bytes.size());
            const buffer sig = buffer { signed_tx.bytes }.subbuf(tx_bytes.size() + 1);
            expect(ed25519::verify(sig, signer.pk.key, signed_tx.tx_hash));
        };
        "foreign key is rejected"_test = [&] {
            const auto other = near::signer::from_seed("other.near", sha2::digest(std::string_view { "other" }));
            expect(throws<error>([&] { near::sign(tx, other); }));
        };
    };
};
