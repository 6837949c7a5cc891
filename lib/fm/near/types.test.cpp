/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/base58.hpp>
#include <fm/near/types.hpp>
#include <fm/sha2.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite near_types_suite = [] {
    "near::types"_test = [] {
        "valid account ids"_test = [] {
            for (const auto id: { "aurora", "alice.near", "relay_aurora.near", "a-b.c_d", "ab",
                    "0x1234567890abcdef.aurora", "98793cd91a3f870fb126f66285808c7e094afcfc4eda8a970f6648cdf0dbd6de" }) {
                expect(near::valid_account_id(id)) << id;
            }
        };
        "invalid account ids"_test = [] {
            for (const auto id: { "", "a", "Alice.near", ".near", "near.", "a..b", "a-.b", "a b", "a@b",
                    "this-account-id-is-way-too-long-to-be-accepted-by-the-protocol-rules.near" }) {
                expect(!near::valid_account_id(id)) << id;
            }
            expect(throws<error>([] { near::validate_account_id("BAD"); }));
        };
        "hash base58"_test = [] {
            const auto h = sha2::digest(std::string_view { "block" });
            const near::hash nh { buffer { h } };
            test_same(nh, near::hash_from_base58(near::hash_to_base58(nh)));
            expect(throws<error>([] { near::hash_from_base58("2g"); }));
        };
        "signer from secret"_test = [] {
            const auto seed = sha2::digest(std::string_view { "signer" });
            const auto ref = near::signer::from_seed("migrator.near", seed);
            const auto secret = fmt::format("ed25519:{}", base58::encode(ref.sk));
            const auto s = near::signer::from_secret("migrator.near", secret);
            expect(s.pk == ref.pk);
            const auto sig = s.sign(std::string_view { "payload" });
            expect(ed25519::verify(sig, s.pk.key, std::string_view { "payload" }));
            test_same(s.pk, near::public_key::from_string(s.pk.to_string()));
        };
        "signer rejects malformed credentials"_test = [] {
            expect(throws<error>([] { near::signer::from_secret("migrator.near", "secp256k1:abc"); }));
            expect(throws<error>([] { near::signer::from_secret("migrator.near", "ed25519:2g"); }));
            expect(throws<error>([] { near::signer::from_secret("Bad Account", "ed25519:2g"); }));
        };
    };
};
