/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/borsh/encoder.hpp>
#include <fm/near/transaction.hpp>
#include <fm/sha2.hpp>

namespace ft_migrator::near {
    enum class key_type: uint8_t {
        ed25519 = 0
    };

    enum class action_type: uint8_t {
        create_account = 0,
        deploy_contract = 1,
        function_call = 2
    };

    uint8_vector transaction::encode() const
    {
        borsh::encoder enc {};
        enc.string(signer_id)
            .u8(static_cast<uint8_t>(key_type::ed25519)).fixed(pk.key)
            .u64(nonce)
            .string(receiver_id)
            .fixed(block_hash)
            .len(actions.size());
        for (const auto &act: actions) {
            enc.u8(static_cast<uint8_t>(action_type::function_call))
                .string(act.method)
                .bytes(act.args)
                .u64(act.gas)
                .u128(act.deposit);
        }
        return std::move(enc.bytes());
    }

    hash transaction::digest() const
    {
        return hash { buffer { sha2::digest(encode()) } };
    }

    signed_transaction sign(const transaction &tx, const signer &s)
    {
        if (tx.pk != s.pk)
            throw error("transaction public key {} does not match the signer's {}", tx.pk, s.pk);
        const auto tx_bytes = tx.encode();
        const hash tx_hash { buffer { sha2::digest(tx_bytes) } };
        const auto sig = s.sign(tx_hash);
        borsh::encoder enc {};
        enc.fixed(tx_bytes)
            .u8(static_cast<uint8_t>(key_type::ed25519)).fixed(sig);
        return { tx_hash, std::move(enc.bytes()) };
    }
}
