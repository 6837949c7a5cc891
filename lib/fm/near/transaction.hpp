/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_NEAR_TRANSACTION_HPP
#define FT_MIGRATOR_NEAR_TRANSACTION_HPP

#include <vector>
#include <fm/near/types.hpp>
#include <fm/uint128.hpp>

namespace ft_migrator::near {
    // 300 TGas, the maximum a single function call may attach
    static constexpr uint64_t max_gas = 300'000'000'000'000ULL;

    struct function_call_action {
        std::string method {};
        uint8_vector args {};
        uint64_t gas = max_gas;
        u128 deposit {};
    };

    struct transaction {
        std::string signer_id {};
        public_key pk {};
        uint64_t nonce = 0;
        std::string receiver_id {};
        hash block_hash {};
        std::vector<function_call_action> actions {};

        uint8_vector encode() const;
        hash digest() const;
    };

    struct signed_transaction {
        hash tx_hash {};
        uint8_vector bytes {};
    };

    extern signed_transaction sign(const transaction &tx, const signer &s);
}

#endif // !FT_MIGRATOR_NEAR_TRANSACTION_HPP
