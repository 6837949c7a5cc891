/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_MIGRATION_ABI_HPP
#define FT_MIGRATOR_MIGRATION_ABI_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <fm/common/bytes.hpp>
#include <fm/uint128.hpp>

namespace ft_migrator::migration {
    using account_balance = std::pair<std::string, u128>;
    using account_balance_list = std::vector<account_balance>;

    // The argument of both the migrate and the check entry points of the target contract
    struct input_data {
        account_balance_list accounts {};
        std::optional<u128> total_supply {};
        std::optional<uint64_t> account_storage_usage {};
        std::optional<uint64_t> statistics_aurora_accounts_counter {};
        std::vector<std::string> used_proofs {};

        static input_data decode(buffer bytes);
        uint8_vector encode() const;
        bool operator==(const input_data &o) const =default;
    };

    namespace check {
        struct success {
            bool operator==(const success &) const =default;
        };

        struct account_not_exist {
            std::vector<std::string> accounts {};
            bool operator==(const account_not_exist &) const =default;
        };

        // reports the balances the target contract actually holds
        struct account_amount {
            account_balance_list accounts {};
            bool operator==(const account_amount &) const =default;
        };

        struct total_supply {
            u128 value {};
            bool operator==(const total_supply &) const =default;
        };

        struct storage_usage {
            uint64_t value = 0;
            bool operator==(const storage_usage &) const =default;
        };

        struct statistics_counter {
            uint64_t value = 0;
            bool operator==(const statistics_counter &) const =default;
        };

        struct proof {
            std::vector<std::string> proofs {};
            bool operator==(const proof &) const =default;
        };
    }

    using check_result = std::variant<check::success, check::account_not_exist, check::account_amount,
        check::total_supply, check::storage_usage, check::statistics_counter, check::proof>;

    extern check_result decode_check_result(buffer bytes);
    extern uint8_vector encode(const check_result &res);
    // The number of missing or mismatched items a result reports
    extern size_t mismatch_count(const check_result &res);
    extern std::string describe(const check_result &res);
}

#endif // !FT_MIGRATOR_MIGRATION_ABI_HPP
