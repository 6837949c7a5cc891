/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CHAIN_CALL_HPP
#define FT_MIGRATOR_CHAIN_CALL_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <fm/array.hpp>
#include <fm/uint128.hpp>

namespace ft_migrator::chain::call {
    struct ft_transfer {
        static constexpr std::string_view method { "ft_transfer" };

        std::string receiver_id {};
        u128 amount {};
        std::optional<std::string> memo {};
    };

    struct ft_transfer_call {
        static constexpr std::string_view method { "ft_transfer_call" };

        std::string receiver_id {};
        u128 amount {};
        std::optional<std::string> memo {};
        std::string msg {};
    };

    struct withdraw {
        static constexpr std::string_view method { "withdraw" };

        byte_array<20> recipient_address {};
        u128 amount {};
    };

    struct finish_deposit {
        static constexpr std::string_view method { "finish_deposit" };

        std::string new_owner_id {};
        u128 amount {};
        std::string proof_key {};
        std::string relayer_id {};
        u128 fee {};
        std::optional<uint8_vector> msg {};
    };

    struct deposit {
        static constexpr std::string_view method { "deposit" };

        uint64_t log_index = 0;
        uint8_vector log_entry_data {};
        uint64_t receipt_index = 0;
        uint8_vector receipt_data {};
        uint8_vector header_data {};
        std::vector<uint8_vector> proof {};

        // the identifier under which the bridge marks the deposit as used
        std::string proof_key() const;
    };

    struct ignored {
        std::string method {};
    };

    using value = std::variant<ft_transfer, ft_transfer_call, withdraw, finish_deposit, deposit, ignored>;

    struct effect {
        std::vector<std::string> accounts {};
        std::optional<std::string> proof {};

        bool empty() const noexcept
        {
            return accounts.empty() && !proof;
        }
    };

    extern bool recognized(std::string_view method);
    // Throws on malformed arguments of a recognized method
    extern value decode(std::string_view method, buffer args);
    extern effect effect_of(const value &v);
    // Never throws: malformed arguments produce an empty effect and a warning
    extern effect parse(std::string_view method, buffer args);
}

#endif // !FT_MIGRATOR_CHAIN_CALL_HPP
