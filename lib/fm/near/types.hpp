/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_NEAR_TYPES_HPP
#define FT_MIGRATOR_NEAR_TYPES_HPP

#include <string>
#include <fm/array.hpp>
#include <fm/ed25519.hpp>

namespace ft_migrator::near {
    using hash = byte_array<32>;

    static constexpr std::string_view ed25519_prefix { "ed25519:" };

    extern bool valid_account_id(std::string_view id);
    extern void validate_account_id(std::string_view id);
    extern hash hash_from_base58(std::string_view s);
    extern std::string hash_to_base58(const hash &h);

    struct public_key {
        ed25519::vkey key {};

        static public_key from_string(std::string_view s);
        std::string to_string() const;
        bool operator==(const public_key &o) const =default;
    };

    // the single signing credential the tool holds: an account and one of its full-access keys
    struct signer {
        std::string account_id;
        ed25519::skey sk;
        public_key pk;

        static signer from_secret(std::string_view account_id, std::string_view secret_key);
        static signer from_seed(std::string_view account_id, const buffer &seed);
        ed25519::signature sign(const buffer &msg) const;
    };
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::near::public_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !FT_MIGRATOR_NEAR_TYPES_HPP
