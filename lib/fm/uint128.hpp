/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_UINT128_HPP
#define FT_MIGRATOR_UINT128_HPP

#include <compare>
#include <cstdint>
#include <string>
#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <boost/multiprecision/cpp_int.hpp>
#include <fm/common/error.hpp>
#include <fm/common/format.hpp>

namespace ft_migrator {
    using boost::multiprecision::uint128_t;

    // Token amounts: an unsigned 128-bit integer stored as two 64-bit halves
    struct u128 {
        uint64_t lo = 0;
        uint64_t hi = 0;

        constexpr static auto serialize(auto &archive, auto &self)
        {
            return archive(self.lo, self.hi);
        }

        static u128 from_big(const uint128_t &v)
        {
            return { static_cast<uint64_t>(v & std::numeric_limits<uint64_t>::max()), static_cast<uint64_t>(v >> 64) };
        }

        static u128 from_string(const std::string_view s)
        {
            if (s.empty())
                throw error("an empty string is not a valid u128 amount");
            static const uint128_t max_div_10 = std::numeric_limits<uint128_t>::max() / 10;
            uint128_t v = 0;
            for (const char c: s) {
                if (c < '0' || c > '9')
                    throw error("invalid u128 amount: '{}'", s);
                const unsigned digit = c - '0';
                if (v > max_div_10)
                    throw error("u128 amount overflow: '{}'", s);
                v *= 10;
                if (v > std::numeric_limits<uint128_t>::max() - digit)
                    throw error("u128 amount overflow: '{}'", s);
                v += digit;
            }
            return from_big(v);
        }

        uint128_t big() const
        {
            uint128_t v = hi;
            v <<= 64;
            v |= lo;
            return v;
        }

        std::string to_string() const
        {
            return big().str();
        }

        u128 checked_add(const u128 &o) const
        {
            const auto a = big();
            const auto sum = a + o.big();
            if (sum < a)
                throw error("u128 addition overflow: {} + {}", to_string(), o.to_string());
            return from_big(sum);
        }

        std::strong_ordering operator<=>(const u128 &o) const noexcept
        {
            if (const auto cmp = hi <=> o.hi; cmp != std::strong_ordering::equal)
                return cmp;
            return lo <=> o.lo;
        }

        bool operator==(const u128 &o) const noexcept =default;
    };
}

namespace fmt {
    template<>
    struct formatter<ft_migrator::u128>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !FT_MIGRATOR_UINT128_HPP
