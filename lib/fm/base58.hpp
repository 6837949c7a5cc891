/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_BASE58_HPP
#define FT_MIGRATOR_BASE58_HPP

#include <string>
#include <fm/common/bytes.hpp>

namespace ft_migrator::base58 {
    static constexpr std::string_view alphabet { "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz" };

    inline std::string encode(const buffer in)
    {
        size_t zeroes = 0;
        while (zeroes < in.size() && in[zeroes] == 0)
            ++zeroes;
        // log(256) / log(58), rounded up
        std::vector<uint8_t> b58((in.size() - zeroes) * 138 / 100 + 1);
        for (size_t i = zeroes; i < in.size(); ++i) {
            uint32_t carry = in[i];
            for (auto it = b58.rbegin(); it != b58.rend(); ++it) {
                carry += 256 * static_cast<uint32_t>(*it);
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
        }
        auto it = b58.begin();
        while (it != b58.end() && *it == 0)
            ++it;
        std::string out(zeroes, '1');
        out.reserve(zeroes + (b58.end() - it));
        for (; it != b58.end(); ++it)
            out += alphabet[*it];
        return out;
    }

    inline uint8_vector decode(const std::string_view in)
    {
        size_t pos = 0;
        size_t zeroes = 0;
        while (pos < in.size() && in[pos] == '1') {
            ++zeroes;
            ++pos;
        }
        // log(58) / log(256), rounded up
        std::vector<uint8_t> b256((in.size() - pos) * 733 / 1000 + 1);
        for (; pos < in.size(); ++pos) {
            const auto digit = alphabet.find(in[pos]);
            if (digit == std::string_view::npos)
                throw error("invalid base58 character '{}' at pos {} in {}", in[pos], pos, in);
            uint32_t carry = static_cast<uint32_t>(digit);
            for (auto it = b256.rbegin(); it != b256.rend(); ++it) {
                carry += 58 * static_cast<uint32_t>(*it);
                *it = static_cast<uint8_t>(carry % 256);
                carry /= 256;
            }
        }
        auto it = b256.begin();
        while (it != b256.end() && *it == 0)
            ++it;
        uint8_vector out(zeroes);
        out.insert(out.end(), it, b256.end());
        return out;
    }
}

#endif // !FT_MIGRATOR_BASE58_HPP
