/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_BASE64_HPP
#define FT_MIGRATOR_BASE64_HPP

#include <array>
#include <cstdint>
#include <string>
#include <fm/common/bytes.hpp>

namespace ft_migrator::base64 {
    using code_set = std::array<signed char, 128>;

    // Padded input only: the length must be a multiple of 4 and the unused bits of the last symbol must be zero
    inline uint8_vector decode_explicit(const std::string_view &in, const code_set &codes)
    {
        if (in.size() % 4 != 0)
            throw error("base64 input length must be a multiple of 4 but got {}: {}", in.size(), in);
        size_t data_size = in.size();
        while (data_size > 0 && in.size() - data_size < 2 && in[data_size - 1] == '=')
            --data_size;
        uint8_vector out {};
        out.reserve(data_size * 3 / 4);
        uint32_t val = 0;
        int valb = -8;
        for (size_t pos = 0; pos < data_size; ++pos) {
            signed char c = in[pos];
            if (c < 0 || codes[c] == -1) throw error("unsupported encoding character: '0x{:x}' at pos {} in {}!", static_cast<int>(c), pos, in);
            val = (val << 6) + codes[c];
            valb += 6;
            if (valb >= 0) {
                out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
                valb -= 8;
            }
        }
        if (valb > -8 && (val & ((1U << (valb + 8)) - 1)) != 0)
            throw error("non-zero trailing bits in base64 input: {}", in);
        return out;
    }

    inline uint8_vector decode(const std::string_view &in)
    {
        static const code_set codes {
            /* 0x00 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x10 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x20 */ -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  -1,  62,  -1,  -1,  -1,  63,
            /* 0x30 */ 52,  53,  54,  55,  56,  57,  58,  59,  60,  61,  -1,  -1,  -1,  -1,  -1,  -1,
            /* 0x40 */ -1,   0,   1,   2,   3,   4,   5,   6,   7,   8,   9,  10,  11,  12,  13,  14,
            /* 0x50 */ 15,  16,  17,  18,  19,  20,  21,  22,  23,  24,  25,  -1,  -1,  -1,  -1,  -1,
            /* 0x60 */ -1,  26,  27,  28,  29,  30,  31,  32,  33,  34,  35,  36,  37,  38,  39,  40,
            /* 0x70 */ 41,  42,  43,  44,  45,  46,  47,  48,  49,  50,  51,  -1,  -1,  -1,  -1,  -1
        };
        return decode_explicit(in, codes);
    }

    // Standard alphabet with padding
    inline std::string encode(const buffer in)
    {
        static constexpr std::string_view alphabet { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
        std::string out {};
        out.reserve((in.size() + 2) / 3 * 4);
        size_t i = 0;
        for (; i + 3 <= in.size(); i += 3) {
            const uint32_t v = (static_cast<uint32_t>(in[i]) << 16) | (static_cast<uint32_t>(in[i + 1]) << 8) | in[i + 2];
            out += alphabet[(v >> 18) & 0x3F];
            out += alphabet[(v >> 12) & 0x3F];
            out += alphabet[(v >> 6) & 0x3F];
            out += alphabet[v & 0x3F];
        }
        switch (in.size() - i) {
            case 1: {
                const uint32_t v = static_cast<uint32_t>(in[i]) << 16;
                out += alphabet[(v >> 18) & 0x3F];
                out += alphabet[(v >> 12) & 0x3F];
                out += "==";
                break;
            }
            case 2: {
                const uint32_t v = (static_cast<uint32_t>(in[i]) << 16) | (static_cast<uint32_t>(in[i + 1]) << 8);
                out += alphabet[(v >> 18) & 0x3F];
                out += alphabet[(v >> 12) & 0x3F];
                out += alphabet[(v >> 6) & 0x3F];
                out += '=';
                break;
            }
            default:
                break;
        }
        return out;
    }
}

#endif // !FT_MIGRATOR_BASE64_HPP
