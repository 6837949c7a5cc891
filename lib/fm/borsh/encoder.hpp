/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_BORSH_ENCODER_HPP
#define FT_MIGRATOR_BORSH_ENCODER_HPP

#include <functional>
#include <limits>
#include <optional>
#include <type_traits>
#include <fm/common/bytes.hpp>
#include <fm/uint128.hpp>

namespace ft_migrator::borsh {
    // Little-endian integers, u32 length prefixes, u8 tags for enums and options
    struct encoder {
        encoder &u8(const uint8_t val)
        {
            _buf.emplace_back(val);
            return *this;
        }

        encoder &u32(const uint32_t val)
        {
            _encode_le(val, sizeof(val));
            return *this;
        }

        encoder &u64(const uint64_t val)
        {
            _encode_le(val, sizeof(val));
            return *this;
        }

        encoder &u128(const ft_migrator::u128 &val)
        {
            _encode_le(val.lo, sizeof(val.lo));
            _encode_le(val.hi, sizeof(val.hi));
            return *this;
        }

        encoder &boolean(const bool val)
        {
            return u8(val ? 1 : 0);
        }

        encoder &len(const size_t sz)
        {
            if (sz > std::numeric_limits<uint32_t>::max())
                throw error("borsh length {} does not fit into u32", sz);
            return u32(static_cast<uint32_t>(sz));
        }

        encoder &string(const std::string_view sv)
        {
            len(sv.size());
            _buf << buffer { sv };
            return *this;
        }

        // variable-length byte sequence with a u32 length prefix
        encoder &bytes(const buffer buf)
        {
            len(buf.size());
            _buf << buf;
            return *this;
        }

        // fixed-length byte array without a prefix
        encoder &fixed(const buffer buf)
        {
            _buf << buf;
            return *this;
        }

        encoder &none()
        {
            return u8(0);
        }

        template<typename T>
        encoder &option(const std::optional<T> &val, const std::function<void(encoder &, const std::type_identity_t<T> &)> &enc)
        {
            if (!val)
                return none();
            u8(1);
            enc(*this, *val);
            return *this;
        }

        template<typename C>
        encoder &vec(const C &items, const std::function<void(encoder &, const typename C::value_type &)> &enc)
        {
            len(items.size());
            for (const auto &item: items)
                enc(*this, item);
            return *this;
        }

        [[nodiscard]] uint8_vector &bytes()
        {
            return _buf;
        }

        [[nodiscard]] const uint8_vector &bytes() const
        {
            return _buf;
        }
    private:
        uint8_vector _buf {};

        void _encode_le(const uint64_t val, const size_t num_bytes)
        {
            for (size_t i = 0; i < num_bytes; ++i)
                _buf.emplace_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
        }
    };
}

#endif // !FT_MIGRATOR_BORSH_ENCODER_HPP
