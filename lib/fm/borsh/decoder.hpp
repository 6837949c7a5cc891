/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_BORSH_DECODER_HPP
#define FT_MIGRATOR_BORSH_DECODER_HPP

#include <optional>
#include <string>
#include <fm/common/bytes.hpp>
#include <fm/uint128.hpp>

namespace ft_migrator::borsh {
    struct decode_error: error {
        using error::error;
    };

    struct decoder {
        explicit decoder(const buffer data): _data { data }
        {
        }

        uint8_t u8()
        {
            return _take(1)[0];
        }

        uint32_t u32()
        {
            return static_cast<uint32_t>(_decode_le(4));
        }

        uint64_t u64()
        {
            return _decode_le(8);
        }

        ft_migrator::u128 u128()
        {
            const auto lo = _decode_le(8);
            const auto hi = _decode_le(8);
            return { lo, hi };
        }

        bool boolean()
        {
            switch (const auto tag = u8(); tag) {
                case 0: return false;
                case 1: return true;
                default: throw decode_error("invalid boolean tag {} at offset {}", tag, _pos - 1);
            }
        }

        std::string string()
        {
            const auto sz = u32();
            return std::string { static_cast<std::string_view>(_take(sz)) };
        }

        uint8_vector bytes()
        {
            const auto sz = u32();
            return uint8_vector { _take(sz) };
        }

        buffer fixed(const size_t sz)
        {
            return _take(sz);
        }

        // returns true when the option holds a value
        bool option()
        {
            switch (const auto tag = u8(); tag) {
                case 0: return false;
                case 1: return true;
                default: throw decode_error("invalid option tag {} at offset {}", tag, _pos - 1);
            }
        }

        size_t remaining() const noexcept
        {
            return _data.size() - _pos;
        }

        bool at_end() const noexcept
        {
            return _pos == _data.size();
        }

        void ensure_end() const
        {
            if (!at_end())
                throw decode_error("{} unexpected trailing bytes after a borsh value", remaining());
        }
    private:
        buffer _data;
        size_t _pos = 0;

        buffer _take(const size_t sz)
        {
            if (sz > remaining())
                throw decode_error("borsh value needs {} bytes at offset {} but only {} remain", sz, _pos, remaining());
            const auto res = _data.subbuf(_pos, sz);
            _pos += sz;
            return res;
        }

        uint64_t _decode_le(const size_t num_bytes)
        {
            const auto bytes = _take(num_bytes);
            uint64_t val = 0;
            for (size_t i = 0; i < num_bytes; ++i)
                val |= static_cast<uint64_t>(bytes[i]) << (i * 8);
            return val;
        }
    };
}

#endif // !FT_MIGRATOR_BORSH_DECODER_HPP
