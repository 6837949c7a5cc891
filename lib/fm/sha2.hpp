/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_SHA2_HPP
#define FT_MIGRATOR_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <fm/array.hpp>
#include <fm/ed25519.hpp>

namespace ft_migrator::sha2
{
    using hash_256 = byte_array<crypto_hash_sha256_BYTES>;

    inline void digest(const std::span<uint8_t> &out, const buffer &in)
    {
        if (out.size() != sizeof(hash_256))
            throw error("output size must be {} but got {}", sizeof(hash_256), out.size());
        ed25519::ensure_initialized();
        if (crypto_hash_sha256(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
    }

    inline hash_256 digest(const buffer &in)
    {
        hash_256 out;
        digest(out, in);
        return out;
    }
}

#endif // !FT_MIGRATOR_SHA2_HPP
