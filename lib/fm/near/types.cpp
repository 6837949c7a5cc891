/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/base58.hpp>
#include <fm/near/types.hpp>

namespace ft_migrator::near {
    static constexpr size_t account_id_min_size = 2;
    static constexpr size_t account_id_max_size = 64;

    static bool is_separator(const char c)
    {
        return c == '-' || c == '_' || c == '.';
    }

    bool valid_account_id(const std::string_view id)
    {
        if (id.size() < account_id_min_size || id.size() > account_id_max_size)
            return false;
        bool last_sep = true;
        for (const char c: id) {
            if (is_separator(c)) {
                // no leading and no consecutive separators
                if (last_sep)
                    return false;
                last_sep = true;
            } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                last_sep = false;
            } else {
                return false;
            }
        }
        return !last_sep;
    }

    void validate_account_id(const std::string_view id)
    {
        if (!valid_account_id(id))
            throw error("invalid account id: '{}'", id);
    }

    hash hash_from_base58(const std::string_view s)
    {
        const auto bytes = base58::decode(s);
        if (bytes.size() != sizeof(hash))
            throw error("a base58 hash must decode to {} bytes but got {}: {}", sizeof(hash), bytes.size(), s);
        return hash { bytes };
    }

    std::string hash_to_base58(const hash &h)
    {
        return base58::encode(h);
    }

    public_key public_key::from_string(const std::string_view s)
    {
        if (!s.starts_with(ed25519_prefix))
            throw error("only ed25519 public keys are supported but got: {}", s);
        const auto bytes = base58::decode(s.substr(ed25519_prefix.size()));
        if (bytes.size() != sizeof(ed25519::vkey))
            throw error("an ed25519 public key must have {} bytes but got {}", sizeof(ed25519::vkey), bytes.size());
        return { ed25519::vkey { bytes } };
    }

    std::string public_key::to_string() const
    {
        return fmt::format("{}{}", ed25519_prefix, base58::encode(key));
    }

    signer signer::from_secret(const std::string_view account_id, const std::string_view secret_key)
    {
        validate_account_id(account_id);
        if (!secret_key.starts_with(ed25519_prefix))
            throw error("only ed25519 secret keys are supported");
        auto bytes = base58::decode(secret_key.substr(ed25519_prefix.size()));
        if (bytes.size() != sizeof(ed25519::skey)) {
            secure_clear(bytes);
            throw error("an ed25519 secret key must have {} bytes but got {}", sizeof(ed25519::skey), bytes.size());
        }
        signer s { std::string { account_id }, ed25519::skey { bytes }, {} };
        secure_clear(bytes);
        s.pk.key = ed25519::extract_vk(s.sk);
        return s;
    }

    signer signer::from_seed(const std::string_view account_id, const buffer &seed)
    {
        validate_account_id(account_id);
        signer s { std::string { account_id }, ed25519::create_sk_from_seed(seed), {} };
        s.pk.key = ed25519::extract_vk(s.sk);
        return s;
    }

    ed25519::signature signer::sign(const buffer &msg) const
    {
        return ed25519::sign(msg, sk);
    }
}
