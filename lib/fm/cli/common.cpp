/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <cstdlib>
#include <fm/cli/common.hpp>

namespace ft_migrator::cli::common {
    namespace {
        near::rpc_node make_node(const ft_migrator::config &node_cfg)
        {
            const auto &obj = node_cfg.json();
            const auto url = json::string_or(obj, "rpcUrl", "");
            if (url.empty())
                throw error("node.rpcUrl must be configured");
            return near::rpc_node { url, std::chrono::seconds { json::uint_or(obj, "httpTimeoutSecs", 30) } };
        }
    }

    chain_access::chain_access(const configs &cfg):
        node { make_node(cfg.at("node")) }, client { node, chain::client_settings::from_config(cfg.at("node")) }
    {
        logger::info("node: {} request delay: {} ms", json::string_or(cfg.at("node").json(), "rpcUrl", ""), client.settings().request_delay.count());
    }

    void add_signer_opts(config &cmd)
    {
        cmd.opts.try_emplace("signer", "the account that signs the migration transactions");
    }

    near::signer load_signer(const options &opts)
    {
        const auto it = opts.find("signer");
        if (it == opts.end() || !it->second || it->second->empty())
            throw error("the --signer option is required");
        const auto *secret = std::getenv("FM_SECRET_KEY");
        if (!secret || !*secret)
            throw error("the FM_SECRET_KEY environment variable must contain the ed25519 secret key of {}", *it->second);
        auto s = near::signer::from_secret(*it->second, secret);
        logger::info("signer: {} public key: {}", s.account_id, s.pk);
        return s;
    }

    std::optional<uint64_t> uint_opt(const options &opts, const std::string &name)
    {
        if (const auto it = opts.find(name); it != opts.end() && it->second)
            return std::stoull(*it->second);
        return {};
    }
}
