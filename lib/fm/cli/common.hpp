/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CLI_COMMON_HPP
#define FT_MIGRATOR_CLI_COMMON_HPP

#include <fm/cli.hpp>
#include <fm/chain/client.hpp>
#include <fm/near/rpc-node.hpp>

namespace ft_migrator::cli::common {
    // The node connection and the rate-limited client configured by node.json
    struct chain_access {
        explicit chain_access(const configs &cfg);

        near::rpc_node node;
        chain::client client;
    };

    // The account comes from --signer and the secret key from the FM_SECRET_KEY environment variable
    extern near::signer load_signer(const options &opts);
    extern void add_signer_opts(config &cmd);
    extern std::optional<uint64_t> uint_opt(const options &opts, const std::string &name);
}

#endif // !FT_MIGRATOR_CLI_COMMON_HPP
