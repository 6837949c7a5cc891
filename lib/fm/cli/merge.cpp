/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/cli.hpp>
#include <fm/migration/state.hpp>

namespace ft_migrator::cli::merge {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "merge";
            cmd.desc = "merge two migration-ready state files; the second one wins on conflicting balances";
            cmd.args.expect({ "<first>", "<second>", "<output>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto first = migration::state_data::load(args.at(0));
            const auto second = migration::state_data::load(args.at(1));
            const auto merged = migration::state_data::merge(first, second);
            merged.save(args.at(2));
            logger::info("merged state: accounts: {} proofs: {} saved to {}", merged.accounts.size(), merged.proofs.size(), args.at(2));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
