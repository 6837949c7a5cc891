/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <fm/cli/common.hpp>
#include <fm/migration/executor.hpp>

namespace ft_migrator::cli::migrate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "migrate";
            cmd.desc = "commit the state in <state-file> to the target contract in batches and verify every batch";
            cmd.args.expect({ "<state-file>" });
            common::add_signer_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto st = migration::state_data::load(args.at(0));
            const auto signer = common::load_signer(opts);
            const auto &cfg = configs_dir::get();
            common::chain_access chain { cfg };
            migration::executor ex { chain.client, migration::executor_settings::from_config(cfg.at("migration")) };
            const auto rep = ex.migrate(signer, st);
            std::cout << migration::describe(rep);
            if (!rep.ok())
                logger::warn("{} of {} batches failed verification", rep.items.size() - rep.num_success(), rep.items.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
