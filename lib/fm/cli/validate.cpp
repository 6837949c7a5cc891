/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iostream>
#include <fm/cli/common.hpp>
#include <fm/migration/executor.hpp>

namespace ft_migrator::cli::validate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validate";
            cmd.desc = "check an already migrated target contract against <state-file> without committing anything";
            cmd.args.expect({ "<state-file>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto st = migration::state_data::load(args.at(0));
            const auto &cfg = configs_dir::get();
            common::chain_access chain { cfg };
            migration::executor ex { chain.client, migration::executor_settings::from_config(cfg.at("migration")) };
            std::cout << migration::describe(ex.validate(st));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
