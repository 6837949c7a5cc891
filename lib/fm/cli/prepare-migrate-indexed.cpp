/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fm/cli/common.hpp>
#include <fm/migration/executor.hpp>

namespace ft_migrator::cli::prepare_migrate_indexed {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prepare-migrate-indexed";
            cmd.desc = "query the balances of the accounts in <checkpoint> and write a migration-ready state file";
            cmd.args.expect({ "<checkpoint>", "<output>" });
        }

        void run(const arguments &args, const options &) const override
        {
            const auto &cp_path = args.at(0);
            const auto &out_path = args.at(1);
            if (!std::filesystem::exists(cp_path))
                throw error("checkpoint {} does not exist", cp_path);
            const auto cp = ft_migrator::index::checkpoint::load(cp_path);
            const auto &cfg = configs_dir::get();
            common::chain_access chain { cfg };
            migration::executor ex { chain.client, migration::executor_settings::from_config(cfg.at("migration")) };
            const auto st = ex.prepare_indexed(cp);
            st.save(out_path);
            logger::info("saved the migration-ready state with {} accounts and {} proofs to {}", st.accounts.size(), st.proofs.size(), out_path);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
