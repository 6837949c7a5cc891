/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/cancellation.hpp>
#include <fm/cli/common.hpp>
#include <fm/index/indexer.hpp>

namespace ft_migrator::cli::index {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "index";
            cmd.desc = "scan the chain for the accounts and proofs of the tracked contract and keep them in <checkpoint>";
            cmd.args.expect({ "<checkpoint>" });
            cmd.opts.try_emplace("start", "the height to start or restart the scan from", std::optional<std::string> {}, uint_option);
            cmd.opts.try_emplace("blocks", "stop after handling this number of heights", std::optional<std::string> {}, uint_option);
            cmd.opts.try_emplace("retry-missed", "fetch the heights that failed previously before scanning");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto &cfg = configs_dir::get();
            common::chain_access chain { cfg };
            const auto settings = ft_migrator::index::indexer_settings::from_config(cfg.at("indexer"));
            ft_migrator::index::indexer idx { chain.client, path, settings, common::uint_opt(opts, "start") };
            cancellation cancel {};
            shutdown_signal sig { cancel };
            if (opts.contains("retry-missed"))
                idx.retry_missed();
            if (const auto num_blocks = common::uint_opt(opts, "blocks"); num_blocks)
                idx.run_n_blocks(*num_blocks, &cancel);
            else
                idx.run(cancel);
            if (const auto reason = cancel.reason(); reason)
                logger::info("stopped by {}", *reason);
            logger::info("{}", idx.stats());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
