/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <iostream>
#include <fm/cli.hpp>
#include <fm/index/checkpoint.hpp>

namespace ft_migrator::cli::index_stat {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "index-stat";
            cmd.desc = "print the statistics of the index in <checkpoint>";
            cmd.args.expect({ "<checkpoint>" });
            cmd.opts.try_emplace("full", "also list every account, proof, missed height and log record");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            if (!std::filesystem::exists(path))
                throw error("checkpoint {} does not exist", path);
            const auto cp = ft_migrator::index::checkpoint::load(path);
            std::cout << ft_migrator::index::stats(cp, opts.contains("full"));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
