/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/cli.hpp>
#include <fm/snapshot/decoder.hpp>

namespace ft_migrator::cli::parse_snapshot {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parse-snapshot";
            cmd.desc = "decode a contract storage export into a migration-ready state file";
            cmd.args.expect({ "<export-json>", "[<output>]" });
        }

        void run(const arguments &args, const options &) const override
        {
            std::optional<std::string> out_path {};
            if (args.size() > 1)
                out_path = args.at(1);
            snapshot::convert(args.at(0), out_path);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
