/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <filesystem>
#include <fm/cli.hpp>
#include <fm/file.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

namespace {
    struct sample_cmd: cli::command {
        void configure(cli::config &cmd) const override
        {
            cmd.name = "sample";
            cmd.desc = "a command used to check the argument parsing";
            cmd.args.expect({ "<input>", "[<output>]" });
            cmd.opts.try_emplace("blocks", "a number of blocks", std::optional<std::string> {}, cli::uint_option);
            cmd.opts.try_emplace("mode", "a mode", "fast");
            cmd.opts.try_emplace("full", "a flag");
        }

        void run(const cli::arguments &, const cli::options &) const override
        {
        }
    };

    cli::parse_result parse_sample(const cli::arguments &args)
    {
        sample_cmd c {};
        cli::config cfg {};
        c.configure(cfg);
        return c.parse(cfg, args);
    }
}

suite cli_suite = [] {
    "cli"_test = [] {
        "arguments and options"_test = [] {
            const auto pr = parse_sample({ "in.json", "--blocks=10", "out.bin", "--full" });
            test_same(cli::arguments { "in.json", "out.bin" }, pr.args);
            test_same(std::string { "10" }, *pr.opts.at("blocks"));
            expect(pr.opts.contains("full"));
            expect(!pr.opts.at("full"));
            test_same(std::string { "fast" }, *pr.opts.at("mode"));
        };
        "invalid input"_test = [] {
            expect(throws<error>([] { parse_sample({}); }));
            expect(throws<error>([] { parse_sample({ "a", "b", "c" }); }));
            expect(throws<error>([] { parse_sample({ "a", "--unknown" }); }));
            expect(throws<error>([] { parse_sample({ "a", "--full", "--full" }); }));
            expect(throws<error>([] { parse_sample({ "a", "--blocks=ten" }); }));
            expect(throws<error>([] { parse_sample({ "a", "--blocks" }); }));
        };
        "run reports failures with a non-zero status"_test = [] {
            struct failing_cmd: cli::command {
                void configure(cli::config &cmd) const override
                {
                    cmd.name = "fail";
                    cmd.desc = "always fails";
                }

                void run(const cli::arguments &, const cli::options &) const override
                {
                    throw error("expected failure");
                }
            };
            const cli::command::command_list cmds { std::make_shared<failing_cmd>(), std::make_shared<sample_cmd>() };
            const char *fail_argv[] = { "fm", "fail" };
            test_same(1, cli::run(2, fail_argv, cmds));
            const char *ok_argv[] = { "fm", "sample", "input.json" };
            test_same(0, cli::run(3, ok_argv, cmds));
            const char *unknown_argv[] = { "fm", "unknown" };
            test_same(1, cli::run(2, unknown_argv, cmds));
        };
        "prepare-migrate-indexed rejects a missing checkpoint"_test = [] {
            file::tmp cp_path { "cli-missing-checkpoint.bin" };
            file::tmp out_path { "cli-prepared-state.bin" };
            const char *argv[] = { "fm", "prepare-migrate-indexed", cp_path.path().c_str(), out_path.path().c_str() };
            test_same(1, cli::run(4, argv));
            expect(!std::filesystem::exists(out_path.path()));
        };
    };
};
