/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/logger.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            logger::trace("OK - {}", "trace");
            logger::debug("OK - {}", "debug");
            logger::info("OK - {}", "info");
            logger::warn("OK - {}", "warn");
            expect(true);
        };
        "last_error"_test = [] {
            logger::reset_last_error();
            expect(!logger::last_error());
            logger::error("block {} could not be fetched", 7);
            const auto err = logger::last_error();
            expect(static_cast<bool>(err));
            if (err)
                test_same(std::string { "block 7 could not be fetched" }, *err);
            logger::reset_last_error();
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            size_t num_cleanups = 0;
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); }, [&] { ++num_cleanups; });
            expect(static_cast<bool>(ex2));
            test_same(size_t { 1 }, num_cleanups);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws([] { logger::run_log_errors_rethrow([] { throw error("Something bad!"); }); }));
        };
    };
};
