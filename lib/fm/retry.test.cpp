/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/retry.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

namespace {
    struct flaky_error: error {
        using error::error;
    };
}

suite retry_suite = [] {
    "retry"_test = [] {
        "first attempt succeeds"_test = [] {
            size_t calls = 0;
            const auto res = with_retries(retry_policy { "op" }, [&](const size_t attempt) {
                ++calls;
                return attempt * 10;
            });
            test_same(size_t { 10 }, res);
            test_same(size_t { 1 }, calls);
        };
        "succeeds after transient failures"_test = [] {
            size_t calls = 0;
            const auto res = with_retries(retry_policy { "op", 5 }, [&](const size_t attempt) {
                ++calls;
                if (attempt < 3)
                    throw flaky_error("attempt {} failed", attempt);
                return std::string { "ok" };
            });
            test_same(std::string { "ok" }, res);
            test_same(size_t { 3 }, calls);
        };
        "exhausted budget is fatal"_test = [] {
            size_t calls = 0;
            expect(throws<fatal_error>([&] {
                with_retries(retry_policy { "commit", 10 }, [&](const size_t) -> int {
                    ++calls;
                    throw flaky_error("node is down");
                });
            }));
            test_same(size_t { 10 }, calls);
        };
        "non-retryable failures stop immediately"_test = [] {
            size_t calls = 0;
            retry_policy policy { "commit", 10 };
            policy.retryable = [](const std::exception &ex) { return dynamic_cast<const flaky_error *>(&ex) != nullptr; };
            expect(throws<fatal_error>([&] {
                with_retries(policy, [&](const size_t) -> int {
                    ++calls;
                    throw error("bad signing key");
                });
            }));
            test_same(size_t { 1 }, calls);
        };
        "zero attempts are rejected"_test = [] {
            expect(throws<error>([] { with_retries(retry_policy { "op", 0 }, [](const size_t) { return 1; }); }));
        };
    };
};
