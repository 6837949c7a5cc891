/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <csignal>
#include <thread>
#include <fm/cancellation.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;
using namespace std::chrono_literals;

suite cancellation_suite = [] {
    "cancellation"_test = [] {
        "trigger once"_test = [] {
            cancellation c {};
            expect(!c.triggered());
            expect(!c.reason());
            expect(c.trigger("first"));
            expect(!c.trigger("second"));
            expect(c.triggered());
            test_same(std::string { "first" }, *c.reason());
        };
        "wait_for times out"_test = [] {
            cancellation c {};
            const auto start = std::chrono::steady_clock::now();
            expect(!c.wait_for(20ms));
            expect(std::chrono::steady_clock::now() - start >= 20ms);
        };
        "wait_for wakes up early"_test = [] {
            cancellation c {};
            std::thread t { [&] {
                std::this_thread::sleep_for(10ms);
                c.trigger("test");
            } };
            const auto start = std::chrono::steady_clock::now();
            expect(c.wait_for(10s));
            expect(std::chrono::steady_clock::now() - start < 5s);
            t.join();
        };
        "shutdown_signal"_test = [] {
            cancellation c {};
            {
                shutdown_signal sig { c };
                std::raise(SIGTERM);
                expect(c.wait_for(5s));
            }
            expect(c.reason()->starts_with("signal ")) << *c.reason();
        };
    };
};
