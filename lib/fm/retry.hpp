/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_RETRY_HPP
#define FT_MIGRATOR_RETRY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <thread>
#include <fm/logger.hpp>

namespace ft_migrator {
    // An operation that must not be skipped could not be completed
    struct fatal_error: error {
        using error::error;
    };

    struct retry_policy {
        using classifier = std::function<bool(const std::exception &)>;

        std::string name {};
        size_t max_attempts = 10;
        // Returns true for failures that a repeated attempt may not hit
        classifier retryable = [](const std::exception &) { return true; };
        std::chrono::milliseconds pause { 0 };
    };

    // Runs op(attempt_no) until it returns. Non-retryable failures and
    // exhausting max_attempts both end in fatal_error.
    template<typename F>
    auto with_retries(const retry_policy &policy, const F &op) -> decltype(op(size_t {}))
    {
        if (policy.max_attempts == 0)
            throw error("{}: the number of attempts must be positive", policy.name);
        for (size_t attempt = 1; ; ++attempt) {
            try {
                return op(attempt);
            } catch (const fatal_error &) {
                throw;
            } catch (const std::exception &ex) {
                if (!policy.retryable(ex))
                    throw fatal_error("{}: non-retryable failure at attempt {}: {}", policy.name, attempt, ex.what());
                if (attempt >= policy.max_attempts)
                    throw fatal_error("{}: failed {} times, the last error: {}", policy.name, attempt, ex.what());
                logger::warn("{}: attempt {}/{} failed: {}", policy.name, attempt, policy.max_attempts, ex.what());
            }
            if (policy.pause.count() > 0)
                std::this_thread::sleep_for(policy.pause);
        }
    }
}

#endif // !FT_MIGRATOR_RETRY_HPP
