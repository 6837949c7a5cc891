/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_CANCELLATION_HPP
#define FT_MIGRATOR_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <optional>
#include <string>
#include <fm/mutex.hpp>

namespace ft_migrator {
    // A one-shot stop notification shared by long-running loops
    struct cancellation {
        // Returns true only for the call that switched the state
        bool trigger(std::string_view reason);

        bool triggered() const noexcept
        {
            return _triggered.load(std::memory_order_acquire);
        }

        std::optional<std::string> reason() const;

        // Sleeps up to the given duration and wakes up early once triggered.
        // Returns the triggered state at wake-up.
        bool wait_for(std::chrono::milliseconds duration) const;
        void wait() const;
    private:
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        mutable std::condition_variable _cv {};
        std::atomic_bool _triggered { false };
        std::optional<std::string> _reason {};
    };

    // Funnels SIGINT, SIGTERM, SIGHUP and SIGQUIT into a cancellation
    struct shutdown_signal {
        explicit shutdown_signal(cancellation &cancel);
        ~shutdown_signal();

        shutdown_signal(const shutdown_signal &) =delete;
        shutdown_signal &operator=(const shutdown_signal &) =delete;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !FT_MIGRATOR_CANCELLATION_HPP
