/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <csignal>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <fm/cancellation.hpp>
#include <fm/logger.hpp>

namespace ft_migrator {
    bool cancellation::trigger(const std::string_view reason)
    {
        {
            mutex::scoped_lock lk { _mutex };
            if (_triggered.load(std::memory_order_relaxed))
                return false;
            _reason.emplace(reason);
            _triggered.store(true, std::memory_order_release);
        }
        _cv.notify_all();
        logger::info("shutdown requested: {}", reason);
        return true;
    }

    std::optional<std::string> cancellation::reason() const
    {
        mutex::scoped_lock lk { _mutex };
        return _reason;
    }

    bool cancellation::wait_for(const std::chrono::milliseconds duration) const
    {
        mutex::unique_lock lk { _mutex };
        return _cv.wait_for(lk, duration, [&] { return _triggered.load(std::memory_order_relaxed); });
    }

    void cancellation::wait() const
    {
        mutex::unique_lock lk { _mutex };
        _cv.wait(lk, [&] { return _triggered.load(std::memory_order_relaxed); });
    }

    struct shutdown_signal::impl {
        explicit impl(cancellation &cancel): _cancel { cancel }
        {
#ifndef _WIN32
            _signals.add(SIGHUP);
            _signals.add(SIGQUIT);
#endif
            _signals.async_wait([this](const boost::system::error_code &ec, const int sig) {
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted)
                        logger::error("shutdown signal wait failed: {}", ec.message());
                    return;
                }
                _cancel.trigger(fmt::format("signal {}", sig));
            });
            _worker = std::thread { [this] { _ioc.run(); } };
        }

        ~impl()
        {
            boost::system::error_code ec {};
            _signals.cancel(ec);
            if (ec)
                logger::warn("failed to cancel the signal wait: {}", ec.message());
            _ioc.stop();
            if (_worker.joinable())
                _worker.join();
        }
    private:
        cancellation &_cancel;
        boost::asio::io_context _ioc {};
        boost::asio::signal_set _signals { _ioc, SIGINT, SIGTERM };
        std::thread _worker {};
    };

    shutdown_signal::shutdown_signal(cancellation &cancel)
        : _impl { std::make_unique<impl>(cancel) }
    {
    }

    shutdown_signal::~shutdown_signal() =default;
}
