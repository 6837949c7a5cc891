/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_HTTP_CLIENT_HPP
#define FT_MIGRATOR_HTTP_CLIENT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <fm/common/error.hpp>
#include <fm/common/format.hpp>

namespace ft_migrator::http {
    struct error: ft_migrator::error {
        template<typename... Args>
        explicit error(const bool timeout, const std::optional<unsigned> status, const std::string_view fmt, Args&&... a):
            ft_migrator::error { std::string_view { fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...) } },
            _timeout { timeout }, _status { status }
        {
        }

        bool timeout() const noexcept
        {
            return _timeout;
        }

        const std::optional<unsigned> &status() const noexcept
        {
            return _status;
        }
    private:
        bool _timeout;
        std::optional<unsigned> _status;
    };

    // A synchronous client issuing one request at a time; supports http and https urls
    struct client {
        explicit client(const std::string &url, std::chrono::seconds timeout=std::chrono::seconds { 30 });
        ~client();
        std::string post(const std::string &content_type, const std::string &body);
        const std::string &url() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !FT_MIGRATOR_HTTP_CLIENT_HPP
