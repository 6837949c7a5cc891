/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_COMMON_ERROR_HPP
#define FT_MIGRATOR_COMMON_ERROR_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace ft_migrator {
    struct base_error: std::exception {
        static constexpr size_t stacktrace_depth = 0x20;

        explicit base_error(std::string_view msg);
        const char *what() const noexcept override;
        std::string stacktrace() const;
    private:
        std::string _msg;
        std::array<std::byte, sizeof(void*) * stacktrace_depth> _trace {};
    };

    struct error: base_error {
        explicit error(std::string_view msg);

        template<typename... Args>
            requires (sizeof...(Args) > 0)
        explicit error(const std::string_view fmt, Args&&... a):
            error { std::string_view { fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...) } }
        {
        }
    };

    struct error_sys: error {
        explicit error_sys(std::string_view msg);

        template<typename... Args>
            requires (sizeof...(Args) > 0)
        explicit error_sys(const std::string_view fmt, Args&&... a):
            error_sys { std::string_view { fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...) } }
        {
        }
    };
}

#endif // !FT_MIGRATOR_COMMON_ERROR_HPP
