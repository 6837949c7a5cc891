/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_FILE_HPP
#define FT_MIGRATOR_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>
#include <fm/common/bytes.hpp>

namespace ft_migrator::file {
    // A temporary file in the install's tmp directory removed when the object goes out of scope
    struct tmp {
        explicit tmp(const std::string_view name);
        ~tmp();

        tmp(const tmp &) =delete;
        tmp &operator=(const tmp &) =delete;

        const std::string &path() const noexcept
        {
            return _path;
        }

        operator const std::string &() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };

    extern void read(const std::string &path, uint8_vector &buf);
    extern uint8_vector read(const std::string &path);
    // Writes to a sibling temporary file and renames it over the target so readers never observe partial content
    extern void write(const std::string &path, const buffer data);
    extern void remove(const std::string &path);

    using path_list = std::vector<std::filesystem::path>;
    extern path_list files_with_ext(const std::string_view &dir, const std::string_view &ext);
}

#endif // !FT_MIGRATOR_FILE_HPP
