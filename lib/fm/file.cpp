/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <algorithm>
#include <fstream>
#include <fm/config.hpp>
#include <fm/file.hpp>
#include <fm/logger.hpp>

namespace ft_migrator::file {
    tmp::tmp(const std::string_view name)
        : _path { install_path(fmt::format("tmp/{}", name)) }
    {
        std::filesystem::create_directories(std::filesystem::path { _path }.parent_path());
        if (std::filesystem::exists(_path))
            std::filesystem::remove(_path);
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
        if (ec)
            logger::warn("failed to remove a temporary file {}: {}", _path, ec.message());
    }

    void read(const std::string &path, uint8_vector &buf)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        is.seekg(0, std::ios::end);
        const auto sz = is.tellg();
        if (sz < 0)
            throw error_sys(fmt::format("failed to determine the size of {}", path));
        is.seekg(0, std::ios::beg);
        buf.resize(static_cast<size_t>(sz));
        if (!buf.empty() && !is.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size())))
            throw error_sys(fmt::format("failed to read {} bytes from {}", buf.size(), path));
    }

    uint8_vector read(const std::string &path)
    {
        uint8_vector buf {};
        read(path, buf);
        return buf;
    }

    void write(const std::string &path, const buffer data)
    {
        const std::filesystem::path target { path };
        if (target.has_parent_path())
            std::filesystem::create_directories(target.parent_path());
        const std::string tmp_path = path + ".tmp";
        {
            std::ofstream os { tmp_path, std::ios::binary | std::ios::trunc };
            if (!os)
                throw error_sys(fmt::format("failed to open {} for writing", tmp_path));
            if (!os.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size())))
                throw error_sys(fmt::format("failed to write {} bytes to {}", data.size(), tmp_path));
            os.close();
            if (!os)
                throw error_sys(fmt::format("failed to close {}", tmp_path));
        }
        std::filesystem::rename(tmp_path, target);
    }

    void remove(const std::string &path)
    {
        std::filesystem::remove(path);
    }

    path_list files_with_ext(const std::string_view &dir, const std::string_view &ext)
    {
        path_list paths {};
        for (auto &entry: std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension().string() == ext)
                paths.emplace_back(entry.path());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }
}
