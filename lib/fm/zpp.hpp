/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_ZPP_HPP
#define FT_MIGRATOR_ZPP_HPP

#include <zpp_bits.h>
#include <fm/file.hpp>

namespace ft_migrator::zpp {
    template<typename T>
    void deserialize(T &v, const buffer zpp_data)
    {
        ::zpp::bits::in in { zpp_data };
        in(v).or_throw();
    }

    template<typename T>
    T load(const std::string &path)
    {
        T v;
        const auto zpp_data = file::read(path);
        ::zpp::bits::in in { zpp_data };
        in(v).or_throw();
        return v;
    }

    template<typename T>
    uint8_vector serialize(const T &v)
    {
        uint8_vector zpp_data {};
        ::zpp::bits::out out { zpp_data };
        out(v).or_throw();
        return zpp_data;
    }

    template<typename T>
    void save(const std::string &path, const T &v)
    {
        file::write(path, serialize(v));
    }
}

#endif // !FT_MIGRATOR_ZPP_HPP
