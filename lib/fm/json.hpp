/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef FT_MIGRATOR_JSON_HPP
#define FT_MIGRATOR_JSON_HPP

#include <boost/json.hpp>
#include <fm/file.hpp>

namespace ft_migrator::json {
    using namespace boost::json;

    inline json::value parse(const buffer &buf, json::storage_ptr sp={})
    {
        return boost::json::parse(static_cast<std::string_view>(buf), sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read(path), sp);
    }

    // Numeric fields may come as JSON numbers or as decimal strings
    inline uint64_t as_uint(const json::value &v)
    {
        switch (v.kind()) {
            case json::kind::uint64: return v.get_uint64();
            case json::kind::int64:
                if (v.get_int64() < 0)
                    throw error(fmt::format("expected a non-negative integer but got {}", v.get_int64()));
                return static_cast<uint64_t>(v.get_int64());
            case json::kind::string: {
                const auto &s = v.get_string();
                size_t pos = 0;
                const auto res = std::stoull(std::string { s.data(), s.size() }, &pos);
                if (pos != s.size())
                    throw error(fmt::format("not a decimal integer: {}", std::string_view { s.data(), s.size() }));
                return res;
            }
            default:
                throw error(fmt::format("expected an integer but got {}", json::serialize(v)));
        }
    }

    inline uint64_t uint_or(const json::object &obj, const std::string_view key, const uint64_t def)
    {
        if (const auto *v = obj.if_contains(key); v && !v->is_null())
            return as_uint(*v);
        return def;
    }

    inline std::string string_or(const json::object &obj, const std::string_view key, const std::string_view def)
    {
        if (const auto *v = obj.if_contains(key); v && !v->is_null())
            return std::string { v->as_string() };
        return std::string { def };
    }

    inline bool bool_or(const json::object &obj, const std::string_view key, const bool def)
    {
        if (const auto *v = obj.if_contains(key); v && !v->is_null())
            return v->as_bool();
        return def;
    }
}

#endif // !FT_MIGRATOR_JSON_HPP
