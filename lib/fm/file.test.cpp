/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <fm/file.hpp>
#include <fm/common/test.hpp>

using namespace ft_migrator;

suite file_suite = [] {
    "file"_test = [] {
        "tmp"_test = [] {
            std::string tmp_path {};
            {
                file::tmp tmp1 { "hello.txt" };
                tmp_path = tmp1.path();
                expect(!std::filesystem::exists(tmp1.path()));
                file::write(tmp1.path(), std::string_view { "Hello\n" });
                expect(std::filesystem::exists(tmp1.path()));
                test_same(size_t { 6 }, static_cast<size_t>(std::filesystem::file_size(tmp1.path())));
            }
            expect(!std::filesystem::exists(tmp_path));
        };
        "write replaces atomically"_test = [] {
            file::tmp tmp1 { "atomic.bin" };
            file::write(tmp1.path(), std::string_view { "first version" });
            file::write(tmp1.path(), std::string_view { "v2" });
            const auto data = file::read(tmp1.path());
            test_same(std::string_view { "v2" }, data.str());
            expect(!std::filesystem::exists(tmp1.path() + ".tmp"));
        };
        "read missing"_test = [] {
            expect(throws<error>([] { file::read("./tmp/this-file-does-not-exist.bin"); }));
        };
        "files_with_ext"_test = [] {
            file::tmp a { "ext-test/a.json" };
            file::tmp b { "ext-test/b.json" };
            file::tmp c { "ext-test/c.bin" };
            file::write(a.path(), std::string_view { "{}" });
            file::write(b.path(), std::string_view { "{}" });
            file::write(c.path(), std::string_view { "x" });
            const auto paths = file::files_with_ext(std::filesystem::path { a.path() }.parent_path().string(), ".json");
            test_same(size_t { 2 }, paths.size());
        };
    };
};
