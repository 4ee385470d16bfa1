/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "file.hpp"

namespace {
    using namespace scoredb;
    using namespace std::string_view_literals;
}

suite scoredb_common_file_suite = [] {
    "scoredb::common::file"_test = [] {
        "write + read"_test = [] {
            file::tmp t { "file-write-read-test.txt" };
            file::write(t.path(), "line 1\nline 2\n"sv);
            expect_equal("line 1\nline 2\n"sv, file::read(t.path()));
            file::write(t.path(), "x"sv);
            expect_equal("x"sv, file::read(t.path()));
        };
        "read missing"_test = [] {
            expect(throws([] { file::read("/non-existent-dir/non-existent-file"); }));
        };
        "tmp_directory is removed"_test = [] {
            std::string path {};
            {
                const file::tmp_directory dir { "file-tmp-dir-test" };
                path = dir.path();
                expect(std::filesystem::is_directory(path));
                file::write((static_cast<std::filesystem::path>(dir) / "a.txt").string(), "a"sv);
            }
            expect(!std::filesystem::exists(path));
        };
    };
};
