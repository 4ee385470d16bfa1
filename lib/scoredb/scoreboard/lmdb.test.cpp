/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <scoredb/common/test.hpp>
#include "lmdb.hpp"

namespace {
    using namespace scoredb;
    using namespace scoredb::scoreboard;
    using namespace std::string_view_literals;
}

suite scoredb_scoreboard_lmdb_suite = [] {
    "scoredb::scoreboard::lmdb"_test = [] {
        "create, set, and drop"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb" };
            lmdb::backend_t sb { tmp_dir.path() };
            expect(sb.create_table("money"));
            expect(!sb.create_table("money"));
            sb.add_counter("money", "Steve", 0);
            sb.add_counter("money", "Steve", 4);
            expect_equal(std::optional<int64_t> { 4 }, sb.test_counter("money", "Steve"));
            sb.set_counter("money", "Steve", 9);
            expect_equal(std::optional<int64_t> { 9 }, sb.test_counter("money", "Steve", 9, 9));
            expect_equal(std::optional<int64_t> {}, sb.test_counter("money", "Steve", 10, {}));
            expect_equal(std::optional<int64_t> {}, sb.test_counter("money", "Alex"));
            expect(sb.drop_table("money"));
            expect(!sb.drop_table("money"));
            expect(!sb.has_table("money"));
            expect(throws([&] { sb.set_counter("money", "Steve", 1); }));
            expect(throws([&] { (void)sb.test_counter("money", "Steve"); }));
        };
        "long entry names"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb-long" };
            lmdb::backend_t sb { tmp_dir.path() };
            sb.create_table("DB_t_0");
            const auto name = fmt::format("DB_t_0({})", std::string(100000, '1'));
            sb.set_counter("DB_t_0", name, 0);
            expect_equal(fmt::format("{}: 0 (DB_t_0)\n", name), sb.list_all());
        };
        "non-UTF-8 names"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb-binary" };
            lmdb::backend_t sb { tmp_dir.path() };
            sb.create_table("a");
            sb.set_counter("a", "Alex", 1);
            const std::string table { "\xFF" };
            const std::string entry { "DB_\xFF_0(\xC3(\x80)" };
            expect(sb.create_table(table));
            sb.set_counter(table, entry, -5);
            expect_equal(std::optional<int64_t> { -5 }, sb.test_counter(table, entry));
            expect_equal(std::optional<int64_t> { 1 }, sb.test_counter("a", "Alex"));
            expect_equal(fmt::format("Alex: 1 (a)\n{}: -5 ({})\n", entry, table), sb.list_all());
        };
        "table names beyond the key limit are rejected"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb-key-limit" };
            lmdb::backend_t sb { tmp_dir.path() };
            const std::string name(4096, 't');
            expect_throw_msg([&] { sb.create_table(name); }, "key limit");
            expect(!sb.has_table(name));
            expect(!sb.drop_table(name));
            expect_throw_msg([&] { sb.set_counter(name, "Steve", 1); }, "no table with name");
        };
        "a failed open leaves the directory reusable"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb-failed-open" };
            const auto dir = static_cast<std::filesystem::path>(tmp_dir);
            std::filesystem::create_directories(dir / "data.mdb");
            expect_throw_msg([&] { lmdb::backend_t sb { dir.string() }; }, "env_open");
            expect_throw_msg([&] { lmdb::backend_t sb { dir.string() }; }, "env_open");
            std::filesystem::remove_all(dir / "data.mdb");
            lmdb::backend_t sb { dir.string() };
            expect(sb.create_table("money"));
        };
        "state survives reopening"_test = [] {
            const file::tmp_directory tmp_dir { "test-scoredb-scoreboard-lmdb-reopen" };
            {
                lmdb::backend_t sb { tmp_dir.path() };
                sb.create_table("b");
                sb.create_table("a");
                sb.set_counter("b", "Steve", 7);
                sb.set_counter("a", "Alex", -1);
            }
            lmdb::backend_t sb { tmp_dir.path() };
            expect(sb.has_table("a"));
            expect_equal("Alex: -1 (a)\nSteve: 7 (b)\n"sv, sb.list_all());
        };
    };
};
