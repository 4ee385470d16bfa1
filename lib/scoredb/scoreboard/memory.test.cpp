/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <utility>
#include <scoredb/common/test.hpp>
#include "memory.hpp"

namespace {
    using namespace scoredb;
    using namespace scoredb::scoreboard;
    using namespace std::string_view_literals;
}

suite scoredb_scoreboard_memory_suite = [] {
    "scoredb::scoreboard::memory"_test = [] {
        "create and drop tables"_test = [] {
            memory::backend_t sb {};
            expect(sb.create_table("money"));
            expect(!sb.create_table("money"));
            expect(sb.has_table("money"));
            expect(sb.drop_table("money"));
            expect(!sb.drop_table("money"));
            expect(!sb.has_table("money"));
        };
        "set, add, and test counters"_test = [] {
            memory::backend_t sb {};
            sb.create_table("money");
            expect_equal(std::optional<int64_t> {}, sb.test_counter("money", "Steve"));
            sb.add_counter("money", "Steve", 0);
            expect_equal(std::optional<int64_t> { 0 }, sb.test_counter("money", "Steve"));
            sb.add_counter("money", "Steve", 5);
            sb.add_counter("money", "Steve", 5);
            expect_equal(std::optional<int64_t> { 10 }, sb.test_counter("money", "Steve"));
            sb.set_counter("money", "Steve", -3);
            expect_equal(std::optional<int64_t> { -3 }, sb.test_counter("money", "Steve"));
            expect_equal(std::optional<int64_t> { -3 }, sb.test_counter("money", "Steve", -3, 0));
            expect_equal(std::optional<int64_t> {}, sb.test_counter("money", "Steve", 0, {}));
            expect_equal(std::optional<int64_t> {}, sb.test_counter("money", "Steve", {}, -4));
        };
        "commands against missing tables are rejected"_test = [] {
            memory::backend_t sb {};
            expect_throw_msg([&] { sb.set_counter("money", "Steve", 1); }, "no table with name 'money'");
            expect(throws([&] { sb.add_counter("money", "Steve", 1); }));
            expect(throws([&] { (void)sb.test_counter("money", "Steve"); }));
            const auto &view = std::as_const(sb);
            expect_throw_msg([&] { (void)view.test_counter("money", "Steve"); }, "no table with name 'money'");
            expect(sb.create_table("money"));
            expect_equal(std::optional<int64_t> {}, view.test_counter("money", "Steve"));
        };
        "name validation"_test = [] {
            memory::backend_t sb { limits_t { .max_name_size = 8 } };
            expect_throw_msg([&] { sb.create_table(""); }, "must not be empty");
            expect_throw_msg([&] { sb.create_table("a\nb"); }, "must not contain a newline");
            expect_throw_msg([&] { sb.create_table("123456789"); }, "exceeds the limit of 8");
            expect(sb.create_table("12345678"));
            expect(throws([&] { sb.set_counter("12345678", "too long name", 0); }));
        };
        "list_all"_test = [] {
            memory::backend_t sb {};
            sb.create_table("b");
            sb.create_table("a");
            sb.create_table("empty");
            sb.set_counter("b", "Steve", 7);
            sb.set_counter("a", "Alex", -1);
            sb.set_counter("a", "DB_a_0(1 0)", 0);
            expect_equal("Alex: -1 (a)\nDB_a_0(1 0): 0 (a)\nSteve: 7 (b)\n"sv, sb.list_all());
            sb.drop_table("a");
            expect_equal("Steve: 7 (b)\n"sv, sb.list_all());
        };
    };
};
