/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include "test.hpp"

namespace {
    using namespace scoredb;
    using namespace std::string_view_literals;
}

suite scoredb_common_error_suite = [] {
    "scoredb::common::error"_test = [] {
        "message"_test = [] {
            const error e { "something bad" };
            expect_equal("something bad"sv, std::string_view { e.what() });
        };
        "cause is appended"_test = [] {
            const error cause { "disk is full" };
            const error e { "save failed", cause };
            expect_equal("save failed: disk is full"sv, std::string_view { e.what() });
        };
        "causes nest"_test = [] {
            const error e { "db players", error { "load", std::runtime_error { "bad token" } } };
            expect_equal("db players: load: bad token"sv, std::string_view { e.what() });
        };
        "errno"_test = [] {
            const error_sys e { "open failed", ENOENT };
            expect_equal(ENOENT, e.code());
            expect(std::string_view { e.what() }.starts_with("open failed: "));
            expect(std::string_view { e.what() }.ends_with(fmt::format("(errno {})", ENOENT)));
        };
        "errno is captured by default"_test = [] {
            errno = EACCES;
            const error_sys e { "write failed" };
            expect_equal(EACCES, e.code());
        };
        "catchable as std::runtime_error"_test = [] {
            expect(throws<std::runtime_error>([] { throw error("boom"); }));
            expect(throws<error>([] { throw error_sys("boom", EIO); }));
        };
    };
};
