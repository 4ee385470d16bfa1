/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "logger.hpp"

namespace {
    using namespace scoredb;
}

suite scoredb_common_logger_suite = [] {
    "scoredb::common::logger"_test = [] {
        "every level accepts arguments"_test = [] {
            expect(nothrow([] {
                logger::trace("trace {}", 1);
                logger::debug("debug {}", "two");
                logger::info("info {:.1f}", 3.0);
                logger::warn("warn {}", std::optional<int> { 4 });
                logger::error("error {}", std::optional<int> {});
                logger::log(logger::level::info, "no arguments");
            }));
        };
        "settings"_test = [] {
            const auto &s = logger::settings();
            expect(!s.path.empty());
            expect(&s == &logger::settings());
        };
        "run_log_errors returns the escaped exception"_test = [] {
            expect(!logger::run_log_errors([] {}));
            const auto ex = logger::run_log_errors([] { throw error("Only a warning"); }, logger::level::warn);
            expect(static_cast<bool>(ex));
            expect_throw_msg([&] { std::rethrow_exception(ex); }, "Only a warning");
        };
        "run_log_errors handles non-standard exceptions"_test = [] {
            const auto ex = logger::run_log_errors([] { throw 42; });
            expect(static_cast<bool>(ex));
            expect(throws<int>([&] { std::rethrow_exception(ex); }));
        };
    };
};
