#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <exception>
#include <functional>
#include <source_location>
#include <string>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/logger.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "format.hpp"

namespace scoredb::logger {
    using level = spdlog::level::level_enum;

    // Resolved once from the environment:
    // SCOREDB_LOG - the log file, ./log/scoredb.log relative to the installation directory by default;
    // SCOREDB_DEBUG - when set, the file receives trace records too;
    // SCOREDB_LOG_NO_CONSOLE - when set, nothing is written to stderr.
    struct settings_t {
        std::string path;
        level file_level = level::debug;
        bool console = true;

        static settings_t from_env();
    };

    extern const settings_t &settings();
    extern spdlog::logger &get();

    template<typename... Args>
    void log(const level lev, fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        auto &l = get();
        if (l.should_log(lev))
            l.log(lev, fmt::format(msg_fmt, std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        log(level::trace, msg_fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        log(level::debug, msg_fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        log(level::info, msg_fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        log(level::warn, msg_fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> msg_fmt, Args&&... a)
    {
        log(level::err, msg_fmt, std::forward<Args>(a)...);
    }

    using action = std::function<void()>;

    // Runs main and logs an escaping exception with the given level instead of propagating it.
    // Returns the caught exception or nullptr when main succeeded.
    extern std::exception_ptr run_log_errors(const action &main, level lev=level::err,
        const std::source_location &loc=std::source_location::current());
}
