/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <typeinfo>
#include <vector>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif

#include "file.hpp"
#include "logger.hpp"

namespace scoredb::logger {
    namespace {
        constexpr size_t max_file_size = 16 << 20;
        constexpr size_t max_files = 4;

        spdlog::logger create(const settings_t &s)
        {
            std::vector<spdlog::sink_ptr> sinks {};
            try {
                if (const auto dir = std::filesystem::path { s.path }.parent_path(); !dir.empty())
                    std::filesystem::create_directories(dir);
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(s.path, max_file_size, max_files);
                file_sink->set_level(s.file_level);
                file_sink->set_pattern("%Y-%m-%dT%T.%e %-5l [%P:%t] %v");
                sinks.emplace_back(std::move(file_sink));
            } catch (const std::exception &ex) {
                // without a writable log file only the console sink remains
                std::cerr << fmt::format("scoredb: cannot log to {}: {}\n", s.path, ex.what());
            }
            if (s.console || sinks.empty()) {
                auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                console_sink->set_level(level::info);
                console_sink->set_pattern("%^%l%$: %v");
                sinks.emplace_back(std::move(console_sink));
            }
            spdlog::logger l { "scoredb", sinks.begin(), sinks.end() };
            l.set_level(level::trace);
            l.flush_on(level::warn);
            return l;
        }
    }

    settings_t settings_t::from_env()
    {
        settings_t s {};
        const char *path = std::getenv("SCOREDB_LOG");
        s.path = path ? std::string { path } : file::install_path("log/scoredb.log");
        if (std::getenv("SCOREDB_DEBUG"))
            s.file_level = level::trace;
        s.console = std::getenv("SCOREDB_LOG_NO_CONSOLE") == nullptr;
        return s;
    }

    const settings_t &settings()
    {
        static const settings_t s = settings_t::from_env();
        return s;
    }

    spdlog::logger &get()
    {
        static spdlog::logger l = create(settings());
        return l;
    }

    std::exception_ptr run_log_errors(const action &main, const level lev, const std::source_location &loc)
    {
        try {
            main();
        } catch (const std::exception &ex) {
            log(lev, "{}:{}: {}: {}", loc.file_name(), loc.line(), typeid(ex).name(), ex.what());
            return std::current_exception();
        } catch (...) {
            log(lev, "{}:{}: an unknown exception", loc.file_name(), loc.line());
            return std::current_exception();
        }
        return nullptr;
    }
}
