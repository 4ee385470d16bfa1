#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <chrono>
#include <string>
#include "logger.hpp"

namespace scoredb {
    struct timer {
        explicit timer(const std::string_view title, const logger::level lev=logger::level::debug):
            _title { title },
            _level { lev }
        {
        }

        ~timer()
        {
            if (!_stopped)
                stop();
        }

        timer(const timer &) = delete;
        timer &operator=(const timer &) = delete;

        double stop()
        {
            const auto secs = duration();
            _stopped = true;
            logger::log(_level, "timer '{}' took {:0.3f} secs", _title, secs);
            return secs;
        }

        [[nodiscard]] double duration() const
        {
            return std::chrono::duration<double> { std::chrono::steady_clock::now() - _start }.count();
        }
    private:
        std::string _title;
        logger::level _level;
        std::chrono::steady_clock::time_point _start { std::chrono::steady_clock::now() };
        bool _stopped = false;
    };
}
