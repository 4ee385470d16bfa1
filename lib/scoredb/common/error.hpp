#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cerrno>
#include <stdexcept>
#include <string_view>

namespace scoredb {
    // The exception type thrown by all scoredb components.
    struct error: std::runtime_error {
        explicit error(std::string_view msg);
        // Wraps a lower-level failure: the message becomes "<msg>: <cause's message>".
        error(std::string_view msg, const std::exception &cause);
    };

    // A failed operating system call; keeps the errno value observed at construction.
    struct error_sys: error {
        explicit error_sys(std::string_view msg, int err=errno);

        [[nodiscard]] int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;
    };
}
