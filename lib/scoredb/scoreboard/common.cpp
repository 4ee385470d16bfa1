/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iterator>
#include "common.hpp"

namespace scoredb::scoreboard {
    void validate_name(const std::string_view kind, const std::string_view name, const limits_t &limits)
    {
        if (name.empty()) [[unlikely]]
            throw error(fmt::format("scoreboard: {} name must not be empty", kind));
        if (name.find('\n') != std::string_view::npos) [[unlikely]]
            throw error(fmt::format("scoreboard: {} name must not contain a newline", kind));
        if (name.find('\0') != std::string_view::npos) [[unlikely]]
            throw error(fmt::format("scoreboard: {} name must not contain a NUL character", kind));
        if (limits.max_name_size && name.size() > *limits.max_name_size) [[unlikely]]
            throw error(fmt::format("scoreboard: {} name of {} characters exceeds the limit of {}", kind, name.size(), *limits.max_name_size));
    }

    void append_listing_line(std::string &out, const std::string_view table, const std::string_view entry, const int64_t value)
    {
        fmt::format_to(std::back_inserter(out), "{}: {} ({})\n", entry, value, table);
    }
}
