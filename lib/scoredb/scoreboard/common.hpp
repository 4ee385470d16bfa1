#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <scoredb/common/error.hpp>
#include <scoredb/common/format.hpp>

namespace scoredb::scoreboard {
    using bound_t = std::optional<int64_t>;

    struct limits_t {
        // absent means that names of any size are accepted
        std::optional<size_t> max_name_size {};
    };

    // A store of named integer counters grouped into named tables.
    // Commands that the backend rejects throw scoredb::error.
    struct backend_t {
        virtual ~backend_t() = default;

        // returns false when the table already exists
        virtual bool create_table(std::string_view name) = 0;
        // removes the table together with its counters; returns false when the table does not exist
        virtual bool drop_table(std::string_view name) = 0;
        virtual void set_counter(std::string_view table, std::string_view entry, int64_t value) = 0;
        virtual void add_counter(std::string_view table, std::string_view entry, int64_t delta) = 0;
        // One line per counter, ordered by table and then by entry name: "<entry>: <value> (<table>)".
        // This is the only way to read entry names back.
        [[nodiscard]] virtual std::string list_all() const = 0;
        // The counter's value if it exists and lies within [min, max]; absent bounds are not checked.
        [[nodiscard]] virtual std::optional<int64_t> test_counter(std::string_view table, std::string_view entry,
            bound_t min={}, bound_t max={}) const = 0;
    };
    using backend_ptr_t = std::shared_ptr<backend_t>;

    extern void validate_name(std::string_view kind, std::string_view name, const limits_t &limits);
    extern void append_listing_line(std::string &out, std::string_view table, std::string_view entry, int64_t value);

    inline bool in_bounds(const int64_t value, const bound_t min, const bound_t max)
    {
        return (!min || value >= *min) && (!max || value <= *max);
    }
}
