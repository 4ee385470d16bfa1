#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <vector>
#include "common.hpp"

namespace scoredb::scoreboard::memory {
    // Keeps the scoreboard in process memory. Used by tests and as a scratch backend.
    struct backend_t: scoreboard::backend_t {
        explicit backend_t(limits_t limits={});
        ~backend_t() override;
        bool create_table(std::string_view name) override;
        bool drop_table(std::string_view name) override;
        void set_counter(std::string_view table, std::string_view entry, int64_t value) override;
        void add_counter(std::string_view table, std::string_view entry, int64_t delta) override;
        [[nodiscard]] std::string list_all() const override;
        [[nodiscard]] std::optional<int64_t> test_counter(std::string_view table, std::string_view entry,
            bound_t min={}, bound_t max={}) const override;
        [[nodiscard]] bool has_table(std::string_view name) const;
        [[nodiscard]] std::vector<std::string> tables() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
    using backend_ptr_t = std::shared_ptr<backend_t>;
}
