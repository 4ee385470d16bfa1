#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <optional>
#include <string>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace scoredb {
    using fmt::format;
}

namespace fmt {
    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };
}
