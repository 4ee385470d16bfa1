#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <typeinfo>
#include "error.hpp"
#include "format.hpp"

namespace scoredb {
    template<typename TO, typename FROM>
    [[noreturn]] void numeric_cast_fail(const FROM from, const std::string_view reason)
    {
        throw error(fmt::format("can't convert {} {} to {}: {}", typeid(FROM).name(), from, typeid(TO).name(), reason));
    }

    // Converts between integral types and throws when the value does not fit into the target type.
    // Counter values come from the backend as int64_t while the chunk indices are size_t.
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        using from_lim = std::numeric_limits<FROM>;
        using to_lim = std::numeric_limits<TO>;
        if constexpr (from_lim::is_signed == to_lim::is_signed) {
            if (from > to_lim::max()) [[unlikely]]
                numeric_cast_fail<TO>(from, fmt::format("the value is larger than {}", to_lim::max()));
            if (from < to_lim::min()) [[unlikely]]
                numeric_cast_fail<TO>(from, "the value is too small");
        } else if constexpr (from_lim::is_signed) {
            if (from < 0) [[unlikely]]
                numeric_cast_fail<TO>(from, "the value is negative");
            if (from_lim::max() > to_lim::max() && from > static_cast<FROM>(to_lim::max())) [[unlikely]]
                numeric_cast_fail<TO>(from, "the value is too big");
        } else if constexpr (from_lim::digits > to_lim::digits) {
            if (from > static_cast<FROM>(to_lim::max())) [[unlikely]]
                numeric_cast_fail<TO>(from, "the value is too big");
        }
        return static_cast<TO>(from);
    }
}
