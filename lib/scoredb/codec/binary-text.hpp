#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <string_view>
#include <vector>

namespace scoredb::codec::binary_text {
    // Each character is written as the binary form of its code without leading zeros.
    // Codes are separated by a single space, so the output uses only '0', '1' and ' '.
    extern std::string encode(std::string_view text);

    // Throws scoredb::error on an empty token, a non-binary character, or a code above 255.
    extern std::string decode(std::string_view code);

    // Greedy left-to-right split: all pieces but the last are exactly max_len long.
    // The returned views point into text. An empty text produces no pieces.
    extern std::vector<std::string_view> split(std::string_view text, size_t max_len);
}
