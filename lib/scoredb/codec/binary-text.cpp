/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <scoredb/common/error.hpp>
#include <scoredb/common/format.hpp>
#include "binary-text.hpp"

namespace scoredb::codec::binary_text {
    static void _append_code(std::string &out, uint8_t code)
    {
        char digits[8];
        size_t num_digits = 0;
        do {
            digits[num_digits++] = static_cast<char>('0' + (code & 1U));
            code >>= 1U;
        } while (code != 0);
        while (num_digits > 0)
            out.push_back(digits[--num_digits]);
    }

    static char _parse_code(const std::string_view token)
    {
        if (token.empty()) [[unlikely]]
            throw error("binary_text: an empty code token");
        unsigned code = 0;
        for (const char c: token) {
            if (c != '0' && c != '1') [[unlikely]]
                throw error(fmt::format("binary_text: a non-binary character in code token '{}'", token));
            code = (code << 1U) | static_cast<unsigned>(c - '0');
            if (code > 0xFFU) [[unlikely]]
                throw error(fmt::format("binary_text: code token '{}' is out of the character range", token));
        }
        return static_cast<char>(static_cast<uint8_t>(code));
    }

    std::string encode(const std::string_view text)
    {
        std::string out {};
        out.reserve(text.size() * 9);
        for (const char c: text) {
            if (!out.empty())
                out.push_back(' ');
            _append_code(out, static_cast<uint8_t>(c));
        }
        return out;
    }

    std::string decode(const std::string_view code)
    {
        std::string out {};
        if (code.empty())
            return out;
        out.reserve(code.size() / 8 + 1);
        size_t start = 0;
        for (;;) {
            const auto end = code.find(' ', start);
            out.push_back(_parse_code(code.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start)));
            if (end == std::string_view::npos)
                break;
            start = end + 1;
        }
        return out;
    }

    std::vector<std::string_view> split(const std::string_view text, const size_t max_len)
    {
        if (max_len == 0) [[unlikely]]
            throw error("binary_text: split requires a positive max_len");
        std::vector<std::string_view> pieces {};
        pieces.reserve((text.size() + max_len - 1) / max_len);
        for (size_t off = 0; off < text.size(); off += max_len)
            pieces.emplace_back(text.substr(off, max_len));
        return pieces;
    }
}
