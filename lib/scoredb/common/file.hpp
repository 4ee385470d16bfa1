#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <filesystem>
#include <string>
#include <string_view>
#include "error.hpp"
#include "format.hpp"

namespace scoredb::file {
    extern std::string install_path(std::string_view rel_path);
    extern std::string read(const std::string &path);
    extern void write(const std::string &path, std::string_view data);

    // A uniquely-named directory under the system temporary directory; recursively removed on destruction.
    struct tmp_directory {
        explicit tmp_directory(std::string_view name);
        ~tmp_directory();

        tmp_directory(const tmp_directory &) = delete;
        tmp_directory &operator=(const tmp_directory &) = delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }

        operator std::filesystem::path() const
        {
            return _path;
        }
    private:
        std::string _path;
    };

    // A path in the system temporary directory; the file is removed on destruction.
    struct tmp {
        explicit tmp(std::string_view name);
        ~tmp();

        tmp(const tmp &) = delete;
        tmp &operator=(const tmp &) = delete;

        [[nodiscard]] const std::string &path() const noexcept
        {
            return _path;
        }
    private:
        std::string _path;
    };
}
