/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <atomic>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include "file.hpp"

namespace scoredb::file {
    static std::string _unique_tmp_path(const std::string_view name)
    {
        static std::atomic_size_t next_id { 0 };
        const auto dir = std::filesystem::temp_directory_path();
        return (dir / fmt::format("{}-{}-{}", name, ::getpid(), next_id++)).string();
    }

    std::string install_path(const std::string_view rel_path)
    {
        // provide a dummy implementation at the moment
        return fmt::format("./{}", rel_path);
    }

    std::string read(const std::string &path)
    {
        std::ifstream is { path, std::ios::binary };
        if (!is)
            throw error_sys(fmt::format("failed to open {} for reading", path));
        std::string data { std::istreambuf_iterator<char> { is }, std::istreambuf_iterator<char> {} };
        if (is.bad())
            throw error_sys(fmt::format("failed to read from {}", path));
        return data;
    }

    void write(const std::string &path, const std::string_view data)
    {
        std::ofstream os { path, std::ios::binary | std::ios::trunc };
        if (!os)
            throw error_sys(fmt::format("failed to open {} for writing", path));
        os.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!os)
            throw error_sys(fmt::format("failed to write to {}", path));
    }

    tmp_directory::tmp_directory(const std::string_view name):
        _path { _unique_tmp_path(name) }
    {
        std::filesystem::remove_all(_path);
        std::filesystem::create_directories(_path);
    }

    tmp_directory::~tmp_directory()
    {
        std::error_code ec {};
        std::filesystem::remove_all(_path, ec);
    }

    tmp::tmp(const std::string_view name):
        _path { _unique_tmp_path(name) }
    {
    }

    tmp::~tmp()
    {
        std::error_code ec {};
        std::filesystem::remove(_path, ec);
    }
}
