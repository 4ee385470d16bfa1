#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <scoredb/common/cli.hpp>
#include <scoredb/db/db.hpp>
#include <scoredb/scoreboard/lmdb.hpp>

namespace scoredb::cli::db_common {
    inline void configure(config &cmd)
    {
        cmd.opts.try_emplace("data-dir", "the directory of the LMDB scoreboard", "./data/scoredb");
        cmd.opts.try_emplace("config", "an optional JSON file overriding the db settings");
    }

    inline db::db_t open(const std::string &table, const options &opts)
    {
        db::config_t cfg {};
        if (const auto it = opts.find("config"); it != opts.end() && it->second) {
            logger::info("loading the db config from {}", *it->second);
            cfg = codec::json::load_obj<db::config_t>(*it->second);
        }
        const auto &data_dir = opts.at("data-dir").value();
        return { table, std::make_shared<scoreboard::lmdb::backend_t>(data_dir), std::move(cfg) };
    }
}
