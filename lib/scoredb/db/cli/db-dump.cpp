/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include <scoredb/common/timer.hpp>
#include "common.hpp"

namespace scoredb::cli::db_dump {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-dump";
            cmd.desc = "Print the whole document of <table> as pretty JSON, optionally saving it to [<path>]";
            cmd.args.expect({ "<table>", "[<path>]" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            const timer t { fmt::format("db-dump {}", db.table()) };
            const auto doc = db.load();
            logger::info("{}: {} chunks", db.table(), db.chunks().size());
            if (args.size() > 1)
                codec::json::save_pretty(args.at(1), doc);
            else
                std::cout << codec::json::serialize_pretty(doc) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
