/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace scoredb::cli::db_erase {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-erase";
            cmd.desc = "Remove <key> from <table>";
            cmd.args.expect({ "<table>", "<key>" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            if (db.erase(args.at(1)))
                logger::info("{}: removed {}", db.table(), args.at(1));
            else
                logger::info("{}: no key {}", db.table(), args.at(1));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
