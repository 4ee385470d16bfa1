/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace scoredb::cli::db_set {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-set";
            cmd.desc = "Store the JSON text <value> under <key> in <table>";
            cmd.args.expect({ "<table>", "<key>", "<value>" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            auto val = codec::json::parse(args.at(2));
            db.set(args.at(1), std::move(val));
            logger::info("{}: set {} ({} chunks)", db.table(), args.at(1), db.chunks().size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
