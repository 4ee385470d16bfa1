/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "common.hpp"

namespace scoredb::cli::db_get {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-get";
            cmd.desc = "Print the JSON value stored under <key> in <table>";
            cmd.args.expect({ "<table>", "<key>" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            const auto &key = args.at(1);
            if (const auto val = db.get(key)) {
                std::cout << codec::json::serialize_pretty(*val) << '\n';
            } else {
                throw error(fmt::format("table {} has no key '{}'", db.table(), key));
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
