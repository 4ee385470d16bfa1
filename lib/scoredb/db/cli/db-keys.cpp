/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "common.hpp"

namespace scoredb::cli::db_keys {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-keys";
            cmd.desc = "List the keys stored in <table>, one per line";
            cmd.args.expect({ "<table>" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            for (const auto &k: db.keys())
                std::cout << k << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
