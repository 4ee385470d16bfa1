/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace scoredb::cli::db_clear {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "db-clear";
            cmd.desc = "Remove all keys from <table>";
            cmd.args.expect({ "<table>" });
            db_common::configure(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            auto db = db_common::open(args.at(0), opts);
            const auto num_keys = db.size();
            db.clear();
            logger::info("{}: removed {} keys", db.table(), num_keys);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
