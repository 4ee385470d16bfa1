/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "cli.hpp"

namespace {
    using namespace scoredb;
    using namespace scoredb::cli;

    config test_config()
    {
        config cfg {};
        cfg.name = "test-cmd";
        cfg.args.expect({ "<table>", "[<key>]" });
        cfg.opts.try_emplace("data-dir", "a data directory", "./data");
        cfg.opts.try_emplace("config", "an optional config path");
        return cfg;
    }
}

suite scoredb_common_cli_suite = [] {
    "scoredb::common::cli"_test = [] {
        "defaults"_test = [] {
            const auto res = parse(test_config(), { "players" });
            expect_equal(size_t { 1 }, res.args.size());
            expect_equal(std::string { "players" }, res.args.at(0));
            expect_equal(std::string { "./data" }, res.opts.at("data-dir").value());
            expect(!res.opts.contains("config"));
        };
        "both option forms"_test = [] {
            const auto res = parse(test_config(), { "--data-dir=/tmp/a", "players", "--config", "cfg.json", "gold" });
            expect_equal(std::string { "/tmp/a" }, res.opts.at("data-dir").value());
            expect_equal(std::string { "cfg.json" }, res.opts.at("config").value());
            expect_equal(size_t { 2 }, res.args.size());
            expect_equal(std::string { "gold" }, res.args.at(1));
        };
        "argument count"_test = [] {
            expect(throws([] { parse(test_config(), {}); }));
            expect(throws([] { parse(test_config(), { "a", "b", "c" }); }));
        };
        "unknown option"_test = [] {
            expect(throws([] { parse(test_config(), { "players", "--verbose" }); }));
        };
        "unbounded tail"_test = [] {
            config cfg {};
            cfg.name = "tail";
            cfg.args.expect({ "<key>", "<val>", "[<val> ...]" });
            expect_equal(size_t { 4 }, parse(cfg, { "k", "1", "2", "3" }).args.size());
            expect(throws([&] { parse(cfg, { "k" }); }));
        };
    };
};
