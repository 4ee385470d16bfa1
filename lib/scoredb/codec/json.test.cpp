/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <scoredb/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace scoredb;
    using namespace scoredb::codec;
    using namespace std::string_view_literals;

    struct point_t {
        int64_t x = 0;
        int64_t y = 0;

        static point_t from_json(const json::value &jv)
        {
            const auto &jo = jv.as_object();
            return { jo.at("x").as_int64(), jo.at("y").as_int64() };
        }
    };
}

suite scoredb_codec_json_suite = [] {
    "scoredb::codec::json"_test = [] {
        "save_pretty + reload object"_test = [] {
            file::tmp t { "json-save-pretty-object-test.json" };
            const json::value j = json::object {
                { "name", "abc" },
                { "version", 123 }
            };
            json::save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect_equal("{\n  \"name\": \"abc\",\n  \"version\": 123\n}"sv, buf);
            const auto loaded = json::load(t.path());
            expect(j == loaded);
        };
        "save_pretty + reload array"_test = [] {
            file::tmp t { "json-save-pretty-array-test.json" };
            const json::value j = json::array {
                "name",
                123
            };
            json::save_pretty(t.path(), j);
            expect_equal("[\n  \"name\",\n  123\n]"sv, file::read(t.path()));
            const auto loaded = json::load(t.path());
            expect(j == loaded);
        };
        "serialize_pretty empty containers"_test = [] {
            expect_equal("{}"sv, json::serialize_pretty(json::object {}));
            expect_equal("{\n  \"a\": []\n}"sv, json::serialize_pretty(json::object { { "a", json::array {} } }));
        };
        "serialize_canon sorts keys recursively"_test = [] {
            const json::value j = json::object {
                { "b", 1 },
                { "a", json::array { json::object { { "z", true }, { "y", nullptr } } } },
                { "c", json::object { { "e", "x" }, { "d", 2 } } }
            };
            expect_equal("{\"a\":[{\"y\":null,\"z\":true}],\"b\":1,\"c\":{\"d\":2,\"e\":\"x\"}}"sv, json::serialize_canon(j));
            expect(json::parse(json::serialize_canon(j)) == j);
        };
        "parse rejects malformed text"_test = [] {
            expect(throws([] { json::parse("{\"a\":"); }));
            expect(throws([] { json::parse(""); }));
        };
        "load_obj"_test = [] {
            file::tmp t { "json-load-obj-test.json" };
            file::write(t.path(), "{\"x\":3,\"y\":-4}"sv);
            const auto p = json::load_obj<point_t>(t.path());
            expect_equal(int64_t { 3 }, p.x);
            expect_equal(int64_t { -4 }, p.y);
        };
    };
};
