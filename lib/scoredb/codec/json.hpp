#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iosfwd>
#include <string>
#include <string_view>
#include <typeinfo>
#include <boost/json.hpp>
#include <scoredb/common/error.hpp>
#include <scoredb/common/format.hpp>

namespace scoredb::codec::json {
    using namespace boost::json;

    template<typename T>
    concept from_json_c = requires(T t, boost::json::value jv)
    {
        { T::from_json(jv) };
    };

    // Sorts object keys recursively so that equal documents serialize to equal text.
    extern value canonical(const value &jv);
    extern object canonical(const object &obj);
    extern std::string serialize_canon(const value &jv);
    extern value parse(std::string_view text);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream &os, const value &jv);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    template<typename T>
    T load_obj(const std::string &path)
    {
        if constexpr (from_json_c<T>) {
            return T::from_json(load(path));
        } else {
            throw error(fmt::format("JSON serialization not supported for {}", typeid(T).name()));
        }
    }
}

namespace fmt {
    template<>
    struct formatter<boost::json::value>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const boost::json::value &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", boost::json::serialize(v));
        }
    };

    template<>
    struct formatter<boost::json::object>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const boost::json::object &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", boost::json::serialize(v));
        }
    };
}
