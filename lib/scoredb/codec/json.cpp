/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <sstream>
#include <vector>
#include <scoredb/common/file.hpp>
#include "json.hpp"

namespace scoredb::codec::json {
    namespace {
        // Two-space indented output with one member or element per line; empty containers stay on one line.
        struct pretty_writer {
            std::ostream &os;
            size_t depth = 0;

            void write(const value &jv)
            {
                if (const auto *obj = jv.if_object()) {
                    _write_items(*obj, '{', '}', [&](const key_value_pair &kv) {
                        os << serialize(kv.key()) << ": ";
                        write(kv.value());
                    });
                } else if (const auto *arr = jv.if_array()) {
                    _write_items(*arr, '[', ']', [&](const value &item) {
                        write(item);
                    });
                } else {
                    os << serialize(jv);
                }
            }
        private:
            void _indent()
            {
                for (size_t i = 0; i < depth; ++i)
                    os << "  ";
            }

            template<typename C, typename F>
            void _write_items(const C &items, const char open, const char close, const F &write_item)
            {
                os << open;
                if (!items.empty()) {
                    ++depth;
                    bool first = true;
                    for (const auto &item: items) {
                        os << (first ? "\n" : ",\n");
                        first = false;
                        _indent();
                        write_item(item);
                    }
                    --depth;
                    os << '\n';
                    _indent();
                }
                os << close;
            }
        };
    }

    object canonical(const object &obj)
    {
        std::vector<const key_value_pair *> members {};
        members.reserve(obj.size());
        for (const auto &kv: obj)
            members.emplace_back(&kv);
        std::sort(members.begin(), members.end(), [](const auto *l, const auto *r) { return l->key() < r->key(); });
        object res(obj.size());
        for (const auto *kv: members)
            res.emplace(kv->key(), canonical(kv->value()));
        return res;
    }

    value canonical(const value &jv)
    {
        if (const auto *obj = jv.if_object())
            return canonical(*obj);
        if (const auto *arr = jv.if_array()) {
            array res {};
            res.reserve(arr->size());
            for (const auto &item: *arr)
                res.emplace_back(canonical(item));
            return res;
        }
        return jv;
    }

    std::string serialize_canon(const value &jv)
    {
        return serialize(canonical(jv));
    }

    value parse(const std::string_view text)
    {
        return boost::json::parse(text);
    }

    value load(const std::string &path)
    {
        try {
            return parse(file::read(path));
        } catch (const std::exception &ex) {
            throw error(fmt::format("invalid JSON in {}", path), ex);
        }
    }

    void save_pretty(std::ostream &os, const value &jv)
    {
        pretty_writer { os }.write(jv);
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }
}
