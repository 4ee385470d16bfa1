/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <scoredb/codec/binary-text.hpp>
#include <scoredb/common/logger.hpp>
#include <scoredb/common/numeric-cast.hpp>
#include "db.hpp"

namespace scoredb::db {
    namespace {
        constexpr std::string_view empty_document_text { "{}" };

        chunk_list_t fallback_chunks()
        {
            return { chunk_t { 0, codec::binary_text::encode(empty_document_text) } };
        }

        document_t decode_chunks(const chunk_list_t &chunks)
        {
            std::string text {};
            for (const auto &c: chunks)
                text += codec::binary_text::decode(c.payload);
            return codec::json::parse(text);
        }
    }

    config_t config_t::from_json(const codec::json::value &jv)
    {
        config_t cfg {};
        try {
            const auto &jo = jv.as_object();
            if (const auto *v = jo.if_contains("max_chunk_size"))
                cfg.max_chunk_size = codec::json::value_to<size_t>(*v);
            if (const auto *v = jo.if_contains("save_entry"))
                cfg.save_entry = codec::json::value_to<std::string>(*v);
            if (const auto *v = jo.if_contains("chunk_prefix"))
                cfg.chunk_prefix = codec::json::value_to<std::string>(*v);
        } catch (const std::exception &ex) {
            throw error(fmt::format("db: an invalid config: {}", codec::json::serialize(jv)), ex);
        }
        cfg.validate();
        return cfg;
    }

    void config_t::validate() const
    {
        if (max_chunk_size == 0)
            throw error("db: max_chunk_size must be positive");
        if (save_entry.empty())
            throw error("db: save_entry must not be empty");
        if (chunk_prefix.empty())
            throw error("db: chunk_prefix must not be empty");
    }

    std::optional<std::string_view> find_payload(const std::string_view listing, const std::string_view entry_prefix)
    {
        size_t pos = 0;
        while (pos < listing.size()) {
            const auto eol = listing.find('\n', pos);
            const auto line = listing.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            if (line.size() > entry_prefix.size() && line.starts_with(entry_prefix) && line[entry_prefix.size()] == '(') {
                const auto rest = line.substr(entry_prefix.size() + 1);
                const auto end = rest.find_first_not_of("01 ");
                if (end != std::string_view::npos && rest.substr(end).starts_with("): "))
                    return rest.substr(0, end);
            }
            if (eol == std::string_view::npos)
                break;
            pos = eol + 1;
        }
        return {};
    }

    db_t::db_t(const std::string_view table, scoreboard::backend_ptr_t backend, config_t cfg):
        _table { table },
        _backend { std::move(backend) },
        _cfg { std::move(cfg) }
    {
        if (_table.empty()) [[unlikely]]
            throw error("db: the table name must not be empty");
        if (!_backend) [[unlikely]]
            throw error(fmt::format("db: no backend given for table '{}'", _table));
        _cfg.validate();
        if (const auto num_failures = _build(); num_failures > 0)
            logger::warn("db {}: {} commands failed while building the table", _table, num_failures);
        load();
    }

    std::string db_t::chunk_table_name(const size_t index) const
    {
        return fmt::format("{}{}_{}", _cfg.chunk_prefix, _table, index);
    }

    std::string db_t::chunk_entry_name(const size_t index, const std::string_view payload) const
    {
        return fmt::format("{}({})", chunk_table_name(index), payload);
    }

    document_t db_t::load()
    {
        try {
            auto chunks = _fetch();
            auto doc = decode_chunks(chunks);
            _memory = std::move(chunks);
            return doc;
        } catch (const std::exception &ex) {
            logger::warn("db {}: returning an empty document: {}", _table, ex.what());
        }
        _memory = fallback_chunks();
        return codec::json::object {};
    }

    void db_t::save(const document_t &doc)
    {
        const auto text = codec::json::serialize_canon(doc);
        chunk_list_t chunks {};
        const auto pieces = codec::binary_text::split(text, _cfg.max_chunk_size);
        if (pieces.empty()) {
            chunks = fallback_chunks();
        } else {
            chunks.reserve(pieces.size());
            for (size_t i = 0; i < pieces.size(); ++i)
                chunks.emplace_back(chunk_t { i, codec::binary_text::encode(pieces[i]) });
        }

        size_t num_failures = _wipe();
        for (const auto &c: chunks) {
            const auto table_name = chunk_table_name(c.index);
            if (!_run("create a chunk table", [&] { _backend->create_table(table_name); }))
                ++num_failures;
            if (!_run("update the chunk count", [&] { _backend->set_counter(_table, _cfg.save_entry, numeric_cast<int64_t>(c.index)); }))
                ++num_failures;
            if (!_run("write a chunk", [&] { _backend->set_counter(table_name, chunk_entry_name(c.index, c.payload), 0); }))
                ++num_failures;
        }
        if (num_failures > 0) {
            logger::warn("db {}: {} commands failed while saving; reloading the stored document", _table, num_failures);
            load();
            return;
        }
        logger::debug("db {}: saved {} characters as {} chunks", _table, text.size(), chunks.size());
        _memory = std::move(chunks);
    }

    void db_t::clear()
    {
        save(codec::json::object {});
    }

    std::optional<document_t> db_t::get(const std::string_view key)
    {
        const auto obj = _object();
        if (const auto *v = obj.if_contains(key))
            return *v;
        return {};
    }

    void db_t::set(const std::string_view key, document_t val)
    {
        auto obj = _object();
        obj.insert_or_assign(key, std::move(val));
        save(obj);
    }

    bool db_t::has(const std::string_view key)
    {
        return _object().contains(key);
    }

    bool db_t::erase(const std::string_view key)
    {
        auto obj = _object();
        const bool present = obj.erase(key) > 0;
        save(obj);
        return present;
    }

    std::vector<std::string> db_t::keys()
    {
        std::vector<std::string> res {};
        for (const auto &[k, v]: _object())
            res.emplace_back(k);
        return res;
    }

    std::vector<document_t> db_t::values()
    {
        std::vector<document_t> res {};
        for (auto &&[k, v]: _object())
            res.emplace_back(std::move(v));
        return res;
    }

    codec::json::object db_t::entries()
    {
        return _object();
    }

    size_t db_t::size()
    {
        return _object().size();
    }

    document_t db_t::cached() const
    {
        try {
            return decode_chunks(_memory);
        } catch (const std::exception &ex) {
            logger::warn("db {}: the cached chunks are not decodable: {}", _table, ex.what());
        }
        return codec::json::object {};
    }

    bool db_t::_run(const std::string_view what, const std::function<void()> &action) const
    {
        try {
            action();
            return true;
        } catch (const std::exception &ex) {
            logger::warn("db {}: failed to {}: {}", _table, what, ex.what());
        }
        return false;
    }

    size_t db_t::_build()
    {
        size_t num_failures = 0;
        if (!_run("create the coordination table", [&] { _backend->create_table(_table); }))
            ++num_failures;
        if (!_run("initialize the chunk count", [&] { _backend->add_counter(_table, _cfg.save_entry, 0); }))
            ++num_failures;
        return num_failures;
    }

    size_t db_t::_wipe()
    {
        const auto max_index = _chunk_count().value_or(0);
        size_t num_failures = 0;
        _memory.clear();
        for (size_t i = 0; i <= max_index; ++i) {
            if (!_run("drop a chunk table", [&] { _backend->drop_table(chunk_table_name(i)); }))
                ++num_failures;
        }
        if (!_run("drop the coordination table", [&] { _backend->drop_table(_table); }))
            ++num_failures;
        return num_failures + _build();
    }

    std::optional<size_t> db_t::_chunk_count() const
    {
        try {
            if (const auto count = _backend->test_counter(_table, _cfg.save_entry))
                return numeric_cast<size_t>(*count);
        } catch (const std::exception &ex) {
            logger::warn("db {}: the chunk count is not available: {}", _table, ex.what());
        }
        return {};
    }

    chunk_list_t db_t::_fetch() const
    {
        const auto max_index = _chunk_count();
        if (!max_index)
            throw error("the chunk count record is missing");
        logger::trace("db {}: fetching {} chunks", _table, *max_index + 1);
        const auto listing = _backend->list_all();
        chunk_list_t chunks {};
        for (size_t i = 0; i <= *max_index; ++i) {
            const auto payload = find_payload(listing, chunk_table_name(i));
            if (!payload)
                throw error(fmt::format("chunk #{} is missing", i));
            chunks.emplace_back(chunk_t { i, std::string { *payload } });
        }
        return chunks;
    }

    codec::json::object db_t::_object()
    {
        auto doc = load();
        if (auto *obj = doc.if_object())
            return std::move(*obj);
        logger::warn("db {}: the stored document is a {} and not an object; treating it as empty", _table, codec::json::to_string(doc.kind()));
        return {};
    }
}
