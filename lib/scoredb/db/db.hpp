#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <scoredb/codec/json.hpp>
#include <scoredb/scoreboard/common.hpp>

namespace scoredb::db {
    using document_t = codec::json::value;

    struct config_t {
        // The raw (pre-encoding) size of a chunk. It is a property of the backend,
        // which caps the size of entry names.
        size_t max_chunk_size = 32000;
        // the coordination entry holding the highest valid chunk index
        std::string save_entry = "DB_SAVE";
        std::string chunk_prefix = "DB_";

        // missing fields keep their defaults
        static config_t from_json(const codec::json::value &jv);
        void validate() const;
    };

    struct chunk_t {
        size_t index = 0;
        // binary_text-encoded slice of the serialized document
        std::string payload {};

        bool operator==(const chunk_t &o) const = default;
    };
    using chunk_list_t = std::vector<chunk_t>;

    // Finds the listing line of the entry named "<entry_prefix>(<payload>)" and returns the payload.
    // The payload must consist of '0', '1', and ' ' only, which cannot be mistaken for the name template.
    extern std::optional<std::string_view> find_payload(std::string_view listing, std::string_view entry_prefix);

    /*
     * A JSON document persisted in a scoreboard under a table name T.
     *
     * Layout in the backend:
     * - table T holds the coordination entry config_t::save_entry whose value is the highest chunk index;
     * - table DB_T_<i> holds a single entry named DB_T_<i>(<payload>) for each chunk i.
     *
     * Every mutation reloads the document, changes it in memory, wipes all chunk tables and writes them anew.
     * Read paths never throw on corrupted or missing data and return an empty object instead.
     *
     * N.B. this class assumes a single writer per table: concurrent writers overwrite each other's changes
     * and a reader interleaved with a save may observe an empty document.
     */
    struct db_t {
        db_t(std::string_view table, scoreboard::backend_ptr_t backend, config_t cfg={});

        document_t load();
        void save(const document_t &doc);
        void clear();

        [[nodiscard]] std::optional<document_t> get(std::string_view key);
        void set(std::string_view key, document_t val);
        [[nodiscard]] bool has(std::string_view key);
        // returns whether the key was present
        bool erase(std::string_view key);
        [[nodiscard]] std::vector<std::string> keys();
        [[nodiscard]] std::vector<document_t> values();
        [[nodiscard]] codec::json::object entries();
        [[nodiscard]] size_t size();

        // the document of the last load or save, without a backend round trip
        [[nodiscard]] document_t cached() const;

        [[nodiscard]] const chunk_list_t &chunks() const noexcept
        {
            return _memory;
        }

        [[nodiscard]] const std::string &table() const noexcept
        {
            return _table;
        }

        [[nodiscard]] const config_t &config() const noexcept
        {
            return _cfg;
        }

        [[nodiscard]] std::string chunk_table_name(size_t index) const;
        [[nodiscard]] std::string chunk_entry_name(size_t index, std::string_view payload) const;
    private:
        std::string _table;
        scoreboard::backend_ptr_t _backend;
        config_t _cfg;
        chunk_list_t _memory {};

        bool _run(std::string_view what, const std::function<void()> &action) const;
        size_t _build();
        size_t _wipe();
        [[nodiscard]] std::optional<size_t> _chunk_count() const;
        [[nodiscard]] chunk_list_t _fetch() const;
        [[nodiscard]] codec::json::object _object();
    };
}
