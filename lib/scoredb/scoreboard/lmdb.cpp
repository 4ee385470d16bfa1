/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

extern "C" {
    #include <lmdb.h>
}

#include <filesystem>
#include <map>
#include <mutex>
#include <scoredb/common/logger.hpp>
#include <scoredb/common/numeric-cast.hpp>
#include "lmdb.hpp"

namespace scoredb::scoreboard::lmdb {
    /*
     * Tables are kept in a single LMDB database: the key is the table name and the value is
     * the table's counters ordered by entry name, each encoded as
     * <u32 LE entry size> <entry bytes> <i64 LE value>.
     * Entry names are not used as LMDB keys since they can be far longer than LMDB's key size limit.
     */
    struct backend_t::impl {
        explicit impl(const std::string_view dir_path, limits_t limits):
            _dir_path { dir_path },
            _limits { std::move(limits) }
        {
            std::filesystem::create_directories(_dir_path);
            _throw_lmdb(mdb_env_create(&_env), "env_create");
            try {
                _throw_lmdb(mdb_env_set_maxdbs(_env, 1), "env_set_maxdbs");
                _throw_lmdb(mdb_env_set_mapsize(_env, 1ULL << 30U), "env_set_mapsize");
                _throw_lmdb(mdb_env_open(_env, _dir_path.c_str(), 0, 0664), "env_open");
                txn_t txn { _env, 0 };
                _throw_lmdb(mdb_dbi_open(txn.ptr, "scoreboard.tables", MDB_CREATE, &_dbi_tables), "dbi_open(tables)");
                txn.commit();
            } catch (...) {
                mdb_env_close(_env);
                _env = nullptr;
                throw;
            }
            _max_key_size = static_cast<size_t>(mdb_env_get_maxkeysize(_env));
            logger::debug("scoreboard::lmdb: opened {}", _dir_path);
        }

        ~impl()
        {
            if (_env) {
                mdb_dbi_close(_env, _dbi_tables);
                mdb_env_close(_env);
                _env = nullptr;
            }
        }

        impl(impl&&) = delete;
        impl& operator=(impl&&) = delete;
        impl(const impl&) = delete;
        impl& operator=(const impl&) = delete;

        bool create_table(const std::string_view name)
        {
            validate_name("table", name, _limits);
            if (name.size() > _max_key_size) [[unlikely]]
                throw error(fmt::format("scoreboard::lmdb: table name of {} bytes exceeds LMDB's key limit of {}", name.size(), _max_key_size));
            std::lock_guard<std::mutex> _g { _write_mutex };
            txn_t txn { _env, 0 };
            if (_get_table(txn, name))
                return false;
            _put_table(txn, name, {});
            txn.commit();
            return true;
        }

        bool drop_table(const std::string_view name)
        {
            if (name.empty() || name.size() > _max_key_size)
                return false;
            std::lock_guard<std::mutex> _g { _write_mutex };
            txn_t txn { _env, 0 };
            MDB_val k = _to_mdb_val(name);
            const auto rc = mdb_del(txn.ptr, _dbi_tables, &k, nullptr);
            if (rc == MDB_NOTFOUND)
                return false;
            _throw_lmdb(rc, "del(tables)");
            txn.commit();
            return true;
        }

        void set_counter(const std::string_view table, const std::string_view entry, const int64_t value)
        {
            _update_counter(table, entry, [&](counter_map_t &counters) {
                counters.insert_or_assign(std::string { entry }, value);
            });
        }

        void add_counter(const std::string_view table, const std::string_view entry, const int64_t delta)
        {
            _update_counter(table, entry, [&](counter_map_t &counters) {
                auto [it, created] = counters.try_emplace(std::string { entry }, delta);
                if (!created)
                    it->second += delta;
            });
        }

        std::string list_all() const
        {
            std::string out {};
            txn_t txn { _env, MDB_RDONLY };
            cursor_t cur { txn, _dbi_tables };
            MDB_val k {}, v {};
            auto rc = mdb_cursor_get(cur.ptr, &k, &v, MDB_FIRST);
            while (rc == MDB_SUCCESS) {
                const std::string_view table { static_cast<const char *>(k.mv_data), k.mv_size };
                for (const auto &[entry, value]: _decode_counters(table, v))
                    append_listing_line(out, table, entry, value);
                rc = mdb_cursor_get(cur.ptr, &k, &v, MDB_NEXT);
            }
            if (rc != MDB_NOTFOUND)
                _throw_lmdb(rc, "cursor_get(tables)");
            return out;
        }

        std::optional<int64_t> test_counter(const std::string_view table, const std::string_view entry,
            const bound_t min, const bound_t max) const
        {
            txn_t txn { _env, MDB_RDONLY };
            const auto counters = _get_table(txn, table);
            if (!counters) [[unlikely]]
                throw error(fmt::format("scoreboard::lmdb: no table with name '{}'", table));
            const auto it = counters->find(entry);
            if (it == counters->end() || !in_bounds(it->second, min, max))
                return {};
            return it->second;
        }

        bool has_table(const std::string_view name) const
        {
            if (name.empty() || name.size() > _max_key_size)
                return false;
            txn_t txn { _env, MDB_RDONLY };
            return _get_table(txn, name).has_value();
        }
    private:
        using counter_map_t = std::map<std::string, int64_t, std::less<>>;

        // Aborts the transaction unless it has been committed.
        struct txn_t {
            MDB_txn *ptr = nullptr;

            txn_t(MDB_env *env, const unsigned flags)
            {
                _throw_lmdb(mdb_txn_begin(env, nullptr, flags, &ptr), "txn_begin");
            }

            ~txn_t()
            {
                if (ptr)
                    mdb_txn_abort(ptr);
            }

            txn_t(const txn_t &) = delete;
            txn_t &operator=(const txn_t &) = delete;

            void commit()
            {
                auto *p = ptr;
                ptr = nullptr;
                _throw_lmdb(mdb_txn_commit(p), "txn_commit");
            }
        };

        struct cursor_t {
            MDB_cursor *ptr = nullptr;

            cursor_t(const txn_t &txn, const MDB_dbi dbi)
            {
                _throw_lmdb(mdb_cursor_open(txn.ptr, dbi, &ptr), "cursor_open");
            }

            ~cursor_t()
            {
                mdb_cursor_close(ptr);
            }

            cursor_t(const cursor_t &) = delete;
            cursor_t &operator=(const cursor_t &) = delete;
        };

        std::string _dir_path;
        limits_t _limits;
        MDB_env *_env { nullptr };
        MDB_dbi _dbi_tables { 0 };
        size_t _max_key_size = 0;
        std::mutex _write_mutex {};

        static void _throw_lmdb(const int rc, const char *what)
        {
            if (rc == MDB_SUCCESS) [[likely]]
                return;
            throw error(fmt::format("scoreboard::lmdb: {}: {}", what, mdb_strerror(rc)));
        }

        static MDB_val _to_mdb_val(const std::string_view s)
        {
            MDB_val v {};
            v.mv_size = s.size();
            v.mv_data = const_cast<char *>(s.data());
            return v;
        }

        static uint64_t _load_le(const char *p, const size_t num_bytes)
        {
            uint64_t x = 0;
            for (size_t i = 0; i < num_bytes; ++i)
                x |= static_cast<uint64_t>(static_cast<uint8_t>(p[i])) << (8U * i);
            return x;
        }

        static void _store_le(std::string &out, const uint64_t x, const size_t num_bytes)
        {
            for (size_t i = 0; i < num_bytes; ++i)
                out.push_back(static_cast<char>((x >> (8U * i)) & 0xFFU));
        }

        static std::string _encode_counters(const counter_map_t &counters)
        {
            std::string out {};
            for (const auto &[entry, value]: counters) {
                _store_le(out, numeric_cast<uint32_t>(entry.size()), sizeof(uint32_t));
                out.append(entry);
                _store_le(out, static_cast<uint64_t>(value), sizeof(uint64_t));
            }
            return out;
        }

        static counter_map_t _decode_counters(const std::string_view table, const MDB_val &v)
        {
            const std::string_view data { static_cast<const char *>(v.mv_data), v.mv_size };
            counter_map_t counters {};
            size_t pos = 0;
            while (pos < data.size()) {
                if (data.size() - pos < sizeof(uint32_t)) [[unlikely]]
                    throw error(fmt::format("scoreboard::lmdb: truncated counters of table '{}'", table));
                const auto entry_size = _load_le(data.data() + pos, sizeof(uint32_t));
                pos += sizeof(uint32_t);
                if (data.size() - pos < entry_size + sizeof(uint64_t)) [[unlikely]]
                    throw error(fmt::format("scoreboard::lmdb: truncated counters of table '{}'", table));
                const auto entry = data.substr(pos, entry_size);
                pos += entry_size;
                const auto value = static_cast<int64_t>(_load_le(data.data() + pos, sizeof(uint64_t)));
                pos += sizeof(uint64_t);
                counters.insert_or_assign(std::string { entry }, value);
            }
            return counters;
        }

        std::optional<counter_map_t> _get_table(const txn_t &txn, const std::string_view name) const
        {
            MDB_val k = _to_mdb_val(name);
            MDB_val v {};
            const auto rc = mdb_get(txn.ptr, _dbi_tables, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            _throw_lmdb(rc, "get(tables)");
            return _decode_counters(name, v);
        }

        void _put_table(const txn_t &txn, const std::string_view name, const counter_map_t &counters)
        {
            const auto data = _encode_counters(counters);
            MDB_val k = _to_mdb_val(name);
            MDB_val v = _to_mdb_val(data);
            _throw_lmdb(mdb_put(txn.ptr, _dbi_tables, &k, &v, 0), "put(tables)");
        }

        template<typename F>
        void _update_counter(const std::string_view table, const std::string_view entry, const F &update)
        {
            validate_name("entry", entry, _limits);
            if (table.empty() || table.size() > _max_key_size) [[unlikely]]
                throw error(fmt::format("scoreboard::lmdb: no table with name '{}'", table));
            std::lock_guard<std::mutex> _g { _write_mutex };
            txn_t txn { _env, 0 };
            auto counters = _get_table(txn, table);
            if (!counters) [[unlikely]]
                throw error(fmt::format("scoreboard::lmdb: no table with name '{}'", table));
            update(*counters);
            _put_table(txn, table, *counters);
            txn.commit();
        }
    };

    backend_t::backend_t(const std::string_view dir_path, limits_t limits):
        _impl { std::make_unique<impl>(dir_path, std::move(limits)) }
    {
    }

    backend_t::~backend_t() = default;

    bool backend_t::create_table(const std::string_view name)
    {
        return _impl->create_table(name);
    }

    bool backend_t::drop_table(const std::string_view name)
    {
        return _impl->drop_table(name);
    }

    void backend_t::set_counter(const std::string_view table, const std::string_view entry, const int64_t value)
    {
        _impl->set_counter(table, entry, value);
    }

    void backend_t::add_counter(const std::string_view table, const std::string_view entry, const int64_t delta)
    {
        _impl->add_counter(table, entry, delta);
    }

    std::string backend_t::list_all() const
    {
        return _impl->list_all();
    }

    std::optional<int64_t> backend_t::test_counter(const std::string_view table, const std::string_view entry,
        const bound_t min, const bound_t max) const
    {
        return _impl->test_counter(table, entry, min, max);
    }

    bool backend_t::has_table(const std::string_view name) const
    {
        return _impl->has_table(name);
    }
}
