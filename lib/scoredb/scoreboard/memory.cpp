/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include "memory.hpp"

namespace scoredb::scoreboard::memory {
    struct backend_t::impl {
        explicit impl(limits_t limits):
            _limits { std::move(limits) }
        {
        }

        bool create_table(const std::string_view name)
        {
            validate_name("table", name, _limits);
            const auto [it, created] = _tables.try_emplace(std::string { name });
            return created;
        }

        bool drop_table(const std::string_view name)
        {
            const auto it = _tables.find(name);
            if (it == _tables.end())
                return false;
            _tables.erase(it);
            return true;
        }

        void set_counter(const std::string_view table, const std::string_view entry, const int64_t value)
        {
            validate_name("entry", entry, _limits);
            _table(table).insert_or_assign(std::string { entry }, value);
        }

        void add_counter(const std::string_view table, const std::string_view entry, const int64_t delta)
        {
            validate_name("entry", entry, _limits);
            auto [it, created] = _table(table).try_emplace(std::string { entry }, delta);
            if (!created)
                it->second += delta;
        }

        std::string list_all() const
        {
            std::string out {};
            for (const auto &[table, counters]: _tables) {
                for (const auto &[entry, value]: counters)
                    append_listing_line(out, table, entry, value);
            }
            return out;
        }

        std::optional<int64_t> test_counter(const std::string_view table, const std::string_view entry,
            const bound_t min, const bound_t max) const
        {
            const auto &counters = _table(table);
            const auto it = counters.find(entry);
            if (it == counters.end() || !in_bounds(it->second, min, max))
                return {};
            return it->second;
        }

        bool has_table(const std::string_view name) const
        {
            return _tables.contains(name);
        }

        std::vector<std::string> tables() const
        {
            std::vector<std::string> names {};
            names.reserve(_tables.size());
            for (const auto &[name, counters]: _tables)
                names.emplace_back(name);
            return names;
        }
    private:
        using counter_map_t = std::map<std::string, int64_t, std::less<>>;
        using table_map_t = std::map<std::string, counter_map_t, std::less<>>;

        limits_t _limits;
        table_map_t _tables {};

        // works for both const and mutable table maps
        template<typename M>
        static auto &_find_table(M &tables, const std::string_view name)
        {
            const auto it = tables.find(name);
            if (it == tables.end()) [[unlikely]]
                throw error(fmt::format("scoreboard: no table with name '{}'", name));
            return it->second;
        }

        counter_map_t &_table(const std::string_view name)
        {
            return _find_table(_tables, name);
        }

        const counter_map_t &_table(const std::string_view name) const
        {
            return _find_table(_tables, name);
        }
    };

    backend_t::backend_t(limits_t limits):
        _impl { std::make_unique<impl>(std::move(limits)) }
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

    std::vector<std::string> backend_t::tables() const
    {
        return _impl->tables();
    }
}
