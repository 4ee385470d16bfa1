/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include "cli.hpp"

namespace scoredb::cli {
    void arguments_config::expect(const std::initializer_list<std::string> names)
    {
        _names = names;
        _min = 0;
        _max = 0;
        for (const auto &n: _names) {
            if (n.find("...") != std::string::npos) {
                _max = std::numeric_limits<size_t>::max();
            } else {
                if (!n.starts_with('['))
                    ++_min;
                if (_max != std::numeric_limits<size_t>::max())
                    ++_max;
            }
        }
    }

    void arguments_config::validate(const arguments &args) const
    {
        if (args.size() < _min || args.size() > _max) [[unlikely]]
            throw error(fmt::format("expected {} arguments: {} but got {}", _min == _max ? fmt::format("{}", _min) : fmt::format("at least {}", _min),
                fmt::join(_names, " "), args.size()));
    }

    parsed_command_line parse(const config &cfg, const std::vector<std::string> &argv)
    {
        parsed_command_line res {};
        for (size_t i = 0; i < argv.size(); ++i) {
            const std::string_view arg { argv[i] };
            if (!arg.starts_with("--")) {
                res.args.emplace_back(arg);
                continue;
            }
            auto name = arg.substr(2);
            std::optional<std::string> val {};
            if (const auto eq_pos = name.find('='); eq_pos != std::string_view::npos) {
                val.emplace(name.substr(eq_pos + 1));
                name = name.substr(0, eq_pos);
            } else if (i + 1 < argv.size() && !std::string_view { argv[i + 1] }.starts_with("--")) {
                val.emplace(argv[++i]);
            }
            if (!cfg.opts.contains(std::string { name })) [[unlikely]]
                throw error(fmt::format("command {} does not support option --{}", cfg.name, name));
            res.opts.insert_or_assign(std::string { name }, std::move(val));
        }
        for (const auto &[name, opt]: cfg.opts) {
            if (!res.opts.contains(name) && opt.default_value)
                res.opts.try_emplace(name, opt.default_value);
        }
        cfg.args.validate(res.args);
        return res;
    }

    static std::map<std::string, command::ptr_type> &_registry()
    {
        static std::map<std::string, command::ptr_type> reg {};
        return reg;
    }

    command::ptr_type command::reg(ptr_type cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        const auto [it, created] = _registry().try_emplace(cfg.name, cmd);
        if (!created) [[unlikely]]
            throw error(fmt::format("a command with name {} has already been registered!", cfg.name));
        return cmd;
    }

    const std::map<std::string, command::ptr_type> &command::registry()
    {
        return _registry();
    }

    static void print_usage(const std::string_view prog)
    {
        logger::info("usage: {} <command> [<options>] [<arguments>]", prog);
        for (const auto &[name, cmd]: command::registry()) {
            config cfg {};
            cmd->configure(cfg);
            logger::info("  {} {}: {}", name, fmt::join(cfg.args.names(), " "), cfg.desc);
            for (const auto &[opt_name, opt]: cfg.opts) {
                if (opt.default_value)
                    logger::info("    --{}: {} (default: {})", opt_name, opt.desc, *opt.default_value);
                else
                    logger::info("    --{}: {}", opt_name, opt.desc);
            }
        }
    }

    int run(const int argc, const char **argv)
    {
        const std::string_view prog { argc > 0 ? argv[0] : "scoredb" };
        if (argc < 2) {
            print_usage(prog);
            return 1;
        }
        const std::string cmd_name { argv[1] };
        const auto it = command::registry().find(cmd_name);
        if (it == command::registry().end()) {
            logger::error("unknown command: '{}'", cmd_name);
            print_usage(prog);
            return 1;
        }
        config cfg {};
        it->second->configure(cfg);
        const auto ex = logger::run_log_errors([&] {
            const auto cmd_line = parse(cfg, std::vector<std::string> { argv + 2, argv + argc });
            it->second->run(cmd_line.args, cmd_line.opts);
        });
        return ex ? 1 : 0;
    }
}
