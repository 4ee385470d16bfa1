#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace scoredb::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(std::string desc_):
            desc { std::move(desc_) }
        {
        }

        option_config(std::string desc_, std::string default_value_):
            desc { std::move(desc_) },
            default_value { std::move(default_value_) }
        {
        }
    };
    using option_config_map = std::map<std::string, option_config>;

    // Positional argument names: "[<name>]" marks an optional one, "..." an unbounded tail.
    struct arguments_config {
        void expect(std::initializer_list<std::string> names);
        void validate(const arguments &args) const;

        [[nodiscard]] const std::vector<std::string> &names() const noexcept
        {
            return _names;
        }
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        size_t _max = 0;
    };

    struct config {
        std::string name {};
        std::string desc {};
        arguments_config args {};
        option_config_map opts {};
    };

    struct parsed_command_line {
        arguments args {};
        options opts {};
    };

    // Accepts --name=value, --name value and bare --name options. Unknown options raise an error.
    // Options not given on the command line receive their configured defaults.
    extern parsed_command_line parse(const config &cfg, const std::vector<std::string> &argv);

    struct command {
        using ptr_type = std::shared_ptr<command>;

        static ptr_type reg(ptr_type cmd);
        static const std::map<std::string, ptr_type> &registry();

        virtual ~command() = default;
        virtual void configure(config &cmd) const = 0;
        virtual void run(const arguments &args, const options &opts) const = 0;
    };

    extern int run(int argc, const char **argv);
}
