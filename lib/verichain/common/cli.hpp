#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"
#include "logger.hpp"

namespace verichain::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct argument_config {
        // Names in square brackets are optional, a trailing "..." allows any number of extra arguments.
        void expect(const std::initializer_list<std::string> names);
        void validate(const arguments &args) const;

        [[nodiscard]] const std::vector<std::string> &names() const noexcept
        {
            return _names;
        }
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        std::optional<size_t> _max = 0;
    };

    struct option_config {
        std::string desc;
        std::optional<std::string> default_value {};

        option_config(std::string desc_, std::optional<std::string> default_value_={}):
            desc { std::move(desc_) },
            default_value { std::move(default_value_) }
        {
        }
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};

        [[nodiscard]] std::string usage() const;
    };

    struct command {
        using ptr_t = std::shared_ptr<command>;

        static bool reg(const ptr_t &cmd);

        virtual ~command() =default;
        virtual void configure(config &cmd) const =0;

        virtual void run(const arguments &) const
        {
            throw error("this command must override one of the run methods!");
        }

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }
    };

    extern int run(int argc, const char **argv);
}
