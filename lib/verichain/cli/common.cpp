/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <charconv>
#include <cstdlib>
#include <iostream>
#include "common.hpp"

namespace verichain::cli {
    void add_config_option(config &cmd)
    {
        cmd.opts.try_emplace("config", "a JSON configuration file, VERICHAIN_CONFIG when not given");
    }

    std::optional<std::string> opt_value(const options &opts, const std::string &name)
    {
        if (const auto it = opts.find(name); it != opts.end())
            return it->second;
        return {};
    }

    ledger::config_t load_config(const options &opts)
    {
        auto path = opt_value(opts, "config");
        if (!path) {
            if (const char *env_path = std::getenv("VERICHAIN_CONFIG"); env_path && *env_path)
                path.emplace(env_path);
        }
        if (!path) {
            logger::info("no configuration given, using the defaults with the volatile backend");
            return {};
        }
        logger::debug("loading the configuration from {}", *path);
        return ledger::config_t::load(*path);
    }

    std::unique_ptr<ledger::ledger_t> open_ledger(const options &opts)
    {
        return std::make_unique<ledger::ledger_t>(load_config(opts));
    }

    uint64_t parse_uint(const std::string_view text, const std::string_view what)
    {
        uint64_t val = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);
        if (ec != std::errc {} || ptr != text.data() + text.size()) [[unlikely]]
            throw error(fmt::format("{} must be a non-negative integer but got '{}'", what, text));
        return val;
    }

    void print_json(const codec::json::value &jv)
    {
        std::cout << codec::json::serialize_pretty(jv) << '\n';
    }
}
