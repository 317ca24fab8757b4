#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/cli.hpp>
#include <verichain/ledger/ledger.hpp>

namespace verichain::cli {
    // the option shared by all ledger commands
    extern void add_config_option(config &cmd);
    // --config, then the VERICHAIN_CONFIG environment variable, then the defaults
    extern ledger::config_t load_config(const options &opts);
    extern std::unique_ptr<ledger::ledger_t> open_ledger(const options &opts);
    extern std::optional<std::string> opt_value(const options &opts, const std::string &name);
    extern uint64_t parse_uint(std::string_view text, std::string_view what);
    extern void print_json(const codec::json::value &jv);
}
