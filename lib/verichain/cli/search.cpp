/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include <verichain/common/numeric-cast.hpp>
#include "common.hpp"

namespace verichain::cli::search {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "search";
            cmd.desc = "Print the most recent records matching the filters as JSON Lines";
            cmd.args.expect({});
            add_config_option(cmd);
            cmd.opts.try_emplace("anchor", "the anchor id");
            cmd.opts.try_emplace("slot", "the producing slot");
            cmd.opts.try_emplace("kind", "the record kind");
            cmd.opts.try_emplace("since", "the earliest timestamp in microseconds since the Unix epoch");
            cmd.opts.try_emplace("limit", "the maximum number of records", "100");
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            storage::search_filter_t filter {};
            filter.anchor_id = opt_value(opts, "anchor");
            filter.slot = opt_value(opts, "slot");
            if (const auto kind = opt_value(opts, "kind"))
                filter.kind = std::string { ledger::kind_registry_t { l->config().kinds }.parse(*kind).name() };
            if (const auto since = opt_value(opts, "since"))
                filter.since = numeric_cast<ledger::timestamp_t>(parse_uint(*since, "--since"));
            if (const auto limit = opt_value(opts, "limit"))
                filter.limit = numeric_cast<size_t>(parse_uint(*limit, "--limit"));
            for (const auto &rec: l->search(filter))
                std::cout << codec::json::serialize(rec.to_json()) << '\n';
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
