/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include "common.hpp"

namespace verichain::cli::fetch {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "fetch";
            cmd.desc = "Print the records of the chain of <anchor-id> as JSON Lines in chain order";
            cmd.args.expect({ "<anchor-id>" });
            add_config_option(cmd);
            cmd.opts.try_emplace("from", "the first record id to print");
            cmd.opts.try_emplace("to", "the last record id to print");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            const storage::range_t range { opt_value(opts, "from"), opt_value(opts, "to") };
            uint64_t num_records = 0;
            l->fetch_chain(args.at(0), range, [&](const auto &rec) {
                std::cout << codec::json::serialize(rec.to_json()) << '\n';
                ++num_records;
            });
            logger::info("fetched {} records of {}", num_records, args.at(0));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
