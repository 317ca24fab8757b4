/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::stats {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "stats";
            cmd.desc = "Print the record, anchor and checkpoint counts of the ledger";
            cmd.args.expect({});
            add_config_option(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            print_json(l->stats().to_json());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
