/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::export_chains {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "export";
            cmd.desc = "Write all chains to <path> as JSON Lines, one record per line in chain order";
            cmd.args.expect({ "<path>" });
            add_config_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            l->export_jsonl(args.at(0));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
