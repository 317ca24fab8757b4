/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::import_chains {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "import";
            cmd.desc = "Append the records of a JSON Lines file written by export to the ledger";
            cmd.args.expect({ "<path>" });
            add_config_option(cmd);
            cmd.opts.try_emplace("verify", "verify every imported chain before storing anything", "true");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto verify = opt_value(opts, "verify").value_or("true");
            if (verify != "true" && verify != "false") [[unlikely]]
                throw error(fmt::format("--verify must be true or false but got '{}'", verify));
            const auto l = open_ledger(opts);
            const auto res = l->import_jsonl(args.at(0), verify == "true");
            print_json(codec::json::object { { "records", res.records }, { "anchors", res.anchors } });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
