/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::prove {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "prove";
            cmd.desc = "Print the Merkle inclusion proof of <record-id> in <checkpoint-id>";
            cmd.args.expect({ "<checkpoint-id>", "<record-id>" });
            add_config_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            const auto proof = l->prove(args.at(0), args.at(1));
            if (!proof) [[unlikely]]
                throw error(fmt::format("record {} is not covered by checkpoint {}", args.at(1), args.at(0)));
            const auto cp = l->checkpoint(args.at(0)).value();
            const auto recs = l->fetch_chain(cp.anchor_id, storage::range_t { args.at(1), args.at(1) });
            print_json(codec::json::object {
                { "checkpoint_id", cp.id },
                { "record_id", args.at(1) },
                { "leaf", to_hex(recs.at(0).hash) },
                { "merkle_root", to_hex(cp.merkle_root) },
                { "proof", proof->to_json() }
            });
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
