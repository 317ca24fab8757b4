/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::verify {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "verify";
            cmd.desc = "Verify the chains of the given anchors or of all anchors and print their reports";
            cmd.args.expect({ "[<anchor-id> ...]" });
            add_config_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            const auto anchors = args.empty() ? l->anchors() : args;
            size_t num_failed = 0;
            for (const auto &anchor_id: anchors) {
                const auto rep = l->verify(anchor_id);
                print_json(rep.to_json());
                if (rep.result == ledger::verify_result_t::fail)
                    ++num_failed;
            }
            if (num_failed) [[unlikely]]
                throw error(fmt::format("{} of {} chains failed verification", num_failed, anchors.size()));
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
