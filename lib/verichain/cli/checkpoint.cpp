/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "common.hpp"

namespace verichain::cli::checkpoint {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "checkpoint";
            cmd.desc = "build <anchor-id>: batch the pending records into a checkpoint, latest|list <anchor-id>: show checkpoints,"
                " verify <checkpoint-id>: recompute the root and check the signature of a checkpoint";
            cmd.args.expect({ "<action>", "<id>" });
            add_config_option(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            const auto &action = args.at(0);
            const auto &id = args.at(1);
            if (action == "build") {
                if (const auto cp = l->build_checkpoint(id); cp)
                    print_json(cp->to_json());
                else
                    logger::info("the chain of {} has no records after its last checkpoint", id);
            } else if (action == "latest") {
                const auto cp = l->latest_checkpoint(id);
                if (!cp) [[unlikely]]
                    throw error(fmt::format("the chain of {} has no checkpoints", id));
                print_json(cp->to_json());
            } else if (action == "list") {
                codec::json::array cps {};
                for (const auto &cp: l->checkpoints(id))
                    cps.emplace_back(cp.to_json());
                print_json(cps);
            } else if (action == "verify") {
                const auto check = l->verify_checkpoint(id);
                print_json(check.to_json());
                if (!check.valid()) [[unlikely]]
                    throw error(fmt::format("checkpoint {} does not verify", id));
            } else {
                throw error(fmt::format("unsupported checkpoint action: '{}'", action));
            }
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
