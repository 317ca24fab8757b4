/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <iostream>
#include "common.hpp"

namespace verichain::cli::metrics {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "metrics";
            cmd.desc = "Verify all chains and print the metrics in the Prometheus text exposition format";
            cmd.args.expect({});
            add_config_option(cmd);
        }

        void run(const arguments &, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            // the metrics belong to this process, so the gauges are filled by verifying every chain
            for (const auto &anchor_id: l->anchors())
                static_cast<void>(l->verify(anchor_id));
            std::cout << l->metrics().render();
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
