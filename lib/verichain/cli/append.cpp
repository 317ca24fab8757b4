/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/codec/canonical.hpp>
#include <verichain/common/numeric-cast.hpp>
#include "common.hpp"

namespace verichain::cli::append {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "append";
            cmd.desc = "Append a record with a JSON object <payload> of the given <kind> to the chain of <anchor-id>";
            cmd.args.expect({ "<anchor-id>", "<kind>", "<payload>" });
            add_config_option(cmd);
            cmd.opts.try_emplace("slot", "the producing slot", "cli");
            cmd.opts.try_emplace("producer", "the producer name, the slot when not given");
            cmd.opts.try_emplace("ts", "the record timestamp in microseconds since the Unix epoch, now when not given");
            cmd.opts.try_emplace("sign-seed", "a hex ed25519 seed to sign the payload with");
            cmd.opts.try_emplace("key-ref", "the key reference recorded with the signature", "cli");
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto l = open_ledger(opts);
            const auto payload = codec::json::parse(args.at(2));
            if (!payload.is_object()) [[unlikely]]
                throw error("the payload must be a JSON object");
            ledger::kind_registry_t kinds { l->config().kinds };
            ledger::draft_t draft {
                args.at(0),
                opt_value(opts, "slot").value_or("cli"),
                kinds.parse(args.at(1)),
                0,
                payload.get_object()
            };
            if (const auto ts = opt_value(opts, "ts"))
                draft.ts = numeric_cast<ledger::timestamp_t>(parse_uint(*ts, "--ts"));
            if (const auto producer = opt_value(opts, "producer"))
                draft.producer = *producer;
            if (const auto seed = opt_value(opts, "sign-seed")) {
                const ledger::ed25519_signer_t signer { crypto::ed25519::seed_t::from_hex(*seed), opt_value(opts, "key-ref").value_or("cli") };
                draft.sig = signer.sign(codec::canonical::encode(draft.payload));
            }
            const auto rec = l->append(draft);
            print_json(rec.to_json());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
