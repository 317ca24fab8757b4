#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <vector>
#include "record.hpp"

namespace verichain::ledger::test {
    // Produces correctly linked and hashed records for backend and verifier tests.
    struct record_factory_t {
        crypto::hasher_t hasher {};

        record_t make(const std::string_view anchor_id, const hash_t &prev_hash, codec::json::object payload,
            const record_kind_t kind=core_kind_t::create, const std::string_view slot="slot-1")
        {
            record_t rec {};
            rec.id = _ids.next();
            rec.anchor_id = anchor_id;
            rec.slot = slot;
            rec.kind = kind;
            rec.ts = ++_ts;
            rec.prev_hash = prev_hash;
            rec.payload = std::move(payload);
            rec.producer = slot;
            rec.hash = compute_hash(rec, hasher);
            return rec;
        }

        // A correctly linked record whose id sorts before every generated one.
        record_t make_stale_id(const std::string_view anchor_id, const hash_t &prev_hash, codec::json::object payload)
        {
            auto rec = make(anchor_id, prev_hash, std::move(payload), core_kind_t::update);
            rec.id = "00000000-0000-7000-8000-000000000000";
            return rec;
        }

        std::vector<record_t> make_chain(const std::string_view anchor_id, const size_t n, const hash_t &base=genesis_hash)
        {
            std::vector<record_t> res {};
            auto prev = base;
            for (size_t i = 0; i < n; ++i) {
                auto &rec = res.emplace_back(make(anchor_id, prev, codec::json::object { { "v", i } },
                    i == 0 ? core_kind_t::create : core_kind_t::update));
                prev = rec.hash;
            }
            return res;
        }
    private:
        record_id_generator_t _ids {};
        timestamp_t _ts = 1'700'000'000'000'000;
    };
}
