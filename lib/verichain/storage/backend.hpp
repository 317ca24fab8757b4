#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <verichain/ledger/record.hpp>

namespace verichain::storage {
    // The storage is unreachable, timed out or failed at the I/O level. Triggers the fallback to the volatile backend.
    struct backend_unavailable_error: error {
        using error::error;
        explicit backend_unavailable_error(std::string_view msg, const std::exception &ex): error { msg, ex } {}
    };

    struct tail_t {
        ledger::record_id_t id {};
        ledger::hash_t hash {};
        uint64_t length = 0;

        bool operator==(const tail_t &o) const =default;
    };

    // inclusive record-id bounds
    struct range_t {
        std::optional<ledger::record_id_t> from {};
        std::optional<ledger::record_id_t> to {};

        [[nodiscard]] bool contains(const ledger::record_id_t &id) const noexcept
        {
            return (!from || id >= *from) && (!to || id <= *to);
        }
    };

    struct search_filter_t {
        std::optional<std::string> anchor_id {};
        std::optional<std::string> slot {};
        std::optional<std::string> kind {};
        std::optional<ledger::timestamp_t> since {};
        size_t limit = 100;

        [[nodiscard]] bool matches(const ledger::record_t &rec) const
        {
            return (!anchor_id || rec.anchor_id == *anchor_id)
                && (!slot || rec.slot == *slot)
                && (!kind || rec.kind.name() == *kind)
                && (!since || rec.ts >= *since);
        }
    };

    struct backend_stats_t {
        uint64_t records = 0;
        uint64_t anchors = 0;
        uint64_t checkpoints = 0;
    };

    using record_observer_t = std::function<void(ledger::record_t)>;

    struct backend_t {
        virtual ~backend_t() =default;
        [[nodiscard]] virtual std::string name() const =0;
        // Stores rec only if the anchor's current tail hash equals rec.prev_hash, or the anchor's base when it has no records,
        // and rec.id sorts after the tail's id. Returns false and stores nothing otherwise. The write is atomic.
        [[nodiscard]] virtual bool append(const ledger::record_t &rec) =0;
        [[nodiscard]] virtual std::optional<tail_t> tail(std::string_view anchor_id) const =0;
        // Streams the records of one anchor within the range in ascending record-id order.
        virtual void fetch(std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const =0;
        // Matching records, most recent first.
        [[nodiscard]] virtual std::vector<ledger::record_t> search(const search_filter_t &filter) const =0;
        [[nodiscard]] virtual std::vector<std::string> anchors() const =0;
        virtual void put_checkpoint(const ledger::checkpoint_t &cp) =0;
        [[nodiscard]] virtual std::optional<ledger::checkpoint_t> checkpoint(std::string_view id) const =0;
        // The checkpoints of one anchor in creation order.
        [[nodiscard]] virtual std::vector<ledger::checkpoint_t> checkpoints(std::string_view anchor_id) const =0;
        [[nodiscard]] virtual backend_stats_t stats() const =0;

        // The hash the first stored record of the anchor links to.
        [[nodiscard]] virtual ledger::hash_t base(std::string_view /*anchor_id*/) const
        {
            return ledger::genesis_hash;
        }

        [[nodiscard]] std::vector<ledger::record_t> fetch(const std::string_view anchor_id, const range_t &range={}) const
        {
            std::vector<ledger::record_t> res {};
            fetch(anchor_id, range, [&](auto rec) {
                res.emplace_back(std::move(rec));
            });
            return res;
        }
    };
    using backend_ptr_t = std::shared_ptr<backend_t>;

    struct durable_config_t {
        std::string dsn = "sqlite:./data/ledger.db";
        size_t pool_size = 5;
        std::chrono::milliseconds op_timeout { 30'000 };
    };

    // Opens the durable backend named by the scheme of the connection string: "sqlite:<path>" or "lmdb:<dir>".
    extern backend_ptr_t open_durable(const durable_config_t &cfg);
}
