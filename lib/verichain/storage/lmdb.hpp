#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "backend.hpp"

namespace verichain::storage::lmdb {
    /*
     * Durable storage in an LMDB environment directory.
     * Records are keyed by anchor id and record id, so that a chain is one contiguous key range.
     * Every write is a single write transaction; writers within the process are serialized.
     */
    struct backend_t: storage::backend_t {
        explicit backend_t(std::string_view dir_path, uint64_t map_size=1ULL << 30U);
        ~backend_t() override;

        [[nodiscard]] std::string name() const override;
        [[nodiscard]] bool append(const ledger::record_t &rec) override;
        [[nodiscard]] std::optional<tail_t> tail(std::string_view anchor_id) const override;
        void fetch(std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const override;
        [[nodiscard]] std::vector<ledger::record_t> search(const search_filter_t &filter) const override;
        [[nodiscard]] std::vector<std::string> anchors() const override;
        void put_checkpoint(const ledger::checkpoint_t &cp) override;
        [[nodiscard]] std::optional<ledger::checkpoint_t> checkpoint(std::string_view id) const override;
        [[nodiscard]] std::vector<ledger::checkpoint_t> checkpoints(std::string_view anchor_id) const override;
        [[nodiscard]] backend_stats_t stats() const override;

        using storage::backend_t::fetch;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
