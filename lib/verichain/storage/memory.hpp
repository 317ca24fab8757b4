#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "backend.hpp"

namespace verichain::storage::memory {
    // Volatile in-process storage. Nothing survives a restart.
    struct backend_t: storage::backend_t {
        explicit backend_t();
        ~backend_t() override;

        // Makes an anchor without records continue from the given tail: its first record must link to tail.hash.
        // Ignored when the anchor already has records.
        void seed(std::string_view anchor_id, const tail_t &tail);

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
        [[nodiscard]] ledger::hash_t base(std::string_view anchor_id) const override;

        using storage::backend_t::fetch;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
