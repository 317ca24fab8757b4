#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "backend.hpp"

namespace verichain::storage::sqlite {
    /*
     * Durable storage in a single SQLite 3 database file.
     * Operations borrow a connection from a fixed-size pool and are bounded by op_timeout:
     * both the wait for a free connection and the execution of every statement.
     * Several processes may share the same file: appends are compare-and-append within BEGIN IMMEDIATE transactions.
     */
    struct backend_t: storage::backend_t {
        explicit backend_t(const std::string &path, size_t pool_size=5, std::chrono::milliseconds op_timeout=std::chrono::seconds { 30 });
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

        // Runs a raw SQL statement. Meant for maintenance and for tests that need to tamper with the stored data.
        void exec(const std::string &sql);

        using storage::backend_t::fetch;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
