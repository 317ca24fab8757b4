#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/storage/fallback.hpp>
#include "checkpoint.hpp"
#include "config.hpp"
#include "metrics.hpp"
#include "verifier.hpp"

namespace verichain::ledger {
    struct anchor_verification_t {
        timestamp_t verified_at = 0;
        std::optional<double> trust_score {};
    };

    struct ledger_stats_t {
        std::string backend {};
        bool degraded = false;
        uint64_t records = 0;
        uint64_t anchors = 0;
        uint64_t checkpoints = 0;
        std::map<std::string, anchor_verification_t> verified {};

        [[nodiscard]] codec::json::object to_json() const;
    };

    struct import_result_t {
        uint64_t records = 0;
        uint64_t anchors = 0;
    };

    /*
     * The ledger of one process: the configured backend, the chain store, the verifier, the checkpoint builder
     * and the metrics of all of them. Created once at startup and passed by reference.
     */
    struct ledger_t {
        // Uses the given backend instead of the configured one when it is not null.
        explicit ledger_t(config_t cfg, storage::backend_ptr_t backend={});
        ~ledger_t();

        ledger_t(const ledger_t &) =delete;
        ledger_t &operator=(const ledger_t &) =delete;

        record_t append(const draft_t &draft);
        void fetch_chain(std::string_view anchor_id, const storage::range_t &range, const storage::record_observer_t &obs) const;
        [[nodiscard]] std::vector<record_t> fetch_chain(std::string_view anchor_id, const storage::range_t &range={}) const;
        [[nodiscard]] std::vector<record_t> search(const storage::search_filter_t &filter) const;
        [[nodiscard]] std::vector<std::string> anchors() const;
        verification_report_t verify(std::string_view anchor_id, const cancel_token_t *cancel=nullptr);
        [[nodiscard]] ledger_stats_t stats() const;

        std::optional<checkpoint_t> build_checkpoint(std::string_view anchor_id);
        [[nodiscard]] std::optional<checkpoint_t> checkpoint(std::string_view checkpoint_id) const;
        [[nodiscard]] std::optional<checkpoint_t> latest_checkpoint(std::string_view anchor_id) const;
        [[nodiscard]] std::vector<checkpoint_t> checkpoints(std::string_view anchor_id) const;
        [[nodiscard]] std::optional<merkle::proof_t> prove(std::string_view checkpoint_id, std::string_view record_id) const;
        [[nodiscard]] checkpoint_check_t verify_checkpoint(std::string_view checkpoint_id) const;

        // Only for the durable backend.
        storage::backfill_result_t backfill();
        // Writes all chains as JSON Lines, one record per line in chain order. Returns the number of records.
        uint64_t export_jsonl(const std::string &path) const;
        // Nothing is imported when a chain fails verification or does not continue the stored chain of its anchor.
        import_result_t import_jsonl(const std::string &path, bool verify=true);

        [[nodiscard]] const config_t &config() const noexcept;
        [[nodiscard]] const metrics_t &metrics() const noexcept;
        [[nodiscard]] const chain_verifier_t &verifier() const noexcept;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
