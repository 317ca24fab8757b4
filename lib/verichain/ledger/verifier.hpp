#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <atomic>
#include <span>
#include "config.hpp"
#include "signature.hpp"
#include "store.hpp"

namespace verichain::ledger {
    struct cancel_token_t {
        void cancel() noexcept
        {
            _cancelled.store(true, std::memory_order_relaxed);
        }

        [[nodiscard]] bool cancelled() const noexcept
        {
            return _cancelled.load(std::memory_order_relaxed);
        }
    private:
        std::atomic_bool _cancelled { false };
    };

    // The first position where the chain stops being trustworthy.
    struct continuity_break_t {
        uint64_t index = 0;
        record_id_t record_id {};
        std::string reason {};

        bool operator==(const continuity_break_t &o) const =default;
    };

    struct signature_failure_t {
        uint64_t index = 0;
        record_id_t record_id {};
        std::string reason {};
    };

    struct trust_components_t {
        double quality_mean = 1.0;
        double pqc_rate = 0.0;
        double verify_rate = 1.0;
        double continuity = 1.0;
    };

    enum class verify_result_t: uint8_t {
        pass,
        fail,
        empty,
        cancelled
    };
    extern std::string_view verify_result_name(verify_result_t r);

    struct verification_report_t {
        std::string anchor_id {};
        uint64_t record_count = 0;
        bool valid = true;
        std::optional<continuity_break_t> broken_at {};
        // absent for empty and cancelled verifications
        std::optional<double> trust_score {};
        trust_components_t components {};
        std::vector<signature_failure_t> signature_failures {};
        std::vector<std::string> details {};
        verify_result_t result = verify_result_t::empty;
        timestamp_t verified_at = 0;

        [[nodiscard]] codec::json::object to_json() const;
    };

    /*
     * Walks a chain from its base, checks the links and recomputes the hashes of all records,
     * verifies record signatures and derives a trust score.
     * Integrity findings are reported, never thrown.
     */
    struct chain_verifier_t {
        chain_verifier_t(trust_config_t cfg, crypto::hasher_t hasher, const verifier_registry_t &signatures);

        // Pure: depends only on the given records and the base hash their chain starts from.
        [[nodiscard]] verification_report_t verify_records(std::string_view anchor_id, std::span<const record_t> records,
            const hash_t &base=genesis_hash, const cancel_token_t *cancel=nullptr) const;
        [[nodiscard]] verification_report_t verify(const chain_store_t &store, std::string_view anchor_id, const cancel_token_t *cancel=nullptr) const;
    private:
        trust_config_t _cfg;
        crypto::hasher_t _hasher;
        const verifier_registry_t &_signatures;
    };
}
