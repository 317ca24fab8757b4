#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <verichain/codec/json.hpp>
#include <verichain/crypto/ed25519.hpp>
#include <verichain/storage/backend.hpp>
#include "errors.hpp"

namespace verichain::ledger {
    struct trust_weights_t {
        double quality_mean = 0.5;
        double pqc_rate = 0.2;
        double verify_rate = 0.2;
        double continuity = 0.1;

        [[nodiscard]] double sum() const noexcept
        {
            return quality_mean + pqc_rate + verify_rate + continuity;
        }
    };

    struct trust_config_t {
        trust_weights_t weights {};
        double pass_threshold = 0.7;
        // the first numeric payload value under one of these keys is the producer-supplied quality
        std::vector<std::string> quality_keys { "quality", "confidence", "fidelity", "quantum_fidelity" };
    };

    struct checkpoint_config_t {
        uint64_t every_records = 1000;
        // zero disables the time trigger
        std::chrono::seconds max_interval { 300 };
        std::optional<crypto::ed25519::seed_t> signing_seed {};
        std::string key_ref = "ledger-cp";
    };

    struct config_t {
        static constexpr double weight_tolerance = 1e-6;

        // "volatile" or "durable"
        std::string backend = "volatile";
        storage::durable_config_t durable {};
        std::string hash_algorithm { crypto::hasher_t::default_name };
        size_t max_payload_bytes = 1 << 20;
        size_t append_retries = 3;
        trust_config_t trust {};
        checkpoint_config_t checkpoint {};
        std::vector<std::string> kinds {};
        // ed25519 verification keys of record producers by key reference
        std::map<std::string, crypto::ed25519::vkey_t> keys {};

        // Missing keys take their default values. Throws config_error for invalid documents.
        static config_t from_json(const codec::json::value &jv);
        static config_t load(const std::string &path);
        void validate() const;

        [[nodiscard]] bool durable_backend() const noexcept
        {
            return backend == "durable";
        }
    };
}
