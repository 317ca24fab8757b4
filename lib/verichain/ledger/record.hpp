#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <optional>
#include <string>
#include <verichain/codec/json.hpp>
#include <verichain/crypto/hasher.hpp>
#include "kind.hpp"
#include "record-id.hpp"

namespace verichain::ledger {
    using hash_t = crypto::hash_t;
    using timestamp_t = int64_t;

    // prev_hash of the first record of every chain
    inline const hash_t genesis_hash {};

    static constexpr uint32_t schema_version = 1;
    static constexpr size_t max_anchor_id_size = 256;
    static constexpr size_t max_slot_size = 128;

    // microseconds since the Unix epoch
    extern timestamp_t now_us();
    extern std::string format_timestamp(timestamp_t ts);

    struct signature_t {
        uint8_vector bytes {};
        std::string algorithm {};
        std::string key_ref {};

        static signature_t from_json(const codec::json::value &jv);
        [[nodiscard]] codec::json::object to_json() const;
        bool operator==(const signature_t &o) const =default;
    };

    // What a producer submits to the store.
    struct draft_t {
        std::string anchor_id {};
        std::string slot {};
        record_kind_t kind {};
        // the commit time when absent
        std::optional<timestamp_t> ts {};
        codec::json::object payload {};
        std::optional<signature_t> sig {};
        // defaults to the slot when empty
        std::string producer {};
    };

    struct record_t {
        record_id_t id {};
        std::string anchor_id {};
        std::string slot {};
        record_kind_t kind {};
        timestamp_t ts = 0;
        hash_t prev_hash {};
        hash_t hash {};
        codec::json::object payload {};
        std::optional<signature_t> sig {};
        std::string producer {};
        uint32_t version = schema_version;

        static record_t from_json(const codec::json::value &jv);
        [[nodiscard]] codec::json::object to_json() const;
        // the canonical text of the payload; also the message covered by a record signature
        [[nodiscard]] std::string payload_text() const;
        bool operator==(const record_t &o) const =default;
    };

    // An immutable Merkle summary of a contiguous range of one anchor's chain.
    struct checkpoint_t {
        static constexpr std::string_view header_version = "cp-1.0";

        record_id_t id {};
        std::string anchor_id {};
        record_id_t range_start {};
        record_id_t range_end {};
        uint64_t first_index = 0;
        uint64_t record_count = 0;
        hash_t merkle_root {};
        hash_t prev_root {};
        std::string hash_algorithm {};
        std::optional<signature_t> sig {};
        timestamp_t created_at = 0;

        static checkpoint_t from_json(const codec::json::value &jv);
        [[nodiscard]] codec::json::object to_json() const;
        // the canonical text covered by a checkpoint signature
        [[nodiscard]] std::string header() const;
        bool operator==(const checkpoint_t &o) const =default;
    };

    // The canonical hash input: anchor_id, kind, payload, prev_hash, slot and ts in this fixed order.
    extern std::string envelope(std::string_view anchor_id, std::string_view slot, const record_kind_t &kind,
        timestamp_t ts, const codec::json::object &payload, const hash_t &prev_hash);
    extern std::string envelope(const record_t &rec);
    extern hash_t compute_hash(const record_t &rec, const crypto::hasher_t &hasher);

    // Rejects malformed headers and payloads with an encoding_error and returns the canonical payload text.
    extern std::string validate_draft(const draft_t &draft, size_t max_payload_bytes);
}

namespace fmt {
    template<>
    struct formatter<verichain::ledger::record_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const verichain::ledger::record_t &r, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "record {} anchor: {} kind: {} hash: {}", r.id, r.anchor_id, r.kind, r.hash);
        }
    };
}
