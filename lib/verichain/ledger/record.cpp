/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <chrono>
#include <ctime>
#include <limits>
#include <verichain/codec/canonical.hpp>
#include "record.hpp"

namespace verichain::ledger {
    using codec::canonical::encoding_error;
    namespace json = codec::json;

    timestamp_t now_us()
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::string format_timestamp(const timestamp_t ts)
    {
        auto secs = static_cast<std::time_t>(ts / 1'000'000);
        auto micros = ts % 1'000'000;
        if (micros < 0) {
            micros += 1'000'000;
            --secs;
        }
        std::tm tm {};
        if (!gmtime_r(&secs, &tm)) [[unlikely]]
            throw error(fmt::format("timestamp {} is out of range", ts));
        return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
    }

    static const json::value &require(const json::object &obj, const std::string_view key)
    {
        const auto *jv = json::find(obj, key);
        if (!jv) [[unlikely]]
            throw error(fmt::format("a required field is missing: '{}'", key));
        return *jv;
    }

    static std::string require_string(const json::object &obj, const std::string_view key)
    {
        const auto &jv = require(obj, key);
        if (!jv.is_string()) [[unlikely]]
            throw error(fmt::format("the field '{}' must be a string", key));
        return std::string { json::as_sv(jv.get_string()) };
    }

    static int64_t require_int(const json::object &obj, const std::string_view key)
    {
        const auto &jv = require(obj, key);
        if (jv.is_int64())
            return jv.get_int64();
        if (jv.is_uint64() && jv.get_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return static_cast<int64_t>(jv.get_uint64());
        throw error(fmt::format("the field '{}' must be an integer", key));
    }

    signature_t signature_t::from_json(const json::value &jv)
    {
        const auto &obj = jv.as_object();
        return {
            uint8_vector::from_hex(require_string(obj, "bytes")),
            require_string(obj, "algorithm"),
            json::get_string(obj, "key_ref", "")
        };
    }

    json::object signature_t::to_json() const
    {
        return {
            { "bytes", to_hex(bytes) },
            { "algorithm", algorithm },
            { "key_ref", key_ref }
        };
    }

    record_t record_t::from_json(const json::value &jv)
    {
        if (!jv.is_object()) [[unlikely]]
            throw error("a record must be a JSON object");
        const auto &obj = jv.get_object();
        record_t rec {};
        rec.id = require_string(obj, "id");
        if (!valid_record_id(rec.id)) [[unlikely]]
            throw error(fmt::format("an invalid record id: '{}'", rec.id));
        rec.anchor_id = require_string(obj, "anchor_id");
        rec.slot = require_string(obj, "slot");
        rec.kind = record_kind_t::from_name(require_string(obj, "kind"));
        rec.ts = require_int(obj, "ts");
        rec.prev_hash = hash_t::from_hex(require_string(obj, "prev_hash"));
        rec.hash = hash_t::from_hex(require_string(obj, "hash"));
        const auto &payload = require(obj, "payload");
        if (!payload.is_object()) [[unlikely]]
            throw error("the record payload must be a JSON object");
        rec.payload = payload.get_object();
        if (const auto *sig = json::find(obj, "sig"))
            rec.sig = signature_t::from_json(*sig);
        rec.producer = json::get_string(obj, "producer", rec.slot);
        rec.version = static_cast<uint32_t>(json::get_uint(obj, "version", schema_version));
        return rec;
    }

    json::object record_t::to_json() const
    {
        json::object obj {
            { "id", id },
            { "anchor_id", anchor_id },
            { "slot", slot },
            { "kind", std::string { kind.name() } },
            { "ts", ts },
            { "prev_hash", to_hex(prev_hash) },
            { "hash", to_hex(hash) },
            { "payload", payload },
            { "producer", producer },
            { "version", version }
        };
        if (sig)
            obj.emplace("sig", sig->to_json());
        return obj;
    }

    std::string record_t::payload_text() const
    {
        return codec::canonical::encode(payload);
    }

    checkpoint_t checkpoint_t::from_json(const json::value &jv)
    {
        if (!jv.is_object()) [[unlikely]]
            throw error("a checkpoint must be a JSON object");
        const auto &obj = jv.get_object();
        checkpoint_t cp {};
        cp.id = require_string(obj, "id");
        cp.anchor_id = require_string(obj, "anchor_id");
        cp.range_start = require_string(obj, "range_start");
        cp.range_end = require_string(obj, "range_end");
        cp.first_index = static_cast<uint64_t>(require_int(obj, "first_index"));
        cp.record_count = static_cast<uint64_t>(require_int(obj, "record_count"));
        cp.merkle_root = hash_t::from_hex(require_string(obj, "merkle_root"));
        cp.prev_root = hash_t::from_hex(require_string(obj, "prev_root"));
        cp.hash_algorithm = require_string(obj, "hash_algorithm");
        if (const auto *sig = json::find(obj, "sig"))
            cp.sig = signature_t::from_json(*sig);
        cp.created_at = require_int(obj, "created_at");
        return cp;
    }

    json::object checkpoint_t::to_json() const
    {
        json::object obj {
            { "id", id },
            { "anchor_id", anchor_id },
            { "range_start", range_start },
            { "range_end", range_end },
            { "first_index", first_index },
            { "record_count", record_count },
            { "merkle_root", to_hex(merkle_root) },
            { "prev_root", to_hex(prev_root) },
            { "hash_algorithm", hash_algorithm },
            { "created_at", created_at }
        };
        if (sig)
            obj.emplace("sig", sig->to_json());
        return obj;
    }

    std::string checkpoint_t::header() const
    {
        return codec::canonical::encode(json::object {
            { "anchor_id", anchor_id },
            { "hash_algorithm", hash_algorithm },
            { "merkle_root", to_hex(merkle_root) },
            { "prev_root", to_hex(prev_root) },
            { "range_end", range_end },
            { "range_start", range_start },
            { "record_count", record_count },
            { "version", std::string { header_version } }
        });
    }

    std::string envelope(const std::string_view anchor_id, const std::string_view slot, const record_kind_t &kind,
        const timestamp_t ts, const json::object &payload, const hash_t &prev_hash)
    {
        using codec::canonical::encode_string;
        std::string out {};
        out.reserve(256);
        out += "{\"anchor_id\":";
        encode_string(out, anchor_id);
        out += ",\"kind\":";
        encode_string(out, kind.name());
        out += ",\"payload\":";
        codec::canonical::encode(out, payload);
        out += ",\"prev_hash\":\"";
        out += to_hex(prev_hash);
        out += "\",\"slot\":";
        encode_string(out, slot);
        out += fmt::format(",\"ts\":{}}}", ts);
        return out;
    }

    std::string envelope(const record_t &rec)
    {
        return envelope(rec.anchor_id, rec.slot, rec.kind, rec.ts, rec.payload, rec.prev_hash);
    }

    hash_t compute_hash(const record_t &rec, const crypto::hasher_t &hasher)
    {
        return hasher.digest(envelope(rec));
    }

    std::string validate_draft(const draft_t &draft, const size_t max_payload_bytes)
    {
        if (draft.anchor_id.empty() || draft.anchor_id.size() > max_anchor_id_size) [[unlikely]]
            throw encoding_error(fmt::format("anchor_id must have from 1 to {} bytes but has {}", max_anchor_id_size, draft.anchor_id.size()));
        if (draft.anchor_id.find('\0') != std::string::npos) [[unlikely]]
            throw encoding_error("anchor_id must not contain NUL characters");
        if (draft.slot.empty() || draft.slot.size() > max_slot_size) [[unlikely]]
            throw encoding_error(fmt::format("slot must have from 1 to {} bytes but has {}", max_slot_size, draft.slot.size()));
        if (draft.producer.size() > max_slot_size) [[unlikely]]
            throw encoding_error(fmt::format("producer must have at most {} bytes but has {}", max_slot_size, draft.producer.size()));
        for (const auto &s: { std::string_view { draft.anchor_id }, std::string_view { draft.slot }, std::string_view { draft.producer } }) {
            if (!codec::canonical::valid_utf8(s)) [[unlikely]]
                throw encoding_error("record header fields must be valid UTF-8");
        }
        if (draft.ts && *draft.ts < 0) [[unlikely]]
            throw encoding_error(fmt::format("a record timestamp must not be negative but is {}", *draft.ts));
        if (draft.sig && (draft.sig->bytes.empty() || draft.sig->algorithm.empty())) [[unlikely]]
            throw encoding_error("a signature must carry its bytes and an algorithm tag");
        auto text = codec::canonical::encode(draft.payload);
        if (text.size() > max_payload_bytes) [[unlikely]]
            throw encoding_error(fmt::format("the canonical payload has {} bytes which exceeds the limit of {}", text.size(), max_payload_bytes));
        return text;
    }
}
