/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <cmath>
#include <verichain/common/numeric-cast.hpp>
#include "config.hpp"
#include "kind.hpp"

namespace verichain::ledger {
    namespace json = codec::json;

    static std::vector<std::string> get_strings(const json::object &obj, const std::string_view key, std::vector<std::string> def)
    {
        const auto *jv = json::find(obj, key);
        if (!jv)
            return def;
        if (!jv->is_array())
            throw config_error(fmt::format("'{}' must be an array of strings", key));
        std::vector<std::string> res {};
        for (const auto &item: jv->get_array()) {
            if (!item.is_string())
                throw config_error(fmt::format("'{}' must be an array of strings", key));
            res.emplace_back(json::as_sv(item.get_string()));
        }
        return res;
    }

    static void parse_config(config_t &cfg, const json::object &obj)
    {
        cfg.backend = json::get_string(obj, "backend", cfg.backend);
        {
            const auto &d = json::get_object(obj, "durable");
            cfg.durable.dsn = json::get_string(d, "dsn", cfg.durable.dsn);
            cfg.durable.pool_size = numeric_cast<size_t>(json::get_uint(d, "pool_size", cfg.durable.pool_size));
            cfg.durable.op_timeout = std::chrono::milliseconds { numeric_cast<int64_t>(json::get_uint(d, "op_timeout_ms", cfg.durable.op_timeout.count())) };
        }
        cfg.hash_algorithm = json::get_string(obj, "hash_algorithm", cfg.hash_algorithm);
        cfg.max_payload_bytes = numeric_cast<size_t>(json::get_uint(obj, "max_payload_bytes", cfg.max_payload_bytes));
        cfg.append_retries = numeric_cast<size_t>(json::get_uint(obj, "append_retries", cfg.append_retries));
        {
            const auto &t = json::get_object(obj, "trust");
            const auto &w = json::get_object(t, "weights");
            cfg.trust.weights.quality_mean = json::get_double(w, "quality_mean", cfg.trust.weights.quality_mean);
            cfg.trust.weights.pqc_rate = json::get_double(w, "pqc_rate", cfg.trust.weights.pqc_rate);
            cfg.trust.weights.verify_rate = json::get_double(w, "verify_rate", cfg.trust.weights.verify_rate);
            cfg.trust.weights.continuity = json::get_double(w, "continuity", cfg.trust.weights.continuity);
            cfg.trust.pass_threshold = json::get_double(t, "pass_threshold", cfg.trust.pass_threshold);
            cfg.trust.quality_keys = get_strings(t, "quality_keys", std::move(cfg.trust.quality_keys));
        }
        {
            const auto &c = json::get_object(obj, "checkpoint");
            cfg.checkpoint.every_records = json::get_uint(c, "every_records", cfg.checkpoint.every_records);
            cfg.checkpoint.max_interval = std::chrono::seconds { numeric_cast<int64_t>(json::get_uint(c, "max_interval_sec", cfg.checkpoint.max_interval.count())) };
            if (const auto seed_hex = json::get_string(c, "signing_seed", ""); !seed_hex.empty()) {
                if (seed_hex.size() != sizeof(crypto::ed25519::seed_t) * 2)
                    throw config_error(fmt::format("checkpoint.signing_seed must be {} hex characters", sizeof(crypto::ed25519::seed_t) * 2));
                cfg.checkpoint.signing_seed.emplace(crypto::ed25519::seed_t::from_hex(seed_hex));
            }
            cfg.checkpoint.key_ref = json::get_string(c, "key_ref", cfg.checkpoint.key_ref);
        }
        cfg.kinds = get_strings(obj, "kinds", std::move(cfg.kinds));
        for (const auto &[key_ref, jv]: json::get_object(obj, "keys")) {
            if (!jv.is_string())
                throw config_error(fmt::format("the key '{}' must be a hex string", json::as_sv(key_ref)));
            const auto hex = json::as_sv(jv.get_string());
            if (hex.size() != sizeof(crypto::ed25519::vkey_t) * 2)
                throw config_error(fmt::format("the key '{}' must be {} hex characters", json::as_sv(key_ref), sizeof(crypto::ed25519::vkey_t) * 2));
            cfg.keys.insert_or_assign(std::string { json::as_sv(key_ref) }, crypto::ed25519::vkey_t::from_hex(hex));
        }
    }

    config_t config_t::from_json(const json::value &jv)
    {
        if (!jv.is_object())
            throw config_error("the configuration must be a JSON object");
        config_t cfg {};
        try {
            parse_config(cfg, jv.get_object());
        } catch (const config_error &) {
            throw;
        } catch (const std::exception &ex) {
            throw config_error("invalid configuration", ex);
        }
        cfg.validate();
        return cfg;
    }

    config_t config_t::load(const std::string &path)
    {
        json::value jv {};
        try {
            jv = json::load(path);
        } catch (const std::exception &ex) {
            throw config_error(fmt::format("can't load the configuration from {}", path), ex);
        }
        return from_json(jv);
    }

    void config_t::validate() const
    {
        if (backend != "volatile" && backend != "durable")
            throw config_error(fmt::format("backend must be 'volatile' or 'durable' but got '{}'", backend));
        if (durable.pool_size == 0)
            throw config_error("durable.pool_size must be positive");
        if (durable.op_timeout.count() <= 0)
            throw config_error("durable.op_timeout_ms must be positive");
        if (const auto &names = crypto::hasher_t::supported_names(); std::find(names.begin(), names.end(), hash_algorithm) == names.end())
            throw config_error(fmt::format("unsupported hash_algorithm: '{}'", hash_algorithm));
        if (max_payload_bytes == 0)
            throw config_error("max_payload_bytes must be positive");
        for (const auto w: { trust.weights.quality_mean, trust.weights.pqc_rate, trust.weights.verify_rate, trust.weights.continuity }) {
            if (!(w >= 0.0 && w <= 1.0))
                throw config_error(fmt::format("trust weights must lie in [0, 1] but got {}", w));
        }
        if (std::fabs(trust.weights.sum() - 1.0) > weight_tolerance)
            throw config_error(fmt::format("trust weights must sum to 1.0 but sum to {}", trust.weights.sum()));
        if (!(trust.pass_threshold >= 0.0 && trust.pass_threshold <= 1.0))
            throw config_error(fmt::format("trust.pass_threshold must lie in [0, 1] but got {}", trust.pass_threshold));
        if (checkpoint.every_records == 0)
            throw config_error("checkpoint.every_records must be positive");
        for (const auto &k: kinds) {
            if (!kind_registry_t::valid_name(k) || record_kind_t::core_from_name(k))
                throw config_error(fmt::format("'{}' is not a valid extended record kind", k));
        }
    }
}
