/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <cmath>
#include <verichain/common/logger.hpp>
#include <verichain/common/timer.hpp>
#include "verifier.hpp"

namespace verichain::ledger {
    namespace json = codec::json;

    static constexpr double max_mean_ci_width = 0.1;
    static constexpr double max_mean_abs_bias = 0.05;

    std::string_view verify_result_name(const verify_result_t r)
    {
        switch (r) {
            case verify_result_t::pass: return "pass";
            case verify_result_t::fail: return "fail";
            case verify_result_t::empty: return "empty";
            case verify_result_t::cancelled: return "cancelled";
            default: throw error(fmt::format("unsupported verify_result_t value: {}", static_cast<int>(r)));
        }
    }

    json::object verification_report_t::to_json() const
    {
        json::object obj {
            { "anchor_id", anchor_id },
            { "record_count", record_count },
            { "valid", valid },
            { "result", std::string { verify_result_name(result) } },
            { "verified_at", format_timestamp(verified_at) },
            { "components", json::object {
                { "quality_mean", components.quality_mean },
                { "pqc_rate", components.pqc_rate },
                { "verify_rate", components.verify_rate },
                { "continuity", components.continuity }
            } }
        };
        if (trust_score)
            obj.emplace("trust_score", *trust_score);
        else
            obj.emplace("trust_score", nullptr);
        if (broken_at) {
            obj.emplace("broken_at", json::object {
                { "index", broken_at->index },
                { "record_id", broken_at->record_id },
                { "reason", broken_at->reason }
            });
        }
        json::array failures {};
        for (const auto &f: signature_failures)
            failures.emplace_back(json::object { { "index", f.index }, { "record_id", f.record_id }, { "reason", f.reason } });
        obj.emplace("signature_failures", std::move(failures));
        json::array det {};
        for (const auto &d: details)
            det.emplace_back(d);
        obj.emplace("details", std::move(det));
        return obj;
    }

    static const json::value *find_any(const json::object &obj, const std::initializer_list<std::string_view> keys)
    {
        for (const auto k: keys) {
            if (const auto *jv = json::find(obj, k))
                return jv;
        }
        return nullptr;
    }

    chain_verifier_t::chain_verifier_t(trust_config_t cfg, crypto::hasher_t hasher, const verifier_registry_t &signatures):
        _cfg { std::move(cfg) },
        _hasher { std::move(hasher) },
        _signatures { signatures }
    {
    }

    verification_report_t chain_verifier_t::verify_records(const std::string_view anchor_id, const std::span<const record_t> records,
        const hash_t &base, const cancel_token_t *cancel) const
    {
        verification_report_t rep {};
        rep.anchor_id = anchor_id;
        rep.record_count = records.size();
        rep.verified_at = now_us();

        const auto note_break = [&](const uint64_t idx, const record_t &rec, std::string reason) {
            rep.details.emplace_back(fmt::format("record {} ({}): {}", idx, rec.id, reason));
            if (!rep.broken_at)
                rep.broken_at = continuity_break_t { idx, rec.id, std::move(reason) };
        };

        hash_t prev = base;
        const record_t *prev_rec = nullptr;
        uint64_t num_signed = 0;
        uint64_t num_verified = 0;
        double quality_sum = 0.0;
        uint64_t quality_n = 0;
        double ci_sum = 0.0;
        uint64_t ci_n = 0;
        double bias_sum = 0.0;
        uint64_t bias_n = 0;
        for (uint64_t i = 0; i < records.size(); ++i) {
            if (cancel && cancel->cancelled()) {
                rep.result = verify_result_t::cancelled;
                rep.details.emplace_back(fmt::format("cancelled after {} of {} records", i, records.size()));
                return rep;
            }
            const auto &rec = records[i];
            if (rec.anchor_id != anchor_id)
                note_break(i, rec, fmt::format("the record belongs to anchor {}", rec.anchor_id));
            if (prev_rec && rec.id <= prev_rec->id)
                note_break(i, rec, fmt::format("the record id does not follow {}", prev_rec->id));
            if (rec.prev_hash != prev)
                note_break(i, rec, fmt::format("prev_hash {} does not match the preceding hash {}", rec.prev_hash, prev));
            if (const auto h = compute_hash(rec, _hasher); h != rec.hash)
                note_break(i, rec, fmt::format("the stored hash {} does not match the recomputed hash {}", rec.hash, h));
            prev = rec.hash;
            prev_rec = &rec;

            if (rec.sig) {
                ++num_signed;
                const auto *verifier = _signatures.find(rec.sig->algorithm);
                if (!verifier) {
                    rep.signature_failures.emplace_back(signature_failure_t { i, rec.id, fmt::format("unsupported signature algorithm: {}", rec.sig->algorithm) });
                } else if (!verifier->verify(rec.payload_text(), rec.sig->bytes, rec.sig->key_ref)) {
                    rep.signature_failures.emplace_back(signature_failure_t { i, rec.id, fmt::format("the {} signature does not verify with key '{}'", rec.sig->algorithm, rec.sig->key_ref) });
                } else {
                    ++num_verified;
                }
            }
            for (const auto &key: _cfg.quality_keys) {
                if (const auto *jv = json::find(rec.payload, key)) {
                    if (const auto q = json::as_number(*jv); q && std::isfinite(*q)) {
                        quality_sum += std::clamp(*q, 0.0, 1.0);
                        ++quality_n;
                        break;
                    }
                }
            }
            if (const auto *ci = find_any(rec.payload, { "quality_ci", "quantum_fidelity_ci" }); ci && ci->is_array() && ci->get_array().size() == 2) {
                const auto lo = json::as_number(ci->get_array().at(0));
                const auto hi = json::as_number(ci->get_array().at(1));
                if (lo && hi) {
                    ci_sum += std::fabs(*hi - *lo);
                    ++ci_n;
                }
            }
            if (const auto *bias = find_any(rec.payload, { "bias_abs", "entropy_abs_bias" })) {
                if (const auto b = json::as_number(*bias)) {
                    bias_sum += std::fabs(*b);
                    ++bias_n;
                }
            }
        }

        rep.valid = !rep.broken_at;
        if (records.empty()) {
            rep.result = verify_result_t::empty;
            return rep;
        }
        const auto n = static_cast<double>(records.size());
        auto &c = rep.components;
        c.quality_mean = quality_n ? quality_sum / static_cast<double>(quality_n) : 1.0;
        c.pqc_rate = static_cast<double>(num_signed) / n;
        c.verify_rate = num_signed ? static_cast<double>(num_verified) / static_cast<double>(num_signed) : 1.0;
        c.continuity = rep.valid ? 1.0 : 0.0;
        const auto &w = _cfg.weights;
        rep.trust_score = std::clamp(w.quality_mean * c.quality_mean + w.pqc_rate * c.pqc_rate + w.verify_rate * c.verify_rate + w.continuity * c.continuity, 0.0, 1.0);

        if (ci_n) {
            if (const auto mean = ci_sum / static_cast<double>(ci_n); mean > max_mean_ci_width) {
                logger::warn("verifier: anchor {}: the mean quality confidence interval width {:.4f} exceeds {}", anchor_id, mean, max_mean_ci_width);
                rep.details.emplace_back(fmt::format("the mean quality confidence interval width {:.4f} exceeds {}", mean, max_mean_ci_width));
            }
        }
        if (bias_n) {
            if (const auto mean = bias_sum / static_cast<double>(bias_n); mean > max_mean_abs_bias) {
                logger::warn("verifier: anchor {}: the mean absolute bias {:.4f} exceeds {}", anchor_id, mean, max_mean_abs_bias);
                rep.details.emplace_back(fmt::format("the mean absolute bias {:.4f} exceeds {}", mean, max_mean_abs_bias));
            }
        }
        rep.result = rep.valid && *rep.trust_score >= _cfg.pass_threshold ? verify_result_t::pass : verify_result_t::fail;
        return rep;
    }

    verification_report_t chain_verifier_t::verify(const chain_store_t &store, const std::string_view anchor_id, const cancel_token_t *cancel) const
    {
        timer t { fmt::format("verify {}", anchor_id) };
        std::vector<record_t> records {};
        store.fetch_chain(anchor_id, {}, [&](auto rec) {
            if (cancel && cancel->cancelled())
                return;
            records.emplace_back(std::move(rec));
        });
        auto rep = verify_records(anchor_id, records, store.backend().base(anchor_id), cancel);
        if (rep.broken_at)
            logger::warn("verifier: the chain of {} is broken at record {} ({}): {}", anchor_id, rep.broken_at->index, rep.broken_at->record_id, rep.broken_at->reason);
        return rep;
    }
}
