/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <optional>
#include <verichain/common/error.hpp>
#include <verichain/common/format.hpp>
#include "metrics.hpp"

namespace verichain::ledger {
    static std::string escape_label(const std::string_view val)
    {
        std::string res {};
        res.reserve(val.size());
        for (const auto c: val) {
            switch (c) {
                case '\\': res += "\\\\"; break;
                case '"': res += "\\\""; break;
                case '\n': res += "\\n"; break;
                default: res += c; break;
            }
        }
        return res;
    }

    metrics_t::metrics_t()
    {
        const auto add = [&](std::string name, const type_t type, std::string help) {
            _families.try_emplace(std::move(name), family_t { type, std::move(help) });
        };
        add("ledger_appends_total", type_t::counter, "Append attempts by anchor, kind and outcome");
        add("ledger_verify_requests_total", type_t::counter, "Chain verifications by result");
        add("ledger_trust_score", type_t::gauge, "Trust score of the last verification of an anchor");
        add("ledger_chain_length", type_t::gauge, "Number of records in the last verified chain of an anchor");
        add("ledger_continuity_breaks_total", type_t::counter, "Verifications that found a broken chain");
        add("ledger_checkpoints_total", type_t::counter, "Checkpoints built");
        add("ledger_backend_degraded", type_t::gauge, "1 while the volatile backend serves requests instead of the durable one");
        add("ledger_persist_fallback_total", type_t::counter, "Switches from the durable to the volatile backend");
        add("ledger_persist_errors_total", type_t::counter, "Storage failures surfaced to callers");
    }

    metrics_t::family_t &metrics_t::_family(const std::string_view name)
    {
        const auto it = _families.find(name);
        if (it == _families.end()) [[unlikely]]
            throw error(fmt::format("unknown metric: {}", name));
        return it->second;
    }

    void metrics_t::inc(const std::string_view name, const labels_t &labels, const double delta)
    {
        std::scoped_lock lk { _mutex };
        _family(name).samples[labels] += delta;
    }

    void metrics_t::set(const std::string_view name, const labels_t &labels, const double val)
    {
        std::scoped_lock lk { _mutex };
        _family(name).samples[labels] = val;
    }

    double metrics_t::value(const std::string_view name, const labels_t &labels) const
    {
        std::scoped_lock lk { _mutex };
        const auto f_it = _families.find(name);
        if (f_it == _families.end()) [[unlikely]]
            throw error(fmt::format("unknown metric: {}", name));
        if (const auto it = f_it->second.samples.find(labels); it != f_it->second.samples.end())
            return it->second;
        return 0.0;
    }

    std::string metrics_t::render() const
    {
        std::string out {};
        std::scoped_lock lk { _mutex };
        for (const auto &[name, f]: _families) {
            out += fmt::format("# HELP {} {}\n", name, f.help);
            out += fmt::format("# TYPE {} {}\n", name, f.type == type_t::counter ? "counter" : "gauge");
            if (f.samples.empty()) {
                out += fmt::format("{} 0\n", name);
                continue;
            }
            for (const auto &[labels, val]: f.samples) {
                out += name;
                if (!labels.empty()) {
                    out += '{';
                    bool first = true;
                    for (const auto &[k, v]: labels) {
                        if (!first)
                            out += ',';
                        first = false;
                        out += fmt::format("{}=\"{}\"", k, escape_label(v));
                    }
                    out += '}';
                }
                out += fmt::format(" {}\n", val);
            }
        }
        return out;
    }

    void metrics_t::append_outcome(const std::string_view anchor_id, const std::string_view kind, const std::string_view outcome)
    {
        inc("ledger_appends_total", { { "anchor", std::string { anchor_id } }, { "kind", std::string { kind } }, { "outcome", std::string { outcome } } });
    }

    void metrics_t::verify_result(const std::string_view anchor_id, const std::string_view result, const std::optional<double> trust_score,
        const uint64_t chain_length, const bool broken)
    {
        inc("ledger_verify_requests_total", { { "result", std::string { result } } });
        if (result == "cancelled")
            return;
        if (trust_score)
            set("ledger_trust_score", { { "anchor", std::string { anchor_id } } }, *trust_score);
        set("ledger_chain_length", { { "anchor", std::string { anchor_id } } }, static_cast<double>(chain_length));
        if (broken)
            inc("ledger_continuity_breaks_total");
    }

    void metrics_t::checkpoint_built()
    {
        inc("ledger_checkpoints_total");
    }

    void metrics_t::degraded(const bool on)
    {
        set("ledger_backend_degraded", {}, on ? 1.0 : 0.0);
    }

    void metrics_t::persist_fallback()
    {
        inc("ledger_persist_fallback_total");
    }

    void metrics_t::persist_error()
    {
        inc("ledger_persist_errors_total");
    }
}
