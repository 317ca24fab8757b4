#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <verichain/common/mutex.hpp>

namespace verichain::ledger {
    // Counters and gauges of one ledger instance rendered in the Prometheus text exposition format.
    struct metrics_t {
        using labels_t = std::map<std::string, std::string>;

        enum class type_t { counter, gauge };

        metrics_t();

        void inc(std::string_view name, const labels_t &labels={}, double delta=1.0);
        void set(std::string_view name, const labels_t &labels, double val);
        // zero for samples that were never touched
        [[nodiscard]] double value(std::string_view name, const labels_t &labels={}) const;
        [[nodiscard]] std::string render() const;

        void append_outcome(std::string_view anchor_id, std::string_view kind, std::string_view outcome);
        void verify_result(std::string_view anchor_id, std::string_view result, std::optional<double> trust_score, uint64_t chain_length, bool broken);
        void checkpoint_built();
        void degraded(bool on);
        void persist_fallback();
        void persist_error();
    private:
        struct family_t {
            type_t type;
            std::string help;
            std::map<labels_t, double> samples {};
        };

        alignas(mutex::alignment) mutable std::mutex _mutex {};
        std::map<std::string, family_t, std::less<>> _families {};

        family_t &_family(std::string_view name);
    };
}
