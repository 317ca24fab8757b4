/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include "metrics.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::ledger;
}

suite verichain_ledger_metrics_suite = [] {
    "verichain::ledger::metrics"_test = [] {
        "counters and gauges"_test = [] {
            metrics_t m {};
            m.append_outcome("a", "CREATE", "ok");
            m.append_outcome("a", "CREATE", "ok");
            m.append_outcome("a", "UPDATE", "conflict");
            expect_near(2.0, m.value("ledger_appends_total", { { "anchor", "a" }, { "kind", "CREATE" }, { "outcome", "ok" } }));
            expect_near(0.0, m.value("ledger_appends_total", { { "anchor", "b" }, { "kind", "CREATE" }, { "outcome", "ok" } }));
            m.verify_result("a", "pass", 0.95, 3, false);
            m.verify_result("a", "fail", 0.5, 3, true);
            expect_near(0.5, m.value("ledger_trust_score", { { "anchor", "a" } }));
            expect_near(3.0, m.value("ledger_chain_length", { { "anchor", "a" } }));
            expect_near(1.0, m.value("ledger_continuity_breaks_total"));
            m.degraded(true);
            expect_near(1.0, m.value("ledger_backend_degraded"));
            m.degraded(false);
            expect_near(0.0, m.value("ledger_backend_degraded"));
            expect(throws<error>([&] { m.inc("no_such_metric"); }));
        };
        "exposition format"_test = [] {
            metrics_t m {};
            m.append_outcome("x\"y", "CREATE", "ok");
            m.checkpoint_built();
            const auto text = m.render();
            expect(text.find("# TYPE ledger_appends_total counter\n") != std::string::npos);
            expect(text.find("# TYPE ledger_trust_score gauge\n") != std::string::npos);
            // labels are sorted and values escaped
            expect(text.find("ledger_appends_total{anchor=\"x\\\"y\",kind=\"CREATE\",outcome=\"ok\"} 1\n") != std::string::npos) << text;
            expect(text.find("ledger_checkpoints_total 1\n") != std::string::npos);
            expect(text.find("ledger_persist_fallback_total 0\n") != std::string::npos);
        };
    };
};
