/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <atomic>
#include <verichain/common/test.hpp>
#include <verichain/ledger/test-records.hpp>
#include "fallback.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::storage;

    // A volatile backend that can be made to fail like an unreachable database.
    struct flaky_backend_t: memory::backend_t {
        std::atomic_bool down { false };

        bool append(const ledger::record_t &rec) override
        {
            _check();
            return memory::backend_t::append(rec);
        }

        std::optional<tail_t> tail(const std::string_view anchor_id) const override
        {
            _check();
            return memory::backend_t::tail(anchor_id);
        }

        void fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const override
        {
            _check();
            memory::backend_t::fetch(anchor_id, range, obs);
        }

        std::vector<std::string> anchors() const override
        {
            _check();
            return memory::backend_t::anchors();
        }

        backend_stats_t stats() const override
        {
            _check();
            return memory::backend_t::stats();
        }

        using memory::backend_t::fetch;
    private:
        void _check() const
        {
            if (down)
                throw backend_unavailable_error("the test database is down");
        }
    };
}

suite verichain_storage_fallback_suite = [] {
    "verichain::storage::fallback"_test = [] {
        ledger::test::record_factory_t f {};
        "switches on the first unavailable error"_test = [&] {
            auto durable = std::make_shared<flaky_backend_t>();
            std::vector<bool> states {};
            fallback_t db { [&] { return durable; }, [&](const bool degraded) { states.emplace_back(degraded); } };
            expect(!db.degraded());
            expect_equal(std::string { "volatile" }, db.name());
            const auto recs = f.make_chain("a", 4);
            expect(db.tail("a") == std::optional<tail_t> {});
            expect(db.append(recs.at(0)));
            expect(db.append(recs.at(1)));
            durable->down = true;
            // the continued chain links to the last durable record
            expect(db.append(recs.at(2)));
            expect(db.degraded());
            expect(states == std::vector<bool> { true });
            expect(db.append(recs.at(3)));
            expect(db.base("a") == recs.at(1).hash);
            const auto t = db.tail("a");
            expect(t.has_value());
            expect_equal(4ULL, t.value().length);
            expect_equal(2ULL, db.fetch("a").size());
            // the switch is permanent even when the durable backend recovers
            durable->down = false;
            expect(db.degraded());
            expect_equal(2ULL, durable->fetch("a").size());
        };
        "startup failure starts degraded"_test = [&] {
            std::vector<bool> states {};
            fallback_t db { []() -> backend_ptr_t { throw backend_unavailable_error("no database"); }, [&](const bool degraded) { states.emplace_back(degraded); } };
            expect(db.degraded());
            expect(states == std::vector<bool> { true });
            const auto recs = f.make_chain("a", 2);
            for (const auto &r: recs)
                expect(db.append(r));
            expect(db.fetch("a") == recs);
        };
        "other errors are not absorbed"_test = [&] {
            expect(throws<error>([] { fallback_t db { []() -> backend_ptr_t { throw error("bad configuration"); } }; }));
        };
        "backfill switches back"_test = [&] {
            auto durable = std::make_shared<flaky_backend_t>();
            std::vector<bool> states {};
            fallback_t db { [&] { return durable; }, [&](const bool degraded) { states.emplace_back(degraded); } };
            const auto recs = f.make_chain("a", 3);
            expect(db.append(recs.at(0)));
            durable->down = true;
            expect(db.append(recs.at(1)));
            expect(db.append(recs.at(2)));
            ledger::checkpoint_t cp {};
            cp.id = "cp-1";
            cp.anchor_id = "a";
            db.put_checkpoint(cp);
            // still down: nothing changes
            const auto r1 = db.backfill();
            expect(!r1.switched_back);
            expect(db.degraded());
            durable->down = false;
            const auto r2 = db.backfill();
            expect(r2.switched_back);
            expect_equal(3ULL, r2.copied);
            expect_equal(0ULL, r2.conflicts);
            expect(!db.degraded());
            expect(states == std::vector<bool> { true, false });
            expect(durable->fetch("a") == recs);
            expect(durable->checkpoint("cp-1").has_value());
            expect(db.fetch("a") == recs);
        };
        "backfill reports conflicts"_test = [&] {
            auto durable = std::make_shared<flaky_backend_t>();
            fallback_t db { [&] { return durable; } };
            durable->down = true;
            // the process never observed the durable tail of "a", so its volatile chain starts at genesis
            const auto volatile_recs = f.make_chain("a", 1);
            expect(db.append(volatile_recs.at(0)));
            durable->down = false;
            expect(durable->append(f.make("a", ledger::genesis_hash, { { "other", true } })));
            const auto res = db.backfill();
            expect_equal(1ULL, res.conflicts);
            expect(!res.switched_back);
            expect(db.degraded());
        };
    };
};
