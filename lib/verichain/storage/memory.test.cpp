/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include <verichain/ledger/test-records.hpp>
#include "memory.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::storage;
}

suite verichain_storage_memory_suite = [] {
    "verichain::storage::memory"_test = [] {
        ledger::test::record_factory_t f {};
        "append links to the tail"_test = [&] {
            memory::backend_t db {};
            expect(!db.tail("a").has_value());
            const auto recs = f.make_chain("a", 3);
            for (const auto &r: recs)
                expect(db.append(r));
            const auto t = db.tail("a");
            expect(t.has_value());
            expect_equal(recs.back().id, t.value().id);
            expect(t.value().hash == recs.back().hash);
            expect_equal(3ULL, t.value().length);
            // a record linking to a stale tail is refused
            const auto stale = f.make("a", recs.at(1).hash, { { "v", 9 } });
            expect(!db.append(stale));
            // so is one linking to the tail with an id that does not follow the tail's
            expect(!db.append(f.make_stale_id("a", recs.back().hash, { { "v", 9 } })));
            expect_equal(3ULL, db.stats().records);
        };
        "fetch ranges are inclusive"_test = [&] {
            memory::backend_t db {};
            const auto recs = f.make_chain("a", 5);
            for (const auto &r: recs)
                expect(db.append(r));
            expect_equal(5ULL, db.fetch("a").size());
            const auto mid = db.fetch("a", range_t { recs.at(1).id, recs.at(3).id });
            expect_equal(3ULL, mid.size());
            expect_equal(recs.at(1).id, mid.front().id);
            expect_equal(recs.at(3).id, mid.back().id);
            expect(db.fetch("b").empty());
        };
        "anchors are independent"_test = [&] {
            memory::backend_t db {};
            for (const auto &r: f.make_chain("a", 2))
                expect(db.append(r));
            for (const auto &r: f.make_chain("b", 4))
                expect(db.append(r));
            const auto st = db.stats();
            expect_equal(6ULL, st.records);
            expect_equal(2ULL, st.anchors);
            expect_equal(2ULL, db.anchors().size());
        };
        "search returns the most recent first"_test = [&] {
            memory::backend_t db {};
            const auto recs = f.make_chain("a", 4);
            for (const auto &r: recs)
                expect(db.append(r));
            const auto all = db.search(search_filter_t { .anchor_id="a", .limit=2 });
            expect_equal(2ULL, all.size());
            expect_equal(recs.at(3).id, all.at(0).id);
            expect_equal(recs.at(2).id, all.at(1).id);
            const auto creates = db.search(search_filter_t { .kind="CREATE" });
            expect_equal(1ULL, creates.size());
            expect_equal(recs.front().id, creates.at(0).id);
        };
        "seeded anchors continue from the seed"_test = [&] {
            memory::backend_t db {};
            const auto prior = f.make_chain("a", 2);
            db.seed("a", tail_t { prior.back().id, prior.back().hash, 2 });
            expect(db.base("a") == prior.back().hash);
            const auto t0 = db.tail("a");
            expect(t0.has_value());
            expect_equal(2ULL, t0.value().length);
            // a genesis-linked record no longer fits
            const auto orphan = f.make("a", ledger::genesis_hash, { { "v", 1 } });
            expect(!db.append(orphan));
            const auto next = f.make("a", prior.back().hash, { { "v", 2 } });
            expect(db.append(next));
            expect_equal(3ULL, db.tail("a").value().length);
            expect(db.base("b") == ledger::genesis_hash);
        };
        "checkpoints"_test = [&] {
            memory::backend_t db {};
            ledger::checkpoint_t cp {};
            cp.id = "cp-1";
            cp.anchor_id = "a";
            cp.record_count = 3;
            db.put_checkpoint(cp);
            expect(db.checkpoint("cp-1") == cp);
            expect(!db.checkpoint("cp-2").has_value());
            expect_equal(1ULL, db.checkpoints("a").size());
            expect(db.checkpoints("b").empty());
            expect(throws<error>([&] { db.put_checkpoint(cp); }));
        };
    };
};
