/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include <verichain/ledger/test-records.hpp>
#include "lmdb.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::storage;
}

suite verichain_storage_lmdb_suite = [] {
    "verichain::storage::lmdb"_test = [] {
        ledger::test::record_factory_t f {};
        "append and fetch"_test = [&] {
            file::tmp_directory dir { "lmdb-append" };
            lmdb::backend_t db { dir.path() };
            const auto a = f.make_chain("a", 4);
            const auto ab = f.make_chain("ab", 2);
            for (const auto &r: a)
                expect(db.append(r));
            for (const auto &r: ab)
                expect(db.append(r));
            // "a" must not pick up the records of "ab" which share its first character
            expect(db.fetch("a") == a);
            expect(db.fetch("ab") == ab);
            const auto part = db.fetch("a", range_t { a.at(1).id, a.at(2).id });
            expect_equal(2ULL, part.size());
            expect_equal(a.at(1).id, part.at(0).id);
            const auto t = db.tail("a");
            expect(t.has_value());
            expect_equal(4ULL, t.value().length);
            expect(t.value().hash == a.back().hash);
            expect(!db.append(f.make("a", a.at(2).hash, { { "v", 5 } })));
            expect(!db.append(f.make_stale_id("a", a.back().hash, { { "v", 5 } })));
            const auto st = db.stats();
            expect_equal(6ULL, st.records);
            expect_equal(2ULL, st.anchors);
            expect(db.anchors() == std::vector<std::string> { "a", "ab" });
        };
        "records survive a reopen"_test = [&] {
            file::tmp_directory dir { "lmdb-reopen" };
            const auto recs = f.make_chain("a", 3);
            {
                lmdb::backend_t db { dir.path() };
                for (const auto &r: recs)
                    expect(db.append(r));
            }
            lmdb::backend_t db { dir.path() };
            expect(db.fetch("a") == recs);
            expect(db.tail("a").value().id == recs.back().id);
        };
        "search"_test = [&] {
            file::tmp_directory dir { "lmdb-search" };
            lmdb::backend_t db { dir.path() };
            const auto recs = f.make_chain("a", 3);
            for (const auto &r: recs)
                expect(db.append(r));
            const auto res = db.search(search_filter_t { .kind="UPDATE", .limit=1 });
            expect_equal(1ULL, res.size());
            expect_equal(recs.back().id, res.at(0).id);
            expect(db.search(search_filter_t { .slot="missing" }).empty());
        };
        "checkpoints keep their order"_test = [&] {
            file::tmp_directory dir { "lmdb-cp" };
            lmdb::backend_t db { dir.path() };
            for (const auto id: { "cp-b", "cp-a", "cp-c" }) {
                ledger::checkpoint_t cp {};
                cp.id = id;
                cp.anchor_id = "x";
                cp.hash_algorithm = "sha3-256";
                db.put_checkpoint(cp);
            }
            const auto all = db.checkpoints("x");
            expect_equal(3ULL, all.size());
            expect_equal(std::string { "cp-b" }, all.at(0).id);
            expect_equal(std::string { "cp-c" }, all.at(2).id);
            expect(db.checkpoint("cp-a").has_value());
            expect(!db.checkpoint("cp-d").has_value());
            expect(db.checkpoints("y").empty());
            expect_equal(3ULL, db.stats().checkpoints);
        };
    };
};
