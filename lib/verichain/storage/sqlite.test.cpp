/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include <verichain/ledger/test-records.hpp>
#include "sqlite.hpp"

namespace {
    using namespace std::chrono_literals;
    using namespace verichain;
    using namespace verichain::storage;
}

suite verichain_storage_sqlite_suite = [] {
    "verichain::storage::sqlite"_test = [] {
        ledger::test::record_factory_t f {};
        "append and fetch"_test = [&] {
            file::tmp_directory dir { "sqlite-append" };
            sqlite::backend_t db { dir.path() + "/ledger.db" };
            expect(!db.tail("a").has_value());
            const auto recs = f.make_chain("a", 4);
            for (const auto &r: recs)
                expect(db.append(r));
            const auto t = db.tail("a");
            expect(t.has_value());
            expect_equal(recs.back().id, t.value().id);
            expect_equal(4ULL, t.value().length);
            const auto stored = db.fetch("a");
            expect(stored == recs);
            const auto part = db.fetch("a", range_t { recs.at(2).id, {} });
            expect_equal(2ULL, part.size());
            expect(!db.append(f.make("a", recs.at(0).hash, { { "v", 7 } })));
            expect(!db.append(f.make_stale_id("a", recs.back().hash, { { "v", 7 } })));
            expect(db.fetch("a") == recs);
        };
        "records survive a reopen"_test = [&] {
            file::tmp_directory dir { "sqlite-reopen" };
            const auto path = dir.path() + "/ledger.db";
            const auto recs = f.make_chain("a", 3);
            {
                sqlite::backend_t db { path, 2 };
                for (const auto &r: recs)
                    expect(db.append(r));
            }
            sqlite::backend_t db { path, 2 };
            expect(db.fetch("a") == recs);
            const auto st = db.stats();
            expect_equal(3ULL, st.records);
            expect_equal(1ULL, st.anchors);
        };
        "signatures and extended kinds"_test = [&] {
            file::tmp_directory dir { "sqlite-sig" };
            sqlite::backend_t db { dir.path() + "/ledger.db" };
            auto rec = f.make("a", ledger::genesis_hash, { { "quality", 0.5 }, { "nested", { { "z", 1 }, { "a", "x" } } } },
                ledger::record_kind_t::from_name("RC_ATTESTATION"));
            rec.sig = ledger::signature_t { uint8_vector::from_hex("00ff10"), "ed25519", "key-1" };
            expect(db.append(rec));
            const auto stored = db.fetch("a");
            expect_equal(1ULL, stored.size());
            expect(stored.at(0) == rec);
            expect(stored.at(0).kind.name() == "RC_ATTESTATION");
        };
        "search"_test = [&] {
            file::tmp_directory dir { "sqlite-search" };
            sqlite::backend_t db { dir.path() + "/ledger.db" };
            const auto a = f.make_chain("a", 3);
            const auto b = f.make_chain("b", 2);
            for (const auto &r: a)
                expect(db.append(r));
            for (const auto &r: b)
                expect(db.append(r));
            const auto latest = db.search(search_filter_t { .limit=1 });
            expect_equal(1ULL, latest.size());
            expect_equal(b.back().id, latest.at(0).id);
            const auto updates = db.search(search_filter_t { .anchor_id="a", .kind="UPDATE" });
            expect_equal(2ULL, updates.size());
            const auto recent = db.search(search_filter_t { .since=a.back().ts });
            expect_equal(3ULL, recent.size());
            expect_equal(2ULL, db.anchors().size());
        };
        "checkpoints"_test = [&] {
            file::tmp_directory dir { "sqlite-cp" };
            sqlite::backend_t db { dir.path() + "/ledger.db" };
            const auto recs = f.make_chain("a", 2);
            ledger::checkpoint_t cp {};
            cp.id = "cp-1";
            cp.anchor_id = "a";
            cp.range_start = recs.front().id;
            cp.range_end = recs.back().id;
            cp.record_count = 2;
            cp.merkle_root = recs.back().hash;
            cp.hash_algorithm = "sha3-256";
            cp.created_at = 123;
            db.put_checkpoint(cp);
            auto cp2 = cp;
            cp2.id = "cp-2";
            cp2.first_index = 2;
            cp2.sig = ledger::signature_t { uint8_vector::from_hex("aabb"), "ed25519", "ledger-cp" };
            db.put_checkpoint(cp2);
            expect(db.checkpoint("cp-1") == cp);
            expect(db.checkpoint("cp-2") == cp2);
            const auto all = db.checkpoints("a");
            expect_equal(2ULL, all.size());
            expect_equal(std::string { "cp-1" }, all.at(0).id);
            expect_equal(2ULL, db.stats().checkpoints);
            expect(throws<error>([&] { db.put_checkpoint(cp); }));
        };
        "tampering is visible"_test = [&] {
            file::tmp_directory dir { "sqlite-tamper" };
            sqlite::backend_t db { dir.path() + "/ledger.db" };
            const auto recs = f.make_chain("a", 2);
            for (const auto &r: recs)
                expect(db.append(r));
            db.exec(fmt::format("UPDATE ledger_records SET payload = '{{\"v\":99}}' WHERE rid = '{}'", recs.at(0).id));
            const auto stored = db.fetch("a");
            expect(stored.at(0).payload != recs.at(0).payload);
            expect(ledger::compute_hash(stored.at(0), f.hasher) != stored.at(0).hash);
        };
        "a locked database is reported as unavailable"_test = [&] {
            file::tmp_directory dir { "sqlite-busy" };
            const auto path = dir.path() + "/ledger.db";
            sqlite::backend_t holder { path, 1 };
            sqlite::backend_t db { path, 1, 100ms };
            holder.exec("BEGIN IMMEDIATE");
            expect(throws<backend_unavailable_error>([&] { static_cast<void>(db.append(f.make("a", ledger::genesis_hash, { { "v", 1 } }))); }));
            holder.exec("ROLLBACK");
            expect(db.append(f.make("a", ledger::genesis_hash, { { "v", 1 } })));
        };
        "unsupported paths"_test = [] {
            expect(throws<error>([] { sqlite::backend_t db { ":memory:" }; }));
            expect(throws<error>([] { sqlite::backend_t db { "" }; }));
        };
    };
};
