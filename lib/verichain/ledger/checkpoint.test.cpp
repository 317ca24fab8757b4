/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <thread>
#include <verichain/common/test.hpp>
#include <verichain/storage/memory.hpp>
#include <verichain/storage/sqlite.hpp>
#include "checkpoint.hpp"

namespace {
    using namespace std::chrono_literals;
    using namespace verichain;
    using namespace verichain::ledger;
    namespace json = verichain::codec::json;

    const auto cp_seed = crypto::ed25519::seed_t::from_hex("C5AA8DF43F9F837BEDB7442F31DCB7B166D38535076F094B85CE3A2E0B4458F7");

    void append_n(chain_store_t &store, const std::string_view anchor_id, const size_t n)
    {
        for (size_t i = 0; i < n; ++i)
            store.append(draft_t { std::string { anchor_id }, "slot-1", core_kind_t::update, std::nullopt, json::object { { "i", i } } });
    }

    template<typename P>
    bool wait_for(const P &pred, const std::chrono::milliseconds max_wait=5s)
    {
        const auto deadline = std::chrono::steady_clock::now() + max_wait;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(20ms);
        }
        return true;
    }

    std::vector<hash_t> hashes(const std::vector<record_t> &records)
    {
        std::vector<hash_t> res {};
        for (const auto &r: records)
            res.emplace_back(r.hash);
        return res;
    }
}

suite verichain_ledger_checkpoint_suite = [] {
    "verichain::ledger::checkpoint"_test = [] {
        const kind_registry_t kinds {};
        const verifier_registry_t no_verifiers {};
        checkpoint_config_t manual {};
        manual.every_records = 0;
        manual.max_interval = 0s;
        "consecutive builds chain their roots"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            checkpoint_builder_t cpb { store, manual, no_verifiers };
            expect(!cpb.build("x").has_value());
            append_n(store, "x", 5);
            const auto cp1 = cpb.build("x");
            expect(cp1.has_value());
            const auto recs = store.fetch_chain("x");
            expect_equal(5ULL, cp1->record_count);
            expect_equal(0ULL, cp1->first_index);
            expect_equal(recs.front().id, cp1->range_start);
            expect_equal(recs.back().id, cp1->range_end);
            expect(cp1->prev_root == hash_t {});
            expect(cp1->merkle_root == merkle::root(hashes(recs), store.hasher().func()));
            expect_equal(std::string { "sha3-256" }, cp1->hash_algorithm);
            expect(!cp1->sig.has_value());
            expect(!cpb.build("x").has_value());

            append_n(store, "x", 3);
            const auto cp2 = cpb.build("x");
            expect(cp2.has_value());
            expect_equal(3ULL, cp2->record_count);
            expect_equal(5ULL, cp2->first_index);
            expect(cp2->prev_root == cp1->merkle_root);
            expect(cp2->range_start > cp1->range_end);
            expect(cpb.latest("x") == cp2);
            expect_equal(2ULL, cpb.list("x").size());
            expect(cpb.checkpoint(cp1->id) == cp1);
            expect(cpb.verify_checkpoint(cp1->id).valid());
            expect(cpb.verify_checkpoint(cp2->id).valid());
        };
        "proofs exist only for covered records"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            checkpoint_builder_t cpb { store, manual, no_verifiers };
            append_n(store, "x", 4);
            const auto cp1 = cpb.build("x").value();
            append_n(store, "x", 7);
            const auto cp2 = cpb.build("x").value();
            const auto recs = store.fetch_chain("x");
            for (size_t i = 4; i < recs.size(); ++i) {
                const auto proof = cpb.prove(cp2.id, recs[i].id);
                expect(proof.has_value());
                expect_equal(i - 4, proof->index);
                expect(merkle::verify(cp2.merkle_root, recs[i].hash, *proof, store.hasher().func()));
                expect(!merkle::verify(cp1.merkle_root, recs[i].hash, *proof, store.hasher().func()));
            }
            expect(!cpb.prove(cp2.id, recs[0].id).has_value());
            expect(!cpb.prove(cp1.id, recs[5].id).has_value());
            expect(throws<error>([&] { static_cast<void>(cpb.prove("no-such-checkpoint", recs[0].id)); }));
        };
        "signed checkpoints detect tampering"_test = [&] {
            file::tmp_directory dir { "checkpoint-signed" };
            auto db = std::make_shared<storage::sqlite::backend_t>(dir.path() + "/ledger.db");
            chain_store_t store { db, kinds };
            auto signer = std::make_shared<ed25519_signer_t>(cp_seed, "ledger-cp");
            verifier_registry_t verifiers {};
            verifiers.add("ed25519", std::make_shared<ed25519_verifier_t>(std::map<std::string, crypto::ed25519::vkey_t> { { "ledger-cp", signer->vkey() } }));
            checkpoint_builder_t cpb { store, manual, verifiers, signer };
            append_n(store, "x", 6);
            const auto cp = cpb.build("x").value();
            expect(cp.sig.has_value());
            const auto ok = cpb.verify_checkpoint(cp.id);
            expect(ok.valid());
            expect(ok.signature_ok == std::optional<bool> { true });
            db->exec(fmt::format("UPDATE ledger_checkpoints SET record_count = 5 WHERE cid = '{}'", cp.id));
            const auto bad = cpb.verify_checkpoint(cp.id);
            expect(!bad.valid());
            expect(!bad.count_ok);
            expect(bad.signature_ok == std::optional<bool> { false });
            expect(!bad.to_json().at("valid").as_bool());
        };
        "count trigger"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            auto cfg = manual;
            cfg.every_records = 10;
            checkpoint_builder_t cpb { store, cfg, no_verifiers };
            std::atomic_size_t built { 0 };
            cpb.on_build([&](const checkpoint_t &) { ++built; });
            cpb.start();
            append_n(store, "x", 25);
            expect(wait_for([&] { return built.load() >= 1; }));
            cpb.stop();
            // a build covers everything committed by the time it runs
            const auto cps = cpb.list("x");
            uint64_t covered = 0;
            for (const auto &cp: cps) {
                expect_equal(covered, cp.first_index);
                covered += cp.record_count;
            }
            expect(covered >= 10U);
            expect(covered <= 25U);
            if (covered < 25)
                expect(cpb.build("x").has_value());
            expect_equal(25ULL, cpb.latest("x")->first_index + cpb.latest("x")->record_count);
        };
        "time trigger"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            auto cfg = manual;
            cfg.max_interval = 1s;
            checkpoint_builder_t cpb { store, cfg, no_verifiers };
            append_n(store, "x", 3);
            cpb.start();
            expect(wait_for([&] { return cpb.latest("x").has_value(); }));
            cpb.stop();
            expect_equal(3ULL, cpb.latest("x")->record_count);
        };
    };
};
