/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include <verichain/storage/memory.hpp>
#include <verichain/storage/sqlite.hpp>
#include "test-records.hpp"
#include "verifier.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::ledger;
    namespace json = verichain::codec::json;

    const auto producer_seed = crypto::ed25519::seed_t::from_hex("9D61B19DEFFD5A60BA844AF492EC2CC44449C5697B326919703BAC031CAE7F60");

    draft_t make_draft(const std::string_view anchor_id, const core_kind_t kind, json::object payload)
    {
        return draft_t { std::string { anchor_id }, "slot-1", kind, std::nullopt, std::move(payload) };
    }
}

suite verichain_ledger_verifier_suite = [] {
    "verichain::ledger::verifier"_test = [] {
        const kind_registry_t kinds {};
        const ed25519_signer_t signer { producer_seed, "producer-1" };
        verifier_registry_t sigs {};
        sigs.add(std::string { ed25519_verifier_t::algorithm },
            std::make_shared<ed25519_verifier_t>(std::map<std::string, crypto::ed25519::vkey_t> { { "producer-1", signer.vkey() } }));
        const chain_verifier_t verifier { trust_config_t {}, crypto::hasher_t {}, sigs };
        test::record_factory_t f {};

        "a corrupted payload breaks the chain at its record"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            const auto a1 = store.append(make_draft("x", core_kind_t::create, { { "v", 1 } }));
            const auto a2 = store.append(make_draft("x", core_kind_t::update, { { "v", 2 } }));
            expect(a2.prev_hash == a1.hash);
            const auto ok = verifier.verify(store, "x");
            expect(ok.valid);
            expect(!ok.broken_at.has_value());
            expect_equal(1.0, ok.components.continuity);
            expect(ok.result == verify_result_t::pass);

            auto recs = store.fetch_chain("x");
            recs.at(0).payload = json::object { { "v", 99 } };
            const auto bad = verifier.verify_records("x", recs);
            expect(!bad.valid);
            expect(bad.broken_at.has_value());
            expect_equal(a1.id, bad.broken_at.value().record_id);
            expect_equal(0ULL, bad.broken_at.value().index);
            expect_equal(0.0, bad.components.continuity);
            expect(bad.result == verify_result_t::fail);
        };
        "tampering with a durable store is detected"_test = [&] {
            file::tmp_directory dir { "verifier-sqlite" };
            auto db = std::make_shared<storage::sqlite::backend_t>(dir.path() + "/ledger.db");
            chain_store_t store { db, kinds };
            const auto a1 = store.append(make_draft("x", core_kind_t::create, { { "v", 1 } }));
            store.append(make_draft("x", core_kind_t::update, { { "v", 2 } }));
            expect(verifier.verify(store, "x").valid);
            db->exec(fmt::format("UPDATE ledger_records SET payload = '{{\"v\":99}}' WHERE rid = '{}'", a1.id));
            const auto rep = verifier.verify(store, "x");
            expect(!rep.valid);
            expect(rep.broken_at.has_value());
            expect_equal(a1.id, rep.broken_at.value().record_id);
        };
        "a broken link is reported at its first position"_test = [&] {
            auto recs = f.make_chain("x", 5);
            recs.at(3).prev_hash = recs.at(1).hash;
            const auto rep = verifier.verify_records("x", recs);
            expect(!rep.valid);
            expect_equal(3ULL, rep.broken_at.value().index);
            // the recomputed hash of the relinked record differs as well
            expect(rep.details.size() >= 2U);
        };
        "a flipped stored hash breaks the chain"_test = [&] {
            auto recs = f.make_chain("x", 3);
            recs.at(2).hash[0] ^= 0x01;
            const auto rep = verifier.verify_records("x", recs);
            expect(!rep.valid);
            expect_equal(2ULL, rep.broken_at.value().index);
        };
        "records of another anchor break the chain"_test = [&] {
            const auto recs = f.make_chain("y", 2);
            const auto rep = verifier.verify_records("x", recs);
            expect(!rep.valid);
            expect_equal(0ULL, rep.broken_at.value().index);
        };
        "an empty chain has no trust score"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            const auto rep = verifier.verify(store, "nothing");
            expect(rep.valid);
            expect(!rep.trust_score.has_value());
            expect(rep.result == verify_result_t::empty);
            expect(rep.to_json().at("trust_score").is_null());
        };
        "a single unsigned record"_test = [&] {
            const auto recs = f.make_chain("x", 1);
            const auto rep = verifier.verify_records("x", recs);
            expect(rep.valid);
            expect_equal(1.0, rep.components.continuity);
            expect_equal(0.0, rep.components.pqc_rate);
            expect_equal(1.0, rep.components.verify_rate);
            expect_equal(1.0, rep.components.quality_mean);
            expect_near(0.8, rep.trust_score.value());
            expect(rep.result == verify_result_t::pass);
        };
        "signatures affect pqc and verify rates"_test = [&] {
            auto r1 = f.make("x", genesis_hash, { { "v", 1 } });
            r1.sig = signer.sign(r1.payload_text());
            auto r2 = f.make("x", r1.hash, { { "v", 2 } }, core_kind_t::update);
            r2.sig = signer.sign(r2.payload_text());
            r2.sig->key_ref = "unknown-key";
            const auto r3 = f.make("x", r2.hash, { { "v", 3 } }, core_kind_t::update);
            const std::vector<record_t> recs { r1, r2, r3 };
            const auto rep = verifier.verify_records("x", recs);
            // signature failures do not stop the hash walk
            expect(rep.valid);
            expect_near(2.0 / 3.0, rep.components.pqc_rate);
            expect_near(0.5, rep.components.verify_rate);
            expect_equal(1ULL, rep.signature_failures.size());
            expect_equal(r2.id, rep.signature_failures.at(0).record_id);
            expect_near(0.5 + 0.2 * 2.0 / 3.0 + 0.2 * 0.5 + 0.1, rep.trust_score.value());
        };
        "weights summing slightly above one keep the score within bounds"_test = [&] {
            const auto cfg = config_t::from_json(json::parse(
                R"({"trust":{"weights":{"quality_mean":0.5,"pqc_rate":0.2,"verify_rate":0.2,"continuity":0.1000009}}})"));
            const chain_verifier_t v { cfg.trust, crypto::hasher_t {}, sigs };
            auto r1 = f.make("x", genesis_hash, { { "v", 1 } });
            r1.sig = signer.sign(r1.payload_text());
            auto r2 = f.make("x", r1.hash, { { "v", 2 } }, core_kind_t::update);
            r2.sig = signer.sign(r2.payload_text());
            const std::vector<record_t> recs { r1, r2 };
            const auto rep = v.verify_records("x", recs);
            expect(rep.valid);
            expect_equal(1.0, rep.components.verify_rate);
            expect(rep.trust_score.value() <= 1.0);
            expect_near(1.0, rep.trust_score.value());
        };
        "a signature over a different payload fails"_test = [&] {
            auto r1 = f.make("x", genesis_hash, { { "v", 1 } });
            r1.sig = signer.sign(buffer { std::string_view { "{\"v\":2}" } });
            const std::vector<record_t> recs { r1 };
            const auto rep = verifier.verify_records("x", recs);
            expect_equal(0.0, rep.components.verify_rate);
            expect_equal(1ULL, rep.signature_failures.size());
        };
        "an algorithm without a verifier counts as a failure"_test = [&] {
            auto r1 = f.make("x", genesis_hash, { { "v", 1 } });
            r1.sig = signature_t { uint8_vector(16), "dilithium3", "pq-1" };
            const std::vector<record_t> recs { r1 };
            const auto rep = verifier.verify_records("x", recs);
            expect(rep.valid);
            expect_equal(1.0, rep.components.pqc_rate);
            expect_equal(0.0, rep.components.verify_rate);
        };
        "producer quality values"_test = [&] {
            const auto r1 = f.make("x", genesis_hash, { { "quality", 0.4 } });
            const auto r2 = f.make("x", r1.hash, { { "confidence", 1.7 } }, core_kind_t::update);
            const std::vector<record_t> recs { r1, r2 };
            const auto rep = verifier.verify_records("x", recs);
            // out of range values are clamped
            expect_near(0.7, rep.components.quality_mean);
            expect_near(0.5 * 0.7 + 0.2 + 0.1, rep.trust_score.value());
            expect(rep.result == verify_result_t::fail);
        };
        "quality warnings"_test = [&] {
            const auto r1 = f.make("x", genesis_hash, { { "quality_ci", json::array { 0.5, 0.9 } }, { "bias_abs", 0.2 } });
            const std::vector<record_t> recs { r1 };
            const auto rep = verifier.verify_records("x", recs);
            expect(rep.valid);
            expect_equal(2ULL, rep.details.size());
        };
        "a cancelled verification has no score"_test = [&] {
            const auto recs = f.make_chain("x", 10);
            cancel_token_t cancel {};
            cancel.cancel();
            const auto rep = verifier.verify_records("x", recs, genesis_hash, &cancel);
            expect(rep.result == verify_result_t::cancelled);
            expect(!rep.trust_score.has_value());
        };
        "repeated verifications are identical"_test = [&] {
            chain_store_t store { std::make_shared<storage::memory::backend_t>(), kinds };
            for (size_t i = 0; i < 20; ++i)
                store.append(make_draft("x", i == 0 ? core_kind_t::create : core_kind_t::update, { { "quality", 0.9 }, { "i", i } }));
            const auto r1 = verifier.verify(store, "x");
            const auto r2 = verifier.verify(store, "x");
            expect(r1.trust_score == r2.trust_score);
            expect(r1.broken_at == r2.broken_at);
            expect_equal(20ULL, r1.record_count);
        };
        "chains continuing from a base"_test = [&] {
            const auto base = crypto::hasher_t {}.digest(buffer { std::string_view { "base" } });
            const auto recs = f.make_chain("x", 3, base);
            expect(!verifier.verify_records("x", recs).valid);
            expect(verifier.verify_records("x", recs, base).valid);
        };
        "result names"_test = [] {
            expect_equal(std::string_view { "pass" }, verify_result_name(verify_result_t::pass));
            expect_equal(std::string_view { "cancelled" }, verify_result_name(verify_result_t::cancelled));
        };
    };
};
