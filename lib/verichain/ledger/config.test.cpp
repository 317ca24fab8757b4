/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include "config.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::ledger;
    namespace json = verichain::codec::json;
}

suite verichain_ledger_config_suite = [] {
    "verichain::ledger::config"_test = [] {
        "defaults"_test = [] {
            const auto cfg = config_t::from_json(json::object {});
            expect(!cfg.durable_backend());
            expect_equal(std::string { "sha3-256" }, cfg.hash_algorithm);
            expect_equal(1048576ULL, cfg.max_payload_bytes);
            expect_equal(3ULL, cfg.append_retries);
            expect_near(0.5, cfg.trust.weights.quality_mean);
            expect_near(0.7, cfg.trust.pass_threshold);
            expect_equal(4ULL, cfg.trust.quality_keys.size());
            expect_equal(1000ULL, cfg.checkpoint.every_records);
            expect_equal(300LL, static_cast<long long>(cfg.checkpoint.max_interval.count()));
            expect(!cfg.checkpoint.signing_seed.has_value());
            expect_equal(5ULL, cfg.durable.pool_size);
        };
        "full document"_test = [] {
            const auto cfg = config_t::from_json(json::parse(R"({
                "backend": "durable",
                "durable": { "dsn": "lmdb:/tmp/x", "pool_size": 2, "op_timeout_ms": 250 },
                "hash_algorithm": "blake2b-256",
                "append_retries": 5,
                "trust": {
                    "weights": { "quality_mean": 0.25, "pqc_rate": 0.25, "verify_rate": 0.25, "continuity": 0.25 },
                    "pass_threshold": 0.9,
                    "quality_keys": ["score"]
                },
                "checkpoint": { "every_records": 10, "max_interval_sec": 0, "key_ref": "cp-key",
                    "signing_seed": "0000000000000000000000000000000000000000000000000000000000000000" },
                "kinds": ["RC_ATTESTATION"],
                "keys": { "producer-1": "3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da29" }
            })"));
            expect(cfg.durable_backend());
            expect_equal(std::string { "lmdb:/tmp/x" }, cfg.durable.dsn);
            expect_equal(250LL, static_cast<long long>(cfg.durable.op_timeout.count()));
            expect_equal(std::string { "blake2b-256" }, cfg.hash_algorithm);
            expect_equal(5ULL, cfg.append_retries);
            expect(cfg.trust.quality_keys == std::vector<std::string> { "score" });
            expect_equal(0LL, static_cast<long long>(cfg.checkpoint.max_interval.count()));
            expect(cfg.checkpoint.signing_seed.has_value());
            expect_equal(std::string { "cp-key" }, cfg.checkpoint.key_ref);
            expect_equal(1ULL, cfg.kinds.size());
            expect(cfg.keys.contains("producer-1"));
        };
        "invalid documents"_test = [] {
            const auto bad = [](const std::string_view text) {
                return throws<config_error>([&] { static_cast<void>(config_t::from_json(json::parse(text))); });
            };
            expect(bad(R"({"backend":"cloud"})"));
            expect(bad(R"({"hash_algorithm":"md5"})"));
            expect(bad(R"({"trust":{"weights":{"quality_mean":0.6}}})"));
            expect(bad(R"({"trust":{"weights":{"quality_mean":1.5,"pqc_rate":-0.7}}})"));
            expect(bad(R"({"trust":{"pass_threshold":2}})"));
            expect(bad(R"({"checkpoint":{"every_records":0}})"));
            expect(bad(R"({"checkpoint":{"signing_seed":"abcd"}})"));
            expect(bad(R"({"kinds":["lower_case"]})"));
            expect(bad(R"({"kinds":["CREATE"]})"));
            expect(bad(R"({"keys":{"k":"zz"}})"));
            expect(bad(R"({"append_retries":"three"})"));
            expect(bad(R"([1, 2])"));
        };
        "weights within the tolerance are accepted"_test = [] {
            expect(boost::ut::nothrow([] {
                static_cast<void>(config_t::from_json(json::parse(R"({"trust":{"weights":{"quality_mean":0.5000000001}}})")));
            }));
        };
        "missing file"_test = [] {
            expect(throws<config_error>([] { static_cast<void>(config_t::load("/nonexistent/verichain.json")); }));
        };
    };
};
