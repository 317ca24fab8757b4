/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include "hasher.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::crypto;
    using namespace std::string_view_literals;
}

suite verichain_crypto_hasher_suite = [] {
    "verichain::crypto::hasher"_test = [] {
        "sha3-256 test vectors"_test = [] {
            const auto h = hasher_t::from_name("sha3-256");
            expect_equal(hash_t::from_hex("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a"), h.digest(""sv));
            expect_equal(hash_t::from_hex("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532"), h.digest("abc"sv));
        };
        "sha256 test vectors"_test = [] {
            const auto h = hasher_t::from_name("sha256");
            expect_equal(hash_t::from_hex("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"), h.digest(""sv));
            expect_equal(hash_t::from_hex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), h.digest("abc"sv));
        };
        "blake2b-256"_test = [] {
            const auto h = hasher_t::from_name("blake2b-256");
            expect_equal(hash_t::from_hex("0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8"), h.digest(""sv));
        };
        "default and names"_test = [] {
            const hasher_t h {};
            expect_equal(std::string { "sha3-256" }, h.name());
            expect_equal(size_t { 3 }, hasher_t::supported_names().size());
            expect(throws<error>([] { hasher_t::from_name("md5"); }));
        };
        "algorithms differ"_test = [] {
            const auto msg = "{\"anchor_id\":\"x\"}"sv;
            expect(hasher_t::from_name("sha3-256").digest(msg) != hasher_t::from_name("sha256").digest(msg));
            expect(hasher_t::from_name("sha3-256").digest(msg) != hasher_t::from_name("blake2b-256").digest(msg));
        };
    };
};
