/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include <verichain/crypto/hasher.hpp>
#include "merkle.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::ledger;

    std::vector<merkle::hash_t> make_leaves(const crypto::hasher_t &h, const size_t n)
    {
        std::vector<merkle::hash_t> res {};
        for (size_t i = 0; i < n; ++i)
            res.emplace_back(h.digest(fmt::format("leaf-{}", i)));
        return res;
    }
}

suite verichain_ledger_merkle_suite = [] {
    "verichain::ledger::merkle"_test = [] {
        const crypto::hasher_t h {};
        const auto &hf = h.func();
        "small trees"_test = [&] {
            expect_equal(merkle::hash_t::from_hex("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a"), merkle::root({}, hf));
            const auto l = make_leaves(h, 3);
            expect_equal(l[0], merkle::root(std::span { l.data(), 1 }, hf));
            expect_equal(merkle::node(l[0], l[1], hf), merkle::root(std::span { l.data(), 2 }, hf));
            // the last node of an odd level is paired with itself
            expect_equal(merkle::node(merkle::node(l[0], l[1], hf), merkle::node(l[2], l[2], hf), hf), merkle::root(l, hf));
        };
        "node hashes are domain separated"_test = [&] {
            const auto l = make_leaves(h, 2);
            uint8_vector plain {};
            plain.insert(plain.end(), l[0].begin(), l[0].end());
            plain.insert(plain.end(), l[1].begin(), l[1].end());
            expect(h.digest(plain) != merkle::node(l[0], l[1], hf));
        };
        "proofs"_test = [&] {
            for (size_t n = 1; n <= 17; ++n) {
                const auto leaves = make_leaves(h, n);
                const auto r = merkle::root(leaves, hf);
                for (size_t i = 0; i < n; ++i) {
                    const auto p = merkle::prove(leaves, i, hf);
                    expect(merkle::verify(r, leaves[i], p, hf)) << n << i;
                    // a proof never validates a different leaf
                    expect(!merkle::verify(r, leaves[(i + 1) % n], p, hf) || n == 1) << n << i;
                    expect(merkle::proof_t::from_json(p.to_json()) == p);
                }
            }
        };
        "proof size is logarithmic"_test = [&] {
            const auto leaves = make_leaves(h, 1000);
            expect_equal(10ULL, merkle::prove(leaves, 517, hf).path.size());
        };
        "out of range"_test = [&] {
            const auto leaves = make_leaves(h, 4);
            expect(throws<error>([&] { static_cast<void>(merkle::prove(leaves, 4, hf)); }));
            auto p = merkle::prove(leaves, 1, hf);
            p.index = 4;
            expect(!merkle::verify(merkle::root(leaves, hf), leaves[1], p, hf));
        };
    };
};
