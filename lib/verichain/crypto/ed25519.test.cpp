/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include "ed25519.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::crypto;
    using namespace std::string_view_literals;
}

suite verichain_crypto_ed25519_suite = [] {
    "verichain::crypto::ed25519"_test = [] {
        const auto kp = ed25519::create_from_seed(ed25519::seed_t::from_hex("0000000000000000000000000000000000000000000000000000000000000000"));
        "seed derivation"_test = [&] {
            // the well-known public key of the all-zero seed
            expect_equal(ed25519::vkey_t::from_hex("3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da29"), kp.vk);
        };
        "sign and verify"_test = [&] {
            const auto msg = "{\"v\":1}"sv;
            const auto sig = ed25519::sign(msg, kp.sk);
            expect(ed25519::verify(sig, msg, kp.vk));
            expect(!ed25519::verify(sig, "{\"v\":2}"sv, kp.vk));
            auto bad_sig = sig;
            bad_sig[0] ^= 0x01;
            expect(!ed25519::verify(bad_sig, msg, kp.vk));
        };
        "wrong key"_test = [&] {
            const auto other = ed25519::create_from_seed(ed25519::seed_t::from_hex("0101010101010101010101010101010101010101010101010101010101010101"));
            const auto sig = ed25519::sign("payload"sv, kp.sk);
            expect(!ed25519::verify(sig, "payload"sv, other.vk));
        };
    };
};
