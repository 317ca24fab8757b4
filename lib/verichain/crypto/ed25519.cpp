/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "ed25519.hpp"
#include "sodium.hpp"

namespace verichain::crypto::ed25519 {
    bool verify(const signature_t &sig, const buffer &msg, const vkey_t &vk)
    {
        sodium::ensure_initialized();
        return sodium::crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }

    signature_t sign(const buffer &msg, const skey_t &sk)
    {
        sodium::ensure_initialized();
        signature_t sig;
        if (sodium::crypto_sign_detached(sig.data(), nullptr, msg.data(), msg.size(), sk.data()) != 0) [[unlikely]]
            throw error("libsodium error: failed to create a signature!");
        return sig;
    }

    key_pair_t create_from_seed(const seed_t &sd)
    {
        sodium::ensure_initialized();
        key_pair_t res;
        if (sodium::crypto_sign_seed_keypair(res.vk.data(), res.sk.data(), sd.data()) != 0)
            throw error("failed to generate a cryptographic key pair!");
        return res;
    }
}
