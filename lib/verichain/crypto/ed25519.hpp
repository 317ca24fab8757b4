#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/bytes.hpp>

namespace verichain::crypto::ed25519
{
    using skey_t = secure_byte_array<64>;
    using seed_t = secure_byte_array<32>;
    using vkey_t = byte_array<32>;
    using signature_t = byte_array<64>;

    struct key_pair_t {
        skey_t sk;
        vkey_t vk;
    };

    extern bool verify(const signature_t &sig, const buffer &msg, const vkey_t &vk);
    extern signature_t sign(const buffer &msg, const skey_t &sk);
    extern key_pair_t create_from_seed(const seed_t &sd);
}
