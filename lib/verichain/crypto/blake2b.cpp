/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "blake2b.hpp"
#include "sodium.hpp"

namespace verichain::crypto::blake2b {
    void digest(const hash_span_t &out, const buffer &in)
    {
        sodium::ensure_initialized();
        if (sodium::crypto_generichash(out.data(), out.size(), in.data(), in.size(), nullptr, 0) != 0)
            throw error("libsodium error: can't compute hash!");
    }
}
