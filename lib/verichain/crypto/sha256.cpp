/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <openssl/evp.h>
#include "evp.hpp"
#include "sha256.hpp"

namespace verichain::crypto::sha256 {
    void digest(const hash_span_t &out, const buffer &in)
    {
        evp::digest(EVP_sha256(), out, in);
    }
}
