#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "hash.hpp"

typedef struct evp_md_st EVP_MD;

namespace verichain::crypto::evp
{
    // Computes a 256-bit digest with the given OpenSSL message digest implementation.
    extern void digest(const EVP_MD *md, const hash_span_t &out, const buffer &in);
}
