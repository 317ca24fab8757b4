#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "hash.hpp"

namespace verichain::crypto::sha3
{
    extern void digest(const hash_span_t &out, const buffer &in);

    template<typename T=hash_t>
    T digest(const buffer &in)
    {
        static_assert(sizeof(T) == sizeof(hash_t));
        T out;
        digest(out, in);
        return out;
    }
}
