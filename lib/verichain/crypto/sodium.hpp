#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdlib>
#include <verichain/common/bytes.hpp>

namespace verichain::crypto::sodium
{
    typedef verichain::error error;

    extern "C" {
#       include <sodium.h>
    }

    extern void ensure_initialized();
    extern void random_bytes(std::span<uint8_t> out);
}
