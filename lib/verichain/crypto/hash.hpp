#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <functional>
#include <verichain/common/bytes.hpp>

namespace verichain::crypto
{
    using hash_t = byte_array<32>;
    using hash_span_t = std::span<uint8_t, sizeof(hash_t)>;
    using hash_func = std::function<void(const hash_span_t &, const buffer &)>;
}
