#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstddef>

namespace verichain::mutex {
    // keeps independently locked mutexes on separate cache lines
    static constexpr size_t alignment = 64;
}
