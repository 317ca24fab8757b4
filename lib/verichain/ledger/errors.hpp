#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/codec/canonical.hpp>
#include <verichain/common/error.hpp>

namespace verichain::ledger {
    // a malformed draft; nothing has been hashed or stored
    using encoding_error = codec::canonical::encoding_error;

    // concurrent appends kept moving the tail of a chain and the retry budget is exhausted
    struct chain_conflict_error: error {
        using error::error;
    };

    struct config_error: error {
        using error::error;
    };
}
