/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "sodium.hpp"

namespace verichain::crypto::sodium {
    void ensure_initialized()
    {
        struct sodium_initializer {
            explicit sodium_initializer()
            {
                if (sodium_init() == -1) [[unlikely]]
                    throw error("Failed to initialize libsodium!");
            }
        };
        // will be initialized on the first call, after that does nothing
        static sodium_initializer init {};
    }

    void random_bytes(std::span<uint8_t> out)
    {
        ensure_initialized();
        randombytes_buf(out.data(), out.size());
    }
}
