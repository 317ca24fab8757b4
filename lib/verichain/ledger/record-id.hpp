#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cstdint>
#include <mutex>
#include <string>
#include <verichain/common/mutex.hpp>

namespace verichain::ledger {
    // UUIDv7 in its canonical 36-character lowercase text form. The text form sorts in creation order.
    using record_id_t = std::string;

    struct record_id_parts_t {
        uint64_t unix_ms = 0;
        uint16_t counter = 0;
    };

    extern bool valid_record_id(std::string_view id) noexcept;
    extern record_id_parts_t parse_record_id(std::string_view id);

    /*
     * Generates UUIDv7 identifiers: 48 bits of Unix time in milliseconds, the version nibble,
     * a 12-bit counter that keeps identifiers created within one millisecond ordered,
     * the variant bits and 62 random bits.
     */
    struct record_id_generator_t {
        // Strictly greater than every identifier this generator has returned before.
        record_id_t next();
        // Additionally strictly greater than the given identifier, which may come from another process.
        record_id_t next_after(std::string_view prev);
    private:
        alignas(mutex::alignment) std::mutex _mutex {};
        uint64_t _last_ms = 0;
        uint16_t _counter = 0;

        record_id_t _next_locked(const record_id_parts_t &floor);
    };
}
