#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "json.hpp"

/*
 * Deterministic JSON text used as hash input:
 * - object keys are sorted by their UTF-8 bytes at every nesting level, arrays keep their order;
 * - no whitespace; strings escape only the quote, the backslash and control characters;
 * - integers are plain decimals, doubles use the shortest round-trip form and always carry
 *   a decimal point or an exponent so that 1 and 1.0 produce different text;
 * - NaN, infinities, invalid UTF-8 and nesting deeper than max_depth are rejected.
 */
namespace verichain::codec::canonical {
    static constexpr size_t max_depth = 64;

    struct encoding_error: error {
        using error::error;
    };

    extern void encode(std::string &out, const json::value &jv);
    extern std::string encode(const json::value &jv);
    extern void encode_string(std::string &out, std::string_view s);
    extern bool valid_utf8(std::string_view s) noexcept;
}
