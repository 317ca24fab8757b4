#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <limits>
#include <typeinfo>
#include "format.hpp"
#include "error.hpp"

namespace verichain {
    // Converts between integer types and throws when the value does not fit into the target type.
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        using to_limits = std::numeric_limits<TO>;
        using from_limits = std::numeric_limits<FROM>;
        if constexpr (from_limits::is_signed == to_limits::is_signed) {
            if (from > to_limits::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is larger than {}",
                    typeid(FROM).name(), from, typeid(TO).name(), to_limits::max()));
            if (from < to_limits::min()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is smaller than {}",
                    typeid(FROM).name(), from, typeid(TO).name(), to_limits::min()));
            return static_cast<TO>(from);
        } else if constexpr (from_limits::is_signed) {
            if (from < 0) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is negative", typeid(FROM).name(), from, typeid(TO).name()));
            if (static_cast<std::make_unsigned_t<FROM>>(from) > to_limits::max()) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        } else {
            if (from > static_cast<std::make_unsigned_t<TO>>(to_limits::max())) [[unlikely]]
                throw error(fmt::format("can't convert {} {} to {}: the value is too big", typeid(FROM).name(), from, typeid(TO).name()));
            return static_cast<TO>(from);
        }
    }
}
