#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <string>
#include <vector>
#include "hash.hpp"

namespace verichain::crypto {
    // A named 256-bit digest function. The name is persisted together with checkpoints.
    struct hasher_t {
        static constexpr std::string_view default_name = "sha3-256";

        static hasher_t from_name(std::string_view name);
        static const std::vector<std::string_view> &supported_names();

        hasher_t();
        hasher_t(std::string name, hash_func func);

        [[nodiscard]] const std::string &name() const noexcept
        {
            return _name;
        }

        void digest(const hash_span_t &out, const buffer &in) const
        {
            _func(out, in);
        }

        [[nodiscard]] hash_t digest(const buffer &in) const
        {
            hash_t out;
            _func(out, in);
            return out;
        }

        [[nodiscard]] const hash_func &func() const noexcept
        {
            return _func;
        }
    private:
        std::string _name;
        hash_func _func;
    };
}
