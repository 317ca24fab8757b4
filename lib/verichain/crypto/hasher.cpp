/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "blake2b.hpp"
#include "hasher.hpp"
#include "sha256.hpp"
#include "sha3.hpp"

namespace verichain::crypto {
    using digest_func_ptr = void(*)(const hash_span_t &, const buffer &);

    const std::vector<std::string_view> &hasher_t::supported_names()
    {
        static const std::vector<std::string_view> names { "sha3-256", "blake2b-256", "sha256" };
        return names;
    }

    hasher_t hasher_t::from_name(const std::string_view name)
    {
        if (name == "sha3-256")
            return { std::string { name }, static_cast<digest_func_ptr>(sha3::digest) };
        if (name == "blake2b-256")
            return { std::string { name }, static_cast<digest_func_ptr>(blake2b::digest) };
        if (name == "sha256")
            return { std::string { name }, static_cast<digest_func_ptr>(sha256::digest) };
        throw error(fmt::format("unsupported hash algorithm: '{}'; supported: {}", name, fmt::join(supported_names(), ", ")));
    }

    hasher_t::hasher_t():
        hasher_t { from_name(default_name) }
    {
    }

    hasher_t::hasher_t(std::string name, hash_func func):
        _name { std::move(name) },
        _func { std::move(func) }
    {
        if (!_func) [[unlikely]]
            throw error(fmt::format("hash algorithm {} has no implementation", _name));
    }
}
