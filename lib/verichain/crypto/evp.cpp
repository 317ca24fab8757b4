/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include "evp.hpp"

namespace verichain::crypto::evp {
    static std::string last_error()
    {
        std::array<char, 256> buf {};
        ERR_error_string_n(ERR_get_error(), buf.data(), buf.size());
        return buf.data();
    }

    void digest(const EVP_MD *md, const hash_span_t &out, const buffer &in)
    {
        if (!md) [[unlikely]]
            throw error("openssl: the requested message digest is not available");
        if (EVP_MD_size(md) != static_cast<int>(out.size())) [[unlikely]]
            throw error(fmt::format("openssl: digest {} produces {} bytes but {} are expected", EVP_MD_name(md), EVP_MD_size(md), out.size()));
        const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx { EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx) [[unlikely]]
            throw error("openssl: failed to allocate a message digest context");
        unsigned int out_sz = 0;
        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
                || EVP_DigestUpdate(ctx.get(), in.data(), in.size()) != 1
                || EVP_DigestFinal_ex(ctx.get(), out.data(), &out_sz) != 1) [[unlikely]]
            throw error(fmt::format("openssl: {} failed: {}", EVP_MD_name(md), last_error()));
        if (out_sz != out.size()) [[unlikely]]
            throw error(fmt::format("openssl: {} returned {} bytes instead of {}", EVP_MD_name(md), out_sz, out.size()));
    }
}
