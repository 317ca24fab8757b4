/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "signature.hpp"

namespace verichain::ledger {
    ed25519_verifier_t::ed25519_verifier_t(std::map<std::string, crypto::ed25519::vkey_t> keys):
        _keys { keys.begin(), keys.end() }
    {
    }

    bool ed25519_verifier_t::verify(const buffer &msg, const buffer &sig, const std::string_view key_ref) const
    {
        const auto it = _keys.find(key_ref);
        if (it == _keys.end())
            return false;
        if (sig.size() != sizeof(crypto::ed25519::signature_t))
            return false;
        crypto::ed25519::signature_t s {};
        std::copy(sig.begin(), sig.end(), s.begin());
        return crypto::ed25519::verify(s, msg, it->second);
    }

    void verifier_registry_t::add(std::string algorithm, signature_verifier_ptr_t verifier)
    {
        if (!verifier) [[unlikely]]
            throw error(fmt::format("a null verifier for algorithm {}", algorithm));
        _verifiers.insert_or_assign(std::move(algorithm), std::move(verifier));
    }

    const signature_verifier_t *verifier_registry_t::find(const std::string_view algorithm) const
    {
        if (const auto it = _verifiers.find(algorithm); it != _verifiers.end())
            return it->second.get();
        return nullptr;
    }

    ed25519_signer_t::ed25519_signer_t(const crypto::ed25519::seed_t &seed, std::string key_ref):
        _keys { crypto::ed25519::create_from_seed(seed) },
        _key_ref { std::move(key_ref) }
    {
    }

    signature_t ed25519_signer_t::sign(const buffer &msg) const
    {
        const auto sig = crypto::ed25519::sign(msg, _keys.sk);
        return { uint8_vector(static_cast<buffer>(sig)), std::string { ed25519_verifier_t::algorithm }, _key_ref };
    }
}
