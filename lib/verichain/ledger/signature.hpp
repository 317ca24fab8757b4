#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <memory>
#include <verichain/crypto/ed25519.hpp>
#include "record.hpp"

namespace verichain::ledger {
    struct signature_verifier_t {
        virtual ~signature_verifier_t() =default;
        // false for invalid signatures and for keys the verifier does not know
        [[nodiscard]] virtual bool verify(const buffer &msg, const buffer &sig, std::string_view key_ref) const =0;
    };
    using signature_verifier_ptr_t = std::shared_ptr<const signature_verifier_t>;

    struct ed25519_verifier_t: signature_verifier_t {
        static constexpr std::string_view algorithm = "ed25519";

        explicit ed25519_verifier_t(std::map<std::string, crypto::ed25519::vkey_t> keys={});
        bool verify(const buffer &msg, const buffer &sig, std::string_view key_ref) const override;
    private:
        std::map<std::string, crypto::ed25519::vkey_t, std::less<>> _keys {};
    };

    // Signature verifiers by algorithm name.
    struct verifier_registry_t {
        void add(std::string algorithm, signature_verifier_ptr_t verifier);
        [[nodiscard]] const signature_verifier_t *find(std::string_view algorithm) const;
    private:
        std::map<std::string, signature_verifier_ptr_t, std::less<>> _verifiers {};
    };

    struct signer_t {
        virtual ~signer_t() =default;
        [[nodiscard]] virtual signature_t sign(const buffer &msg) const =0;
    };
    using signer_ptr_t = std::shared_ptr<const signer_t>;

    struct ed25519_signer_t: signer_t {
        ed25519_signer_t(const crypto::ed25519::seed_t &seed, std::string key_ref);
        [[nodiscard]] signature_t sign(const buffer &msg) const override;

        [[nodiscard]] const crypto::ed25519::vkey_t &vkey() const noexcept
        {
            return _keys.vk;
        }
    private:
        crypto::ed25519::key_pair_t _keys;
        std::string _key_ref;
    };
}
