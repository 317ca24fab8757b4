#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <span>
#include <vector>
#include <verichain/codec/json.hpp>
#include <verichain/crypto/hash.hpp>

namespace verichain::ledger::merkle {
    using hash_t = crypto::hash_t;
    using hash_func = crypto::hash_func;
    using leaf_span = std::span<const hash_t>;

    // interior nodes are prefixed so that they can never be confused with a leaf
    static constexpr uint8_t node_prefix = 0x01;

    struct proof_step_t {
        hash_t sibling {};
        // the sibling is the left operand of the parent node
        bool left = false;

        bool operator==(const proof_step_t &o) const =default;
    };

    struct proof_t {
        uint64_t index = 0;
        uint64_t leaf_count = 0;
        std::vector<proof_step_t> path {};

        static proof_t from_json(const codec::json::value &jv);
        [[nodiscard]] codec::json::object to_json() const;
        bool operator==(const proof_t &o) const =default;
    };

    extern hash_t node(const hash_t &left, const hash_t &right, const hash_func &hf);
    // An odd node at any level is paired with itself. A single leaf is its own root. No leaves hash to H("").
    extern hash_t root(leaf_span leaves, const hash_func &hf);
    extern proof_t prove(leaf_span leaves, size_t index, const hash_func &hf);
    extern bool verify(const hash_t &root, const hash_t &leaf, const proof_t &proof, const hash_func &hf);
}
