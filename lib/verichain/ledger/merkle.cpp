/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <array>
#include <cstring>
#include "merkle.hpp"

namespace verichain::ledger::merkle {
    namespace json = codec::json;

    hash_t node(const hash_t &left, const hash_t &right, const hash_func &hf)
    {
        std::array<uint8_t, 1 + sizeof(hash_t) * 2> data;
        data[0] = node_prefix;
        std::memcpy(data.data() + 1, left.data(), left.size());
        std::memcpy(data.data() + 1 + left.size(), right.data(), right.size());
        hash_t res;
        hf(res, buffer { data.data(), data.size() });
        return res;
    }

    static std::vector<hash_t> next_level(const std::vector<hash_t> &level, const hash_func &hf)
    {
        std::vector<hash_t> res {};
        res.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2)
            res.emplace_back(node(level[i], i + 1 < level.size() ? level[i + 1] : level[i], hf));
        return res;
    }

    hash_t root(const leaf_span leaves, const hash_func &hf)
    {
        if (leaves.empty()) {
            hash_t res;
            hf(res, buffer { std::string_view {} });
            return res;
        }
        std::vector<hash_t> level { leaves.begin(), leaves.end() };
        while (level.size() > 1)
            level = next_level(level, hf);
        return level.front();
    }

    proof_t prove(const leaf_span leaves, const size_t index, const hash_func &hf)
    {
        if (index >= leaves.size()) [[unlikely]]
            throw error(fmt::format("leaf index {} is out of range for {} leaves", index, leaves.size()));
        proof_t res { index, leaves.size() };
        std::vector<hash_t> level { leaves.begin(), leaves.end() };
        size_t idx = index;
        while (level.size() > 1) {
            if (idx % 2 == 1)
                res.path.emplace_back(proof_step_t { level[idx - 1], true });
            else
                res.path.emplace_back(proof_step_t { idx + 1 < level.size() ? level[idx + 1] : level[idx], false });
            level = next_level(level, hf);
            idx /= 2;
        }
        return res;
    }

    bool verify(const hash_t &root, const hash_t &leaf, const proof_t &proof, const hash_func &hf)
    {
        if (proof.index >= proof.leaf_count)
            return false;
        hash_t cur = leaf;
        for (const auto &step: proof.path)
            cur = step.left ? node(step.sibling, cur, hf) : node(cur, step.sibling, hf);
        return cur == root;
    }

    proof_t proof_t::from_json(const json::value &jv)
    {
        const auto &obj = jv.as_object();
        proof_t res { json::get_uint(obj, "index", 0), json::get_uint(obj, "leaf_count", 0) };
        if (const auto *path = json::find(obj, "path")) {
            for (const auto &step: path->as_array()) {
                const auto &s = step.as_object();
                res.path.emplace_back(proof_step_t { hash_t::from_hex(json::get_string(s, "hash", "")), json::get_string(s, "side", "") == "left" });
            }
        }
        return res;
    }

    json::object proof_t::to_json() const
    {
        json::array steps {};
        for (const auto &step: path)
            steps.emplace_back(json::object { { "hash", to_hex(step.sibling) }, { "side", step.left ? "left" : "right" } });
        return {
            { "index", index },
            { "leaf_count", leaf_count },
            { "path", std::move(steps) }
        };
    }
}
