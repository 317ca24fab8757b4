/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <map>
#include <mutex>
#include <shared_mutex>
#include "memory.hpp"

namespace verichain::storage::memory {
    struct backend_t::impl {
        void seed(const std::string_view anchor_id, const tail_t &tail)
        {
            std::unique_lock lk { _mutex };
            auto &chain = _chain(anchor_id);
            if (chain.records.empty())
                chain.base = tail;
        }

        bool append(const ledger::record_t &rec)
        {
            std::unique_lock lk { _mutex };
            auto &chain = _chain(rec.anchor_id);
            const auto &expected = chain.records.empty() ? chain.base.hash : chain.records.back().hash;
            const auto &last_id = chain.records.empty() ? chain.base.id : chain.records.back().id;
            if (rec.prev_hash != expected || rec.id <= last_id)
                return false;
            chain.records.emplace_back(rec);
            ++_num_records;
            return true;
        }

        std::optional<tail_t> tail(const std::string_view anchor_id) const
        {
            std::shared_lock lk { _mutex };
            const auto it = _chains.find(anchor_id);
            if (it == _chains.end())
                return {};
            const auto &chain = it->second;
            if (chain.records.empty()) {
                if (chain.base.length == 0)
                    return {};
                return chain.base;
            }
            return tail_t { chain.records.back().id, chain.records.back().hash, chain.base.length + chain.records.size() };
        }

        void fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const
        {
            // copy out so that the observer runs without the lock held
            std::vector<ledger::record_t> res {};
            {
                std::shared_lock lk { _mutex };
                if (const auto it = _chains.find(anchor_id); it != _chains.end()) {
                    for (const auto &rec: it->second.records) {
                        if (range.contains(rec.id))
                            res.emplace_back(rec);
                    }
                }
            }
            for (auto &rec: res)
                obs(std::move(rec));
        }

        std::vector<ledger::record_t> search(const search_filter_t &filter) const
        {
            std::vector<ledger::record_t> res {};
            {
                std::shared_lock lk { _mutex };
                for (const auto &[anchor_id, chain]: _chains) {
                    for (const auto &rec: chain.records) {
                        if (filter.matches(rec))
                            res.emplace_back(rec);
                    }
                }
            }
            std::sort(res.begin(), res.end(), [](const auto &a, const auto &b) {
                if (a.ts != b.ts)
                    return a.ts > b.ts;
                return a.id > b.id;
            });
            if (res.size() > filter.limit)
                res.resize(filter.limit);
            return res;
        }

        std::vector<std::string> anchors() const
        {
            std::vector<std::string> res {};
            std::shared_lock lk { _mutex };
            for (const auto &[anchor_id, chain]: _chains) {
                if (!chain.records.empty())
                    res.emplace_back(anchor_id);
            }
            return res;
        }

        void put_checkpoint(const ledger::checkpoint_t &cp)
        {
            std::unique_lock lk { _mutex };
            if (_checkpoint_idx.contains(cp.id))
                throw error(fmt::format("checkpoint {} already exists", cp.id));
            _checkpoint_idx.try_emplace(cp.id, _checkpoints.size());
            _checkpoints.emplace_back(cp);
        }

        std::optional<ledger::checkpoint_t> checkpoint(const std::string_view id) const
        {
            std::shared_lock lk { _mutex };
            if (const auto it = _checkpoint_idx.find(id); it != _checkpoint_idx.end())
                return _checkpoints.at(it->second);
            return {};
        }

        std::vector<ledger::checkpoint_t> checkpoints(const std::string_view anchor_id) const
        {
            std::vector<ledger::checkpoint_t> res {};
            std::shared_lock lk { _mutex };
            for (const auto &cp: _checkpoints) {
                if (cp.anchor_id == anchor_id)
                    res.emplace_back(cp);
            }
            return res;
        }

        backend_stats_t stats() const
        {
            std::shared_lock lk { _mutex };
            backend_stats_t res { _num_records, 0, _checkpoints.size() };
            for (const auto &[anchor_id, chain]: _chains) {
                if (!chain.records.empty())
                    ++res.anchors;
            }
            return res;
        }

        ledger::hash_t base(const std::string_view anchor_id) const
        {
            std::shared_lock lk { _mutex };
            if (const auto it = _chains.find(anchor_id); it != _chains.end())
                return it->second.base.hash;
            return ledger::genesis_hash;
        }
    private:
        struct chain_t {
            tail_t base {};
            std::vector<ledger::record_t> records {};
        };

        mutable std::shared_mutex _mutex {};
        std::map<std::string, chain_t, std::less<>> _chains {};
        std::vector<ledger::checkpoint_t> _checkpoints {};
        std::map<std::string, size_t, std::less<>> _checkpoint_idx {};
        uint64_t _num_records = 0;

        chain_t &_chain(const std::string_view anchor_id)
        {
            auto it = _chains.find(anchor_id);
            if (it == _chains.end()) [[unlikely]]
                it = _chains.try_emplace(std::string { anchor_id }).first;
            return it->second;
        }
    };

    backend_t::backend_t():
        _impl { std::make_unique<impl>() }
    {
    }

    backend_t::~backend_t() =default;

    void backend_t::seed(const std::string_view anchor_id, const tail_t &tail)
    {
        _impl->seed(anchor_id, tail);
    }

    std::string backend_t::name() const
    {
        return "volatile";
    }

    bool backend_t::append(const ledger::record_t &rec)
    {
        return _impl->append(rec);
    }

    std::optional<tail_t> backend_t::tail(const std::string_view anchor_id) const
    {
        return _impl->tail(anchor_id);
    }

    void backend_t::fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const
    {
        _impl->fetch(anchor_id, range, obs);
    }

    std::vector<ledger::record_t> backend_t::search(const search_filter_t &filter) const
    {
        return _impl->search(filter);
    }

    std::vector<std::string> backend_t::anchors() const
    {
        return _impl->anchors();
    }

    void backend_t::put_checkpoint(const ledger::checkpoint_t &cp)
    {
        _impl->put_checkpoint(cp);
    }

    std::optional<ledger::checkpoint_t> backend_t::checkpoint(const std::string_view id) const
    {
        return _impl->checkpoint(id);
    }

    std::vector<ledger::checkpoint_t> backend_t::checkpoints(const std::string_view anchor_id) const
    {
        return _impl->checkpoints(anchor_id);
    }

    backend_stats_t backend_t::stats() const
    {
        return _impl->stats();
    }

    ledger::hash_t backend_t::base(const std::string_view anchor_id) const
    {
        return _impl->base(anchor_id);
    }
}
