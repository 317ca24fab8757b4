/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <mutex>
#include <verichain/common/logger.hpp>
#include "fallback.hpp"

namespace verichain::storage {
    fallback_t::fallback_t(durable_factory_t factory, state_observer_t observer):
        _factory { std::move(factory) },
        _observer { std::move(observer) }
    {
        try {
            _durable = _factory();
            if (!_durable) [[unlikely]]
                throw error("the durable backend factory returned no backend");
        } catch (const backend_unavailable_error &ex) {
            _degraded = true;
            logger::warn("storage: the durable backend is unavailable at startup, continuing with the volatile one: {}", ex.what());
            if (_observer)
                _observer(true);
        }
    }

    template<typename F>
    auto fallback_t::_run(const std::string_view op, const F &f) const
    {
        {
            std::shared_lock lk { _mutex };
            if (!_degraded) {
                try {
                    return f(*_durable, true);
                } catch (const backend_unavailable_error &ex) {
                    lk.unlock();
                    _switch(fmt::format("{} failed: {}", op, ex.what()));
                }
            }
        }
        std::shared_lock lk { _mutex };
        return f(*_volatile, false);
    }

    void fallback_t::_switch(const std::string_view reason) const
    {
        size_t num_seeded = 0;
        {
            std::unique_lock lk { _mutex };
            if (_degraded)
                return;
            _degraded = true;
            std::scoped_lock tlk { _tails_mutex };
            for (const auto &[anchor_id, t]: _durable_tails)
                _volatile->seed(anchor_id, t);
            num_seeded = _durable_tails.size();
        }
        logger::warn("storage: switched to the volatile backend with {} continued chains: {}", num_seeded, reason);
        if (_observer)
            _observer(true);
    }

    void fallback_t::_remember_tail(const std::optional<tail_t> &t, const std::string_view anchor_id) const
    {
        if (!t)
            return;
        std::scoped_lock lk { _tails_mutex };
        if (auto it = _durable_tails.find(anchor_id); it != _durable_tails.end())
            it->second = *t;
        else
            _durable_tails.try_emplace(std::string { anchor_id }, *t);
    }

    void fallback_t::_remember_append(const ledger::record_t &rec) const
    {
        std::scoped_lock lk { _tails_mutex };
        if (auto it = _durable_tails.find(rec.anchor_id); it != _durable_tails.end()) {
            if (it->second.hash == rec.prev_hash)
                it->second = tail_t { rec.id, rec.hash, it->second.length + 1 };
        } else if (rec.prev_hash == ledger::genesis_hash) {
            _durable_tails.try_emplace(rec.anchor_id, tail_t { rec.id, rec.hash, 1 });
        }
    }

    bool fallback_t::degraded() const
    {
        std::shared_lock lk { _mutex };
        return _degraded;
    }

    backfill_result_t fallback_t::backfill()
    {
        backfill_result_t res {};
        {
            std::unique_lock lk { _mutex };
            if (!_degraded)
                return res;
            try {
                if (!_durable)
                    _durable = _factory();
                for (const auto &anchor_id: _volatile->anchors()) {
                    uint64_t anchor_conflicts = 0;
                    for (const auto &rec: _volatile->fetch(anchor_id)) {
                        if (_durable->append(rec)) {
                            ++res.copied;
                            continue;
                        }
                        const auto existing = _durable->fetch(anchor_id, range_t { rec.id, rec.id });
                        if (!existing.empty() && existing.front().hash == rec.hash) {
                            ++res.skipped;
                            continue;
                        }
                        logger::warn("storage: backfill: record {} of anchor {} does not link to the durable tail", rec.id, anchor_id);
                        ++anchor_conflicts;
                        break;
                    }
                    res.conflicts += anchor_conflicts;
                    if (anchor_conflicts)
                        continue;
                    for (const auto &cp: _volatile->checkpoints(anchor_id)) {
                        if (_durable->checkpoint(cp.id)) {
                            ++res.skipped;
                        } else {
                            _durable->put_checkpoint(cp);
                            ++res.copied;
                        }
                    }
                }
            } catch (const backend_unavailable_error &ex) {
                logger::warn("storage: backfill stopped, the durable backend is still unavailable: {}", ex.what());
                return res;
            }
            if (res.conflicts == 0) {
                _degraded = false;
                _volatile = std::make_shared<memory::backend_t>();
                std::scoped_lock tlk { _tails_mutex };
                _durable_tails.clear();
                res.switched_back = true;
            }
        }
        logger::info("storage: backfill copied: {} skipped: {} conflicts: {} switched back: {}",
            res.copied, res.skipped, res.conflicts, res.switched_back);
        if (res.switched_back && _observer)
            _observer(false);
        return res;
    }

    std::string fallback_t::name() const
    {
        std::shared_lock lk { _mutex };
        return _degraded ? _volatile->name() : _durable->name();
    }

    bool fallback_t::append(const ledger::record_t &rec)
    {
        return _run("append", [&](backend_t &b, const bool durable) {
            const auto ok = b.append(rec);
            if (ok && durable)
                _remember_append(rec);
            return ok;
        });
    }

    std::optional<tail_t> fallback_t::tail(const std::string_view anchor_id) const
    {
        return _run("tail", [&](const backend_t &b, const bool durable) {
            auto t = b.tail(anchor_id);
            if (durable)
                _remember_tail(t, anchor_id);
            return t;
        });
    }

    void fallback_t::fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const
    {
        // a durable fetch that fails midway must not deliver records twice, so it is buffered
        const auto recs = _run("fetch", [&](const backend_t &b, bool) {
            return b.fetch(anchor_id, range);
        });
        for (const auto &rec: recs)
            obs(rec);
    }

    std::vector<ledger::record_t> fallback_t::search(const search_filter_t &filter) const
    {
        return _run("search", [&](const backend_t &b, bool) {
            return b.search(filter);
        });
    }

    std::vector<std::string> fallback_t::anchors() const
    {
        return _run("anchors", [&](const backend_t &b, bool) {
            return b.anchors();
        });
    }

    void fallback_t::put_checkpoint(const ledger::checkpoint_t &cp)
    {
        _run("put_checkpoint", [&](backend_t &b, bool) {
            b.put_checkpoint(cp);
        });
    }

    std::optional<ledger::checkpoint_t> fallback_t::checkpoint(const std::string_view id) const
    {
        return _run("checkpoint", [&](const backend_t &b, bool) {
            return b.checkpoint(id);
        });
    }

    std::vector<ledger::checkpoint_t> fallback_t::checkpoints(const std::string_view anchor_id) const
    {
        return _run("checkpoints", [&](const backend_t &b, bool) {
            return b.checkpoints(anchor_id);
        });
    }

    backend_stats_t fallback_t::stats() const
    {
        return _run("stats", [&](const backend_t &b, bool) {
            return b.stats();
        });
    }

    ledger::hash_t fallback_t::base(const std::string_view anchor_id) const
    {
        return _run("base", [&](const backend_t &b, bool) {
            return b.base(anchor_id);
        });
    }
}
