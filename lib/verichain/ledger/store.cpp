/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/logger.hpp>
#include "store.hpp"

namespace verichain::ledger {
    chain_store_t::chain_store_t(storage::backend_ptr_t backend, const kind_registry_t &kinds, crypto::hasher_t hasher,
            const size_t max_payload_bytes, const size_t append_retries):
        _backend { std::move(backend) },
        _kinds { kinds },
        _hasher { std::move(hasher) },
        _max_payload_bytes { max_payload_bytes },
        _append_retries { append_retries }
    {
        if (!_backend) [[unlikely]]
            throw error("chain_store_t requires a storage backend");
    }

    void chain_store_t::on_commit(commit_observer_t obs)
    {
        _observers.emplace_back(std::move(obs));
    }

    chain_store_t::anchor_state_t &chain_store_t::_anchor(const std::string_view anchor_id)
    {
        std::scoped_lock lk { _anchors_mutex };
        auto it = _anchors.find(anchor_id);
        if (it == _anchors.end())
            it = _anchors.try_emplace(std::string { anchor_id }, std::make_unique<anchor_state_t>()).first;
        return *it->second;
    }

    record_t chain_store_t::append(const draft_t &draft)
    {
        if (!_kinds.contains(draft.kind)) [[unlikely]]
            throw encoding_error(fmt::format("unregistered record kind: {}", draft.kind));
        validate_draft(draft, _max_payload_bytes);

        record_t rec {};
        rec.anchor_id = draft.anchor_id;
        rec.slot = draft.slot;
        rec.kind = draft.kind;
        rec.ts = draft.ts ? *draft.ts : now_us();
        rec.payload = draft.payload;
        rec.sig = draft.sig;
        rec.producer = draft.producer.empty() ? draft.slot : draft.producer;

        auto &anchor = _anchor(draft.anchor_id);
        std::scoped_lock lk { anchor.mutex };
        for (size_t attempt = 0; attempt <= _append_retries; ++attempt) {
            if (!anchor.tail)
                anchor.tail = _backend->tail(draft.anchor_id);
            const auto &tail = anchor.tail;
            rec.id = tail ? _ids.next_after(tail->id) : _ids.next();
            rec.prev_hash = tail ? tail->hash : _backend->base(draft.anchor_id);
            rec.hash = compute_hash(rec, _hasher);
            bool appended = false;
            try {
                appended = _backend->append(rec);
            } catch (const std::exception &) {
                anchor.tail.reset();
                throw;
            }
            if (appended) {
                const auto length = (tail ? tail->length : 0) + 1;
                anchor.tail = storage::tail_t { rec.id, rec.hash, length };
                // the record is committed at this point, so observer failures are only logged
                for (const auto &obs: _observers)
                    logger::run_log_errors([&] { obs(rec, length); });
                return rec;
            }
            logger::debug("store: the tail of {} has moved, attempt {} of {}", draft.anchor_id, attempt + 1, _append_retries + 1);
            anchor.tail.reset();
        }
        throw chain_conflict_error(fmt::format("the tail of {} kept moving during {} append attempts", draft.anchor_id, _append_retries + 1));
    }

    void chain_store_t::invalidate(const std::string_view anchor_id)
    {
        auto &anchor = _anchor(anchor_id);
        std::scoped_lock lk { anchor.mutex };
        anchor.tail.reset();
    }

    void chain_store_t::fetch_chain(const std::string_view anchor_id, const storage::range_t &range, const storage::record_observer_t &obs) const
    {
        _backend->fetch(anchor_id, range, obs);
    }

    std::vector<record_t> chain_store_t::fetch_chain(const std::string_view anchor_id, const storage::range_t &range) const
    {
        return _backend->fetch(anchor_id, range);
    }

    std::vector<record_t> chain_store_t::search(const storage::search_filter_t &filter) const
    {
        return _backend->search(filter);
    }

    std::vector<std::string> chain_store_t::anchors() const
    {
        return _backend->anchors();
    }

    storage::backend_stats_t chain_store_t::stats() const
    {
        return _backend->stats();
    }
}
