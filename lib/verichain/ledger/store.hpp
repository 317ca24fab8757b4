#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <mutex>
#include <verichain/common/mutex.hpp>
#include <verichain/storage/backend.hpp>
#include "errors.hpp"
#include "kind.hpp"
#include "record.hpp"

namespace verichain::ledger {
    /*
     * Assigns record ids, links and hashes drafts and appends them to per-anchor chains.
     * Appends to the same anchor are serialized by a mutex of that anchor; different anchors proceed in parallel.
     * Tails moved by other writers sharing the backend are detected by the backend's compare-and-append
     * and resolved by a bounded number of retries.
     */
    struct chain_store_t {
        // chain_length includes the committed record
        using commit_observer_t = std::function<void(const record_t &rec, uint64_t chain_length)>;

        chain_store_t(storage::backend_ptr_t backend, const kind_registry_t &kinds, crypto::hasher_t hasher={},
            size_t max_payload_bytes=1 << 20, size_t append_retries=3);

        // Must be called before the first append.
        void on_commit(commit_observer_t obs);
        record_t append(const draft_t &draft);
        // Drops the cached tail of the anchor after its chain was extended around the store.
        void invalidate(std::string_view anchor_id);
        void fetch_chain(std::string_view anchor_id, const storage::range_t &range, const storage::record_observer_t &obs) const;
        [[nodiscard]] std::vector<record_t> fetch_chain(std::string_view anchor_id, const storage::range_t &range={}) const;
        [[nodiscard]] std::vector<record_t> search(const storage::search_filter_t &filter) const;
        [[nodiscard]] std::vector<std::string> anchors() const;
        [[nodiscard]] storage::backend_stats_t stats() const;

        [[nodiscard]] const crypto::hasher_t &hasher() const noexcept
        {
            return _hasher;
        }

        [[nodiscard]] storage::backend_t &backend() const noexcept
        {
            return *_backend;
        }
    private:
        struct anchor_state_t {
            alignas(mutex::alignment) std::mutex mutex {};
            std::optional<storage::tail_t> tail {};
        };

        storage::backend_ptr_t _backend;
        const kind_registry_t &_kinds;
        crypto::hasher_t _hasher;
        size_t _max_payload_bytes;
        size_t _append_retries;
        record_id_generator_t _ids {};
        std::vector<commit_observer_t> _observers {};
        alignas(mutex::alignment) std::mutex _anchors_mutex {};
        std::map<std::string, std::unique_ptr<anchor_state_t>, std::less<>> _anchors {};

        anchor_state_t &_anchor(std::string_view anchor_id);
    };
}
