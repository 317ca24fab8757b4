#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <shared_mutex>
#include <verichain/common/mutex.hpp>
#include "memory.hpp"

namespace verichain::storage {
    struct backfill_result_t {
        uint64_t copied = 0;
        uint64_t skipped = 0;
        uint64_t conflicts = 0;
        bool switched_back = false;
    };

    /*
     * Serves requests from the durable backend until it reports backend_unavailable_error,
     * then switches to the volatile backend for good and retries the failed operation there.
     * The volatile chains continue from the durable tails this process has observed.
     * Only an explicit backfill can switch back.
     */
    struct fallback_t: backend_t {
        using durable_factory_t = std::function<backend_ptr_t()>;
        using state_observer_t = std::function<void(bool degraded)>;

        // The factory is called immediately and again by backfill while the durable backend has never been opened.
        explicit fallback_t(durable_factory_t factory, state_observer_t observer={});

        [[nodiscard]] bool degraded() const;
        // Copies the volatile records and checkpoints into the durable backend in chain order.
        // Switches back to the durable backend only when no conflicts were found.
        backfill_result_t backfill();

        [[nodiscard]] std::string name() const override;
        [[nodiscard]] bool append(const ledger::record_t &rec) override;
        [[nodiscard]] std::optional<tail_t> tail(std::string_view anchor_id) const override;
        void fetch(std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const override;
        [[nodiscard]] std::vector<ledger::record_t> search(const search_filter_t &filter) const override;
        [[nodiscard]] std::vector<std::string> anchors() const override;
        void put_checkpoint(const ledger::checkpoint_t &cp) override;
        [[nodiscard]] std::optional<ledger::checkpoint_t> checkpoint(std::string_view id) const override;
        [[nodiscard]] std::vector<ledger::checkpoint_t> checkpoints(std::string_view anchor_id) const override;
        [[nodiscard]] backend_stats_t stats() const override;
        [[nodiscard]] ledger::hash_t base(std::string_view anchor_id) const override;

        using backend_t::fetch;
    private:
        durable_factory_t _factory;
        state_observer_t _observer;
        alignas(mutex::alignment) mutable std::shared_mutex _mutex {};
        backend_ptr_t _durable {};
        std::shared_ptr<memory::backend_t> _volatile = std::make_shared<memory::backend_t>();
        mutable bool _degraded = false;
        alignas(mutex::alignment) mutable std::mutex _tails_mutex {};
        mutable std::map<std::string, tail_t, std::less<>> _durable_tails {};

        void _switch(std::string_view reason) const;
        void _remember_tail(const std::optional<tail_t> &t, std::string_view anchor_id) const;
        void _remember_append(const ledger::record_t &rec) const;

        template<typename F>
        auto _run(std::string_view op, const F &f) const;
    };
}
