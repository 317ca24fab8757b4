#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <functional>
#include <memory>
#include <optional>
#include "config.hpp"
#include "merkle.hpp"
#include "signature.hpp"
#include "store.hpp"

namespace verichain::ledger {
    struct checkpoint_check_t {
        checkpoint_t checkpoint {};
        // the root recomputed over the covered records equals the stored one
        bool root_ok = false;
        bool count_ok = false;
        // prev_root equals the root of the preceding checkpoint of the anchor
        bool chain_ok = false;
        // absent for unsigned checkpoints
        std::optional<bool> signature_ok {};

        [[nodiscard]] bool valid() const noexcept
        {
            return root_ok && count_ok && chain_ok && signature_ok.value_or(true);
        }

        [[nodiscard]] codec::json::object to_json() const;
    };

    /*
     * Batches the committed records of an anchor into Merkle checkpoints.
     * Builds are triggered explicitly, by the number of records committed since the anchor's last checkpoint
     * or by the age of the oldest pending record. Triggered builds run on the builder's own io_context thread
     * which exists only between start and stop.
     */
    struct checkpoint_builder_t {
        using build_observer_t = std::function<void(const checkpoint_t &)>;

        // Registers a commit observer with the store, so it must be created before the first append.
        checkpoint_builder_t(chain_store_t &store, checkpoint_config_t cfg, const verifier_registry_t &verifiers, signer_ptr_t signer={});
        ~checkpoint_builder_t();

        // Must be called before start.
        void on_build(build_observer_t obs);
        void start();
        void stop();

        // nullopt when the anchor has no records after its last checkpoint
        std::optional<checkpoint_t> build(std::string_view anchor_id);
        // nullopt when the record is not covered by the checkpoint. Throws for unknown checkpoints.
        [[nodiscard]] std::optional<merkle::proof_t> prove(std::string_view checkpoint_id, std::string_view record_id) const;
        [[nodiscard]] checkpoint_check_t verify_checkpoint(std::string_view checkpoint_id) const;
        [[nodiscard]] std::optional<checkpoint_t> checkpoint(std::string_view checkpoint_id) const;
        [[nodiscard]] std::optional<checkpoint_t> latest(std::string_view anchor_id) const;
        [[nodiscard]] std::vector<checkpoint_t> list(std::string_view anchor_id) const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
