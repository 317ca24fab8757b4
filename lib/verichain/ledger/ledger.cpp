/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <fstream>
#include <verichain/common/file.hpp>
#include <verichain/common/logger.hpp>
#include <verichain/common/timer.hpp>
#include <verichain/storage/memory.hpp>
#include "ledger.hpp"

namespace verichain::ledger {
    namespace json = codec::json;

    json::object ledger_stats_t::to_json() const
    {
        json::object anchors_verified {};
        for (const auto &[anchor_id, v]: verified) {
            json::object av { { "verified_at", format_timestamp(v.verified_at) } };
            if (v.trust_score)
                av.emplace("trust_score", *v.trust_score);
            else
                av.emplace("trust_score", nullptr);
            anchors_verified.emplace(anchor_id, std::move(av));
        }
        return {
            { "backend", backend },
            { "degraded", degraded },
            { "records", records },
            { "anchors", anchors },
            { "checkpoints", checkpoints },
            { "verified", std::move(anchors_verified) }
        };
    }

    struct ledger_t::impl {
        impl(config_t cfg, storage::backend_ptr_t backend):
            _cfg { std::move(cfg) },
            _kinds { _cfg.kinds },
            _signer { _make_signer(_cfg.checkpoint) },
            _verifiers { _make_verifiers(_cfg, _signer.get()) },
            _backend { backend ? std::move(backend) : _make_backend() },
            _store { _backend, _kinds, crypto::hasher_t::from_name(_cfg.hash_algorithm), _cfg.max_payload_bytes, _cfg.append_retries },
            _verifier { _cfg.trust, _store.hasher(), _verifiers },
            _checkpoints { _store, _cfg.checkpoint, _verifiers, _signer }
        {
            _checkpoints.on_build([this](const checkpoint_t &) {
                _metrics.checkpoint_built();
            });
            _checkpoints.start();
            logger::info("ledger: backend: {} hash: {} extended kinds: {}", _backend->name(), _store.hasher().name(), _cfg.kinds.size());
        }

        record_t append(const draft_t &draft)
        {
            const auto kind = draft.kind.name();
            try {
                auto rec = _store.append(draft);
                _metrics.append_outcome(rec.anchor_id, kind, "ok");
                return rec;
            } catch (const encoding_error &) {
                _metrics.append_outcome(draft.anchor_id, kind, "encoding_error");
                throw;
            } catch (const chain_conflict_error &) {
                _metrics.append_outcome(draft.anchor_id, kind, "conflict");
                throw;
            } catch (const error &) {
                _metrics.append_outcome(draft.anchor_id, kind, "error");
                _metrics.persist_error();
                throw;
            }
        }

        void fetch_chain(const std::string_view anchor_id, const storage::range_t &range, const storage::record_observer_t &obs) const
        {
            _store.fetch_chain(anchor_id, range, obs);
        }

        std::vector<record_t> fetch_chain(const std::string_view anchor_id, const storage::range_t &range) const
        {
            return _store.fetch_chain(anchor_id, range);
        }

        std::vector<record_t> search(const storage::search_filter_t &filter) const
        {
            return _store.search(filter);
        }

        std::vector<std::string> anchors() const
        {
            return _store.anchors();
        }

        verification_report_t verify(const std::string_view anchor_id, const cancel_token_t *cancel)
        {
            auto rep = _verifier.verify(_store, anchor_id, cancel);
            _metrics.verify_result(anchor_id, verify_result_name(rep.result), rep.trust_score, rep.record_count, rep.broken_at.has_value());
            if (rep.result != verify_result_t::cancelled) {
                std::scoped_lock lk { _verified_mutex };
                _verified.insert_or_assign(std::string { anchor_id }, anchor_verification_t { rep.verified_at, rep.trust_score });
            }
            return rep;
        }

        ledger_stats_t stats() const
        {
            const auto bs = _store.stats();
            ledger_stats_t res { _backend->name(), _degraded(), bs.records, bs.anchors, bs.checkpoints };
            std::scoped_lock lk { _verified_mutex };
            res.verified = _verified;
            return res;
        }

        checkpoint_builder_t &checkpoints() noexcept
        {
            return _checkpoints;
        }

        storage::backfill_result_t backfill()
        {
            auto fb = std::dynamic_pointer_cast<storage::fallback_t>(_backend);
            if (!fb) [[unlikely]]
                throw error(fmt::format("backfill requires the durable backend but the ledger uses {}", _backend->name()));
            return fb->backfill();
        }

        uint64_t export_jsonl(const std::string &path) const
        {
            timer t { fmt::format("export to {}", path), logger::level::info };
            if (const auto parent = std::filesystem::path { path }.parent_path(); !parent.empty())
                std::filesystem::create_directories(parent);
            std::ofstream os { path, std::ios::binary | std::ios::trunc };
            if (!os) [[unlikely]]
                throw error_sys(fmt::format("failed to open {} for writing", path));
            uint64_t num_records = 0;
            for (const auto &anchor_id: _store.anchors()) {
                _store.fetch_chain(anchor_id, {}, [&](auto rec) {
                    os << json::serialize(rec.to_json()) << '\n';
                    ++num_records;
                });
            }
            os.flush();
            if (!os) [[unlikely]]
                throw error_sys(fmt::format("failed to write to {}", path));
            logger::info("ledger: exported {} records to {}", num_records, path);
            return num_records;
        }

        import_result_t import_jsonl(const std::string &path, const bool verify)
        {
            timer t { fmt::format("import from {}", path), logger::level::info };
            const auto data = file::read(path);
            std::map<std::string, std::vector<record_t>> chains {};
            size_t line_no = 0;
            for (size_t pos = 0; pos < data.size();) {
                auto end = data.find('\n', pos);
                if (end == std::string::npos)
                    end = data.size();
                const std::string_view line { data.data() + pos, end - pos };
                pos = end + 1;
                ++line_no;
                if (line.find_first_not_of(" \t\r") == std::string_view::npos)
                    continue;
                try {
                    auto rec = record_t::from_json(json::parse(line));
                    if (!_kinds.contains(rec.kind)) [[unlikely]]
                        throw encoding_error(fmt::format("unregistered record kind: {}", rec.kind));
                    chains[rec.anchor_id].emplace_back(std::move(rec));
                } catch (const std::exception &ex) {
                    throw error(fmt::format("{}:{}: an invalid record", path, line_no), ex);
                }
            }
            // everything is checked before the first record is stored
            for (const auto &[anchor_id, recs]: chains) {
                const auto tail = _backend->tail(anchor_id);
                const auto base = tail ? tail->hash : _backend->base(anchor_id);
                if (recs.front().prev_hash != base) [[unlikely]]
                    throw error(fmt::format("the imported chain of {} does not continue its stored chain", anchor_id));
                if (tail && recs.front().id <= tail->id) [[unlikely]]
                    throw error(fmt::format("the imported record {} of {} does not follow the stored tail {}", recs.front().id, anchor_id, tail->id));
                if (verify) {
                    const auto rep = _verifier.verify_records(anchor_id, recs, base);
                    if (!rep.valid) [[unlikely]]
                        throw error(fmt::format("the imported chain of {} is broken at record {} ({}): {}",
                            anchor_id, rep.broken_at->index, rep.broken_at->record_id, rep.broken_at->reason));
                }
            }
            import_result_t res {};
            for (const auto &[anchor_id, recs]: chains) {
                for (const auto &rec: recs) {
                    if (!_backend->append(rec)) [[unlikely]]
                        throw chain_conflict_error(fmt::format("the chain of {} moved during the import at record {}", anchor_id, rec.id));
                    ++res.records;
                }
                // the store's cached tail is behind once the backend is written directly
                _store.invalidate(anchor_id);
                ++res.anchors;
            }
            logger::info("ledger: imported {} records of {} anchors from {}", res.records, res.anchors, path);
            return res;
        }

        const config_t &config() const noexcept
        {
            return _cfg;
        }

        const metrics_t &metrics() const noexcept
        {
            return _metrics;
        }

        const chain_verifier_t &verifier() const noexcept
        {
            return _verifier;
        }
    private:
        const config_t _cfg;
        metrics_t _metrics {};
        kind_registry_t _kinds;
        std::shared_ptr<ed25519_signer_t> _signer;
        verifier_registry_t _verifiers;
        storage::backend_ptr_t _backend;
        chain_store_t _store;
        chain_verifier_t _verifier;
        alignas(mutex::alignment) mutable std::mutex _verified_mutex {};
        std::map<std::string, anchor_verification_t> _verified {};
        checkpoint_builder_t _checkpoints;

        static std::shared_ptr<ed25519_signer_t> _make_signer(const checkpoint_config_t &cfg)
        {
            if (!cfg.signing_seed)
                return {};
            return std::make_shared<ed25519_signer_t>(*cfg.signing_seed, cfg.key_ref);
        }

        static verifier_registry_t _make_verifiers(const config_t &cfg, const ed25519_signer_t *signer)
        {
            auto keys = cfg.keys;
            if (signer)
                keys.insert_or_assign(cfg.checkpoint.key_ref, signer->vkey());
            verifier_registry_t reg {};
            reg.add(std::string { ed25519_verifier_t::algorithm }, std::make_shared<ed25519_verifier_t>(std::move(keys)));
            return reg;
        }

        storage::backend_ptr_t _make_backend()
        {
            if (!_cfg.durable_backend())
                return std::make_shared<storage::memory::backend_t>();
            return std::make_shared<storage::fallback_t>(
                [durable = _cfg.durable] { return storage::open_durable(durable); },
                [this](const bool degraded) {
                    _metrics.degraded(degraded);
                    if (degraded)
                        _metrics.persist_fallback();
                }
            );
        }

        bool _degraded() const
        {
            if (const auto *fb = dynamic_cast<const storage::fallback_t *>(_backend.get()))
                return fb->degraded();
            return false;
        }
    };

    ledger_t::ledger_t(config_t cfg, storage::backend_ptr_t backend):
        _impl { std::make_unique<impl>(std::move(cfg), std::move(backend)) }
    {
    }

    ledger_t::~ledger_t() =default;

    record_t ledger_t::append(const draft_t &draft)
    {
        return _impl->append(draft);
    }

    void ledger_t::fetch_chain(const std::string_view anchor_id, const storage::range_t &range, const storage::record_observer_t &obs) const
    {
        _impl->fetch_chain(anchor_id, range, obs);
    }

    std::vector<record_t> ledger_t::fetch_chain(const std::string_view anchor_id, const storage::range_t &range) const
    {
        return _impl->fetch_chain(anchor_id, range);
    }

    std::vector<record_t> ledger_t::search(const storage::search_filter_t &filter) const
    {
        return _impl->search(filter);
    }

    std::vector<std::string> ledger_t::anchors() const
    {
        return _impl->anchors();
    }

    verification_report_t ledger_t::verify(const std::string_view anchor_id, const cancel_token_t *cancel)
    {
        return _impl->verify(anchor_id, cancel);
    }

    ledger_stats_t ledger_t::stats() const
    {
        return _impl->stats();
    }

    std::optional<checkpoint_t> ledger_t::build_checkpoint(const std::string_view anchor_id)
    {
        return _impl->checkpoints().build(anchor_id);
    }

    std::optional<checkpoint_t> ledger_t::checkpoint(const std::string_view checkpoint_id) const
    {
        return _impl->checkpoints().checkpoint(checkpoint_id);
    }

    std::optional<checkpoint_t> ledger_t::latest_checkpoint(const std::string_view anchor_id) const
    {
        return _impl->checkpoints().latest(anchor_id);
    }

    std::vector<checkpoint_t> ledger_t::checkpoints(const std::string_view anchor_id) const
    {
        return _impl->checkpoints().list(anchor_id);
    }

    std::optional<merkle::proof_t> ledger_t::prove(const std::string_view checkpoint_id, const std::string_view record_id) const
    {
        return _impl->checkpoints().prove(checkpoint_id, record_id);
    }

    checkpoint_check_t ledger_t::verify_checkpoint(const std::string_view checkpoint_id) const
    {
        return _impl->checkpoints().verify_checkpoint(checkpoint_id);
    }

    storage::backfill_result_t ledger_t::backfill()
    {
        return _impl->backfill();
    }

    uint64_t ledger_t::export_jsonl(const std::string &path) const
    {
        return _impl->export_jsonl(path);
    }

    import_result_t ledger_t::import_jsonl(const std::string &path, const bool verify)
    {
        return _impl->import_jsonl(path, verify);
    }

    const config_t &ledger_t::config() const noexcept
    {
        return _impl->config();
    }

    const metrics_t &ledger_t::metrics() const noexcept
    {
        return _impl->metrics();
    }

    const chain_verifier_t &ledger_t::verifier() const noexcept
    {
        return _impl->verifier();
    }
}
