/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <map>
#include <thread>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <verichain/common/logger.hpp>
#include <verichain/common/timer.hpp>
#include "checkpoint.hpp"

namespace verichain::ledger {
    namespace json = codec::json;

    json::object checkpoint_check_t::to_json() const
    {
        json::object obj {
            { "checkpoint", checkpoint.to_json() },
            { "root_ok", root_ok },
            { "count_ok", count_ok },
            { "chain_ok", chain_ok },
            { "valid", valid() }
        };
        if (signature_ok)
            obj.emplace("signature_ok", *signature_ok);
        else
            obj.emplace("signature_ok", nullptr);
        return obj;
    }

    struct checkpoint_builder_t::impl {
        impl(chain_store_t &store, checkpoint_config_t cfg, const verifier_registry_t &verifiers, signer_ptr_t signer):
            _store { store },
            _cfg { std::move(cfg) },
            _verifiers { verifiers },
            _signer { std::move(signer) }
        {
            _store.on_commit([this](const record_t &rec, uint64_t) {
                _note_commit(rec.anchor_id);
            });
        }

        ~impl()
        {
            stop();
        }

        void on_build(build_observer_t obs)
        {
            _observers.emplace_back(std::move(obs));
        }

        void start()
        {
            if (_thread.joinable())
                return;
            // records committed before the start are covered by the time trigger
            for (const auto &anchor_id: _store.anchors())
                _note_pending(anchor_id, 0);
            _ioc.restart();
            _work.emplace(boost::asio::make_work_guard(_ioc));
            if (_cfg.max_interval.count() > 0) {
                boost::asio::co_spawn(_ioc, _time_trigger(), [](const std::exception_ptr &ep) {
                    if (ep)
                        logger::run_log_errors([&] { std::rethrow_exception(ep); });
                });
            }
            {
                std::scoped_lock lk { _pending_mutex };
                _running = true;
            }
            _thread = std::thread { [this] {
                logger::run_log_errors([&] { _ioc.run(); });
            } };
            logger::info("checkpoint builder: started with every_records: {} max_interval: {} sec", _cfg.every_records, _cfg.max_interval.count());
        }

        void stop()
        {
            if (!_thread.joinable())
                return;
            {
                std::scoped_lock lk { _pending_mutex };
                _running = false;
            }
            boost::asio::post(_ioc, [this] { _timer.cancel(); });
            _work.reset();
            _thread.join();
            logger::info("checkpoint builder: stopped");
        }

        std::optional<checkpoint_t> build(const std::string_view anchor_id)
        {
            std::scoped_lock build_lk { _build_mutex };
            timer t { fmt::format("checkpoint build for {}", anchor_id) };
            const auto prev = latest(anchor_id);
            std::vector<record_t> records {};
            storage::range_t range {};
            if (prev)
                range.from = prev->range_end;
            _store.fetch_chain(anchor_id, range, [&](auto rec) {
                if (prev && rec.id == prev->range_end)
                    return;
                records.emplace_back(std::move(rec));
            });
            if (records.empty()) {
                _forget_pending(anchor_id, 0);
                return {};
            }
            const auto &hasher = _store.hasher();
            checkpoint_t cp {};
            cp.id = _ids.next();
            cp.anchor_id = anchor_id;
            cp.range_start = records.front().id;
            cp.range_end = records.back().id;
            cp.first_index = prev ? prev->first_index + prev->record_count : 0;
            cp.record_count = records.size();
            cp.merkle_root = merkle::root(_leaves(records), hasher.func());
            if (prev)
                cp.prev_root = prev->merkle_root;
            cp.hash_algorithm = hasher.name();
            cp.created_at = now_us();
            if (_signer)
                cp.sig = _signer->sign(cp.header());
            _store.backend().put_checkpoint(cp);
            _forget_pending(anchor_id, cp.record_count);
            logger::info("checkpoint builder: {} covers {} records of {} with root {}", cp.id, cp.record_count, anchor_id, cp.merkle_root);
            for (const auto &obs: _observers)
                logger::run_log_errors([&] { obs(cp); });
            return cp;
        }

        std::optional<merkle::proof_t> prove(const std::string_view checkpoint_id, const std::string_view record_id) const
        {
            const auto cp = _checkpoint_or_throw(checkpoint_id);
            const auto records = _covered(cp);
            for (size_t i = 0; i < records.size(); ++i) {
                if (records[i].id == record_id)
                    return merkle::prove(_leaves(records), i, crypto::hasher_t::from_name(cp.hash_algorithm).func());
            }
            return {};
        }

        checkpoint_check_t verify_checkpoint(const std::string_view checkpoint_id) const
        {
            checkpoint_check_t res { _checkpoint_or_throw(checkpoint_id) };
            const auto &cp = res.checkpoint;
            const auto records = _covered(cp);
            res.count_ok = records.size() == cp.record_count;
            res.root_ok = merkle::root(_leaves(records), crypto::hasher_t::from_name(cp.hash_algorithm).func()) == cp.merkle_root;
            const auto all = list(cp.anchor_id);
            hash_t expected_prev {};
            for (const auto &c: all) {
                if (c.id == cp.id) {
                    res.chain_ok = cp.prev_root == expected_prev;
                    break;
                }
                expected_prev = c.merkle_root;
            }
            if (cp.sig) {
                const auto *verifier = _verifiers.find(cp.sig->algorithm);
                res.signature_ok = verifier && verifier->verify(cp.header(), cp.sig->bytes, cp.sig->key_ref);
            }
            if (!res.valid())
                logger::warn("checkpoint builder: checkpoint {} of {} does not verify", cp.id, cp.anchor_id);
            return res;
        }

        std::optional<checkpoint_t> checkpoint(const std::string_view checkpoint_id) const
        {
            return _store.backend().checkpoint(checkpoint_id);
        }

        std::optional<checkpoint_t> latest(const std::string_view anchor_id) const
        {
            auto cps = list(anchor_id);
            if (cps.empty())
                return {};
            return std::move(cps.back());
        }

        std::vector<checkpoint_t> list(const std::string_view anchor_id) const
        {
            return _store.backend().checkpoints(anchor_id);
        }
    private:
        struct pending_t {
            uint64_t count = 0;
            std::chrono::steady_clock::time_point since {};
            bool scheduled = false;
        };

        chain_store_t &_store;
        const checkpoint_config_t _cfg;
        const verifier_registry_t &_verifiers;
        const signer_ptr_t _signer;
        std::vector<build_observer_t> _observers {};
        record_id_generator_t _ids {};
        alignas(mutex::alignment) std::mutex _build_mutex {};
        alignas(mutex::alignment) std::mutex _pending_mutex {};
        std::map<std::string, pending_t, std::less<>> _pending {};
        bool _running = false;
        boost::asio::io_context _ioc {};
        boost::asio::steady_timer _timer { _ioc };
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> _work {};
        std::thread _thread {};

        static std::vector<hash_t> _leaves(const std::vector<record_t> &records)
        {
            std::vector<hash_t> leaves {};
            leaves.reserve(records.size());
            for (const auto &rec: records)
                leaves.emplace_back(rec.hash);
            return leaves;
        }

        checkpoint_t _checkpoint_or_throw(const std::string_view checkpoint_id) const
        {
            auto cp = checkpoint(checkpoint_id);
            if (!cp) [[unlikely]]
                throw error(fmt::format("unknown checkpoint: {}", checkpoint_id));
            return std::move(*cp);
        }

        std::vector<record_t> _covered(const checkpoint_t &cp) const
        {
            return _store.fetch_chain(cp.anchor_id, storage::range_t { cp.range_start, cp.range_end });
        }

        void _note_pending(const std::string_view anchor_id, const uint64_t num_records)
        {
            std::scoped_lock lk { _pending_mutex };
            auto [it, created] = _pending.try_emplace(std::string { anchor_id });
            if (created)
                it->second.since = std::chrono::steady_clock::now();
            it->second.count += num_records;
        }

        void _note_commit(const std::string_view anchor_id)
        {
            std::scoped_lock lk { _pending_mutex };
            auto [it, created] = _pending.try_emplace(std::string { anchor_id });
            auto &p = it->second;
            if (created)
                p.since = std::chrono::steady_clock::now();
            ++p.count;
            if (_running && _cfg.every_records > 0 && p.count >= _cfg.every_records && !p.scheduled) {
                p.scheduled = true;
                boost::asio::post(_ioc, [this, anchor_id = it->first] {
                    _build_triggered(anchor_id);
                });
            }
        }

        void _forget_pending(const std::string_view anchor_id, const uint64_t num_records)
        {
            std::scoped_lock lk { _pending_mutex };
            const auto it = _pending.find(anchor_id);
            if (it == _pending.end())
                return;
            auto &p = it->second;
            p.scheduled = false;
            p.count -= std::min(p.count, num_records);
            if (p.count == 0)
                _pending.erase(it);
            else
                p.since = std::chrono::steady_clock::now();
        }

        void _build_triggered(const std::string &anchor_id)
        {
            if (logger::run_log_errors([&] { build(anchor_id); })) {
                std::scoped_lock lk { _pending_mutex };
                if (const auto it = _pending.find(anchor_id); it != _pending.end())
                    it->second.scheduled = false;
            }
        }

        std::vector<std::string> _due_anchors()
        {
            std::vector<std::string> due {};
            const auto now = std::chrono::steady_clock::now();
            std::scoped_lock lk { _pending_mutex };
            for (auto &[anchor_id, p]: _pending) {
                if (!p.scheduled && now - p.since >= _cfg.max_interval) {
                    p.scheduled = true;
                    due.emplace_back(anchor_id);
                }
            }
            return due;
        }

        boost::asio::awaitable<void> _time_trigger()
        {
            const auto tick = std::min<std::chrono::steady_clock::duration>(_cfg.max_interval, std::chrono::seconds { 1 });
            for (;;) {
                _timer.expires_after(tick);
                boost::system::error_code ec {};
                co_await _timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                if (ec == boost::asio::error::operation_aborted)
                    co_return;
                if (ec) [[unlikely]]
                    throw error(fmt::format("checkpoint timer failed: {}", ec.message()));
                for (const auto &anchor_id: _due_anchors())
                    _build_triggered(anchor_id);
            }
        }
    };

    checkpoint_builder_t::checkpoint_builder_t(chain_store_t &store, checkpoint_config_t cfg, const verifier_registry_t &verifiers, signer_ptr_t signer):
        _impl { std::make_unique<impl>(store, std::move(cfg), verifiers, std::move(signer)) }
    {
    }

    checkpoint_builder_t::~checkpoint_builder_t() =default;

    void checkpoint_builder_t::on_build(build_observer_t obs)
    {
        _impl->on_build(std::move(obs));
    }

    void checkpoint_builder_t::start()
    {
        _impl->start();
    }

    void checkpoint_builder_t::stop()
    {
        _impl->stop();
    }

    std::optional<checkpoint_t> checkpoint_builder_t::build(const std::string_view anchor_id)
    {
        return _impl->build(anchor_id);
    }

    std::optional<merkle::proof_t> checkpoint_builder_t::prove(const std::string_view checkpoint_id, const std::string_view record_id) const
    {
        return _impl->prove(checkpoint_id, record_id);
    }

    checkpoint_check_t checkpoint_builder_t::verify_checkpoint(const std::string_view checkpoint_id) const
    {
        return _impl->verify_checkpoint(checkpoint_id);
    }

    std::optional<checkpoint_t> checkpoint_builder_t::checkpoint(const std::string_view checkpoint_id) const
    {
        return _impl->checkpoint(checkpoint_id);
    }

    std::optional<checkpoint_t> checkpoint_builder_t::latest(const std::string_view anchor_id) const
    {
        return _impl->latest(anchor_id);
    }

    std::vector<checkpoint_t> checkpoint_builder_t::list(const std::string_view anchor_id) const
    {
        return _impl->list(anchor_id);
    }
}
