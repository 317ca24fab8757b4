/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

extern "C" {
    #include <lmdb.h>
}

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <verichain/common/logger.hpp>
#include "lmdb.hpp"

namespace verichain::storage::lmdb {
    namespace json = codec::json;

    static void _throw_lmdb(const int rc, const char *what)
    {
        if (rc == MDB_SUCCESS) [[likely]]
            return;
        const auto msg = fmt::format("lmdb: {}: {}", what, mdb_strerror(rc));
        switch (rc) {
            case MDB_MAP_FULL:
            case MDB_READERS_FULL:
            case MDB_PANIC:
            case EIO:
            case ENOSPC:
            case EACCES:
            case EAGAIN:
                throw backend_unavailable_error(msg);
            default:
                throw error(msg);
        }
    }

    static MDB_val _to_mdb_val(const buffer b)
    {
        MDB_val v {};
        v.mv_size = b.size();
        v.mv_data = const_cast<void *>(static_cast<const void *>(b.data()));
        return v;
    }

    static std::string_view _to_sv(const MDB_val &v)
    {
        return { static_cast<const char *>(v.mv_data), v.mv_size };
    }

    static std::string _prefix(const std::string_view anchor_id)
    {
        std::string k { anchor_id };
        k.push_back('\0');
        return k;
    }

    static void _store_u64_be(std::string &out, const uint64_t x)
    {
        for (int shift = 56; shift >= 0; shift -= 8)
            out.push_back(static_cast<char>((x >> shift) & 0xFFU));
    }

    // tail values: 32-byte hash, 8-byte little-endian chain length, record id
    static std::string _encode_tail(const tail_t &t)
    {
        std::string out(t.hash.size() + sizeof(uint64_t), '\0');
        std::memcpy(out.data(), t.hash.data(), t.hash.size());
        std::memcpy(out.data() + t.hash.size(), &t.length, sizeof(t.length));
        out += t.id;
        return out;
    }

    static tail_t _decode_tail(const std::string_view v)
    {
        tail_t t {};
        if (v.size() < t.hash.size() + sizeof(uint64_t)) [[unlikely]]
            throw error(fmt::format("lmdb: a corrupted tail entry of {} bytes", v.size()));
        std::memcpy(t.hash.data(), v.data(), t.hash.size());
        std::memcpy(&t.length, v.data() + t.hash.size(), sizeof(t.length));
        t.id = v.substr(t.hash.size() + sizeof(uint64_t));
        return t;
    }

    struct txn_t {
        txn_t(MDB_env *env, const bool read_only)
        {
            _throw_lmdb(mdb_txn_begin(env, nullptr, read_only ? MDB_RDONLY : 0, &_txn), "txn_begin");
        }

        ~txn_t()
        {
            if (_txn)
                mdb_txn_abort(_txn);
        }

        txn_t(const txn_t &) =delete;
        txn_t &operator=(const txn_t &) =delete;

        void commit()
        {
            const int rc = mdb_txn_commit(_txn);
            _txn = nullptr;
            _throw_lmdb(rc, "txn_commit");
        }

        MDB_txn *get() const noexcept
        {
            return _txn;
        }
    private:
        MDB_txn *_txn = nullptr;
    };

    struct cursor_t {
        cursor_t(const txn_t &txn, const MDB_dbi dbi)
        {
            _throw_lmdb(mdb_cursor_open(txn.get(), dbi, &_cur), "cursor_open");
        }

        ~cursor_t()
        {
            mdb_cursor_close(_cur);
        }

        cursor_t(const cursor_t &) =delete;
        cursor_t &operator=(const cursor_t &) =delete;

        // Calls obs for every entry whose key starts with prefix until obs returns false.
        template<typename T>
        void scan(const std::string_view prefix, const std::string_view start, const T &obs)
        {
            MDB_val k = _to_mdb_val(start);
            MDB_val v {};
            auto rc = mdb_cursor_get(_cur, &k, &v, start.empty() ? MDB_FIRST : MDB_SET_RANGE);
            while (rc == MDB_SUCCESS) {
                const auto key = _to_sv(k);
                if (!key.starts_with(prefix) || !obs(key, _to_sv(v)))
                    return;
                rc = mdb_cursor_get(_cur, &k, &v, MDB_NEXT);
            }
            if (rc != MDB_NOTFOUND)
                _throw_lmdb(rc, "cursor_get");
        }
    private:
        MDB_cursor *_cur = nullptr;
    };

    struct backend_t::impl {
        impl(const std::string_view dir_path, const uint64_t map_size):
            _dir_path { dir_path }
        {
            try {
                std::filesystem::create_directories(_dir_path);
            } catch (const std::filesystem::filesystem_error &ex) {
                throw backend_unavailable_error(fmt::format("lmdb: can't create {}", _dir_path), ex);
            }
            _throw_lmdb(mdb_env_create(&_env), "env_create");
            try {
                _throw_lmdb(mdb_env_set_maxdbs(_env, 5), "env_set_maxdbs");
                _throw_lmdb(mdb_env_set_mapsize(_env, map_size), "env_set_mapsize");
                // read transactions are not bound to threads so that observers may call back into the backend
                _throw_lmdb(mdb_env_open(_env, _dir_path.c_str(), MDB_NOTLS, 0664), "env_open");
                txn_t txn { _env, false };
                _throw_lmdb(mdb_dbi_open(txn.get(), "records", MDB_CREATE, &_dbi_records), "dbi_open(records)");
                _throw_lmdb(mdb_dbi_open(txn.get(), "hashes", MDB_CREATE, &_dbi_hashes), "dbi_open(hashes)");
                _throw_lmdb(mdb_dbi_open(txn.get(), "tails", MDB_CREATE, &_dbi_tails), "dbi_open(tails)");
                _throw_lmdb(mdb_dbi_open(txn.get(), "checkpoints", MDB_CREATE, &_dbi_checkpoints), "dbi_open(checkpoints)");
                _throw_lmdb(mdb_dbi_open(txn.get(), "anchor_checkpoints", MDB_CREATE, &_dbi_anchor_checkpoints), "dbi_open(anchor_checkpoints)");
                txn.commit();
            } catch (const std::exception &) {
                mdb_env_close(_env);
                throw;
            }
            logger::debug("lmdb: opened {}", _dir_path);
        }

        ~impl()
        {
            mdb_env_close(_env);
        }

        impl(const impl &) =delete;
        impl &operator=(const impl &) =delete;

        bool append(const ledger::record_t &rec)
        {
            std::scoped_lock lk { _write_mutex };
            txn_t txn { _env, false };
            const auto cur = _tail(txn, rec.anchor_id);
            const auto &expected = cur ? cur->hash : ledger::genesis_hash;
            if (rec.prev_hash != expected || (cur && rec.id <= cur->id))
                return false;
            {
                MDB_val k = _to_mdb_val(buffer { rec.hash.data(), rec.hash.size() });
                MDB_val v = _to_mdb_val(rec.id);
                if (const int rc = mdb_put(txn.get(), _dbi_hashes, &k, &v, MDB_NOOVERWRITE); rc == MDB_KEYEXIST)
                    throw error(fmt::format("lmdb: a record with hash {} already exists", rec.hash));
                else
                    _throw_lmdb(rc, "put(hashes)");
            }
            {
                const auto key = _prefix(rec.anchor_id) + rec.id;
                const auto val = json::serialize(rec.to_json());
                MDB_val k = _to_mdb_val(key);
                MDB_val v = _to_mdb_val(val);
                if (const int rc = mdb_put(txn.get(), _dbi_records, &k, &v, MDB_NOOVERWRITE); rc == MDB_KEYEXIST)
                    throw error(fmt::format("lmdb: record {} already exists", rec.id));
                else
                    _throw_lmdb(rc, "put(records)");
            }
            {
                const auto val = _encode_tail(tail_t { rec.id, rec.hash, (cur ? cur->length : 0) + 1 });
                MDB_val k = _to_mdb_val(rec.anchor_id);
                MDB_val v = _to_mdb_val(val);
                _throw_lmdb(mdb_put(txn.get(), _dbi_tails, &k, &v, 0), "put(tails)");
            }
            txn.commit();
            return true;
        }

        std::optional<tail_t> tail(const std::string_view anchor_id) const
        {
            txn_t txn { _env, true };
            return _tail(txn, anchor_id);
        }

        void fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const
        {
            txn_t txn { _env, true };
            cursor_t cur { txn, _dbi_records };
            const auto prefix = _prefix(anchor_id);
            cur.scan(prefix, prefix + range.from.value_or(""), [&](const auto key, const auto val) {
                if (range.to && key.substr(prefix.size()) > *range.to)
                    return false;
                obs(ledger::record_t::from_json(json::parse(val)));
                return true;
            });
        }

        std::vector<ledger::record_t> search(const search_filter_t &filter) const
        {
            std::vector<ledger::record_t> res {};
            {
                txn_t txn { _env, true };
                cursor_t cur { txn, _dbi_records };
                const auto prefix = filter.anchor_id ? _prefix(*filter.anchor_id) : std::string {};
                cur.scan(prefix, prefix, [&](const auto, const auto val) {
                    auto rec = ledger::record_t::from_json(json::parse(val));
                    if (filter.matches(rec))
                        res.emplace_back(std::move(rec));
                    return true;
                });
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
            txn_t txn { _env, true };
            cursor_t cur { txn, _dbi_tails };
            cur.scan("", "", [&](const auto key, const auto) {
                res.emplace_back(key);
                return true;
            });
            return res;
        }

        void put_checkpoint(const ledger::checkpoint_t &cp)
        {
            std::scoped_lock lk { _write_mutex };
            txn_t txn { _env, false };
            MDB_stat st {};
            _throw_lmdb(mdb_stat(txn.get(), _dbi_checkpoints, &st), "stat(checkpoints)");
            {
                const auto val = json::serialize(cp.to_json());
                MDB_val k = _to_mdb_val(cp.id);
                MDB_val v = _to_mdb_val(val);
                if (const int rc = mdb_put(txn.get(), _dbi_checkpoints, &k, &v, MDB_NOOVERWRITE); rc == MDB_KEYEXIST)
                    throw error(fmt::format("lmdb: checkpoint {} already exists", cp.id));
                else
                    _throw_lmdb(rc, "put(checkpoints)");
            }
            {
                // checkpoints are never deleted, so the entry count is a valid sequence number
                auto key = _prefix(cp.anchor_id);
                _store_u64_be(key, st.ms_entries);
                MDB_val k = _to_mdb_val(key);
                MDB_val v = _to_mdb_val(cp.id);
                _throw_lmdb(mdb_put(txn.get(), _dbi_anchor_checkpoints, &k, &v, 0), "put(anchor_checkpoints)");
            }
            txn.commit();
        }

        std::optional<ledger::checkpoint_t> checkpoint(const std::string_view id) const
        {
            txn_t txn { _env, true };
            return _checkpoint(txn, id);
        }

        std::vector<ledger::checkpoint_t> checkpoints(const std::string_view anchor_id) const
        {
            std::vector<ledger::checkpoint_t> res {};
            txn_t txn { _env, true };
            cursor_t cur { txn, _dbi_anchor_checkpoints };
            const auto prefix = _prefix(anchor_id);
            cur.scan(prefix, prefix, [&](const auto, const auto val) {
                auto cp = _checkpoint(txn, val);
                if (!cp) [[unlikely]]
                    throw error(fmt::format("lmdb: checkpoint {} is referenced but missing", val));
                res.emplace_back(std::move(*cp));
                return true;
            });
            return res;
        }

        backend_stats_t stats() const
        {
            txn_t txn { _env, true };
            return { _entries(txn, _dbi_records), _entries(txn, _dbi_tails), _entries(txn, _dbi_checkpoints) };
        }
    private:
        std::string _dir_path;
        MDB_env *_env = nullptr;
        MDB_dbi _dbi_records = 0;
        MDB_dbi _dbi_hashes = 0;
        MDB_dbi _dbi_tails = 0;
        MDB_dbi _dbi_checkpoints = 0;
        MDB_dbi _dbi_anchor_checkpoints = 0;
        std::mutex _write_mutex {};

        std::optional<tail_t> _tail(const txn_t &txn, const std::string_view anchor_id) const
        {
            MDB_val k = _to_mdb_val(anchor_id);
            MDB_val v {};
            const auto rc = mdb_get(txn.get(), _dbi_tails, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            _throw_lmdb(rc, "get(tails)");
            return _decode_tail(_to_sv(v));
        }

        std::optional<ledger::checkpoint_t> _checkpoint(const txn_t &txn, const std::string_view id) const
        {
            MDB_val k = _to_mdb_val(id);
            MDB_val v {};
            const auto rc = mdb_get(txn.get(), _dbi_checkpoints, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            _throw_lmdb(rc, "get(checkpoints)");
            return ledger::checkpoint_t::from_json(json::parse(_to_sv(v)));
        }

        static uint64_t _entries(const txn_t &txn, const MDB_dbi dbi)
        {
            MDB_stat st {};
            _throw_lmdb(mdb_stat(txn.get(), dbi, &st), "stat");
            return st.ms_entries;
        }
    };

    backend_t::backend_t(const std::string_view dir_path, const uint64_t map_size):
        _impl { std::make_unique<impl>(dir_path, map_size) }
    {
    }

    backend_t::~backend_t() =default;

    std::string backend_t::name() const
    {
        return "lmdb";
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
}
