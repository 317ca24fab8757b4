/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <sqlite3.h>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <verichain/common/logger.hpp>
#include <verichain/common/numeric-cast.hpp>
#include "sqlite.hpp"

namespace verichain::storage::sqlite {
    using steady_clock = std::chrono::steady_clock;

    [[noreturn]] static void _throw_sqlite(const int rc, const std::string_view msg)
    {
        switch (rc & 0xFF) {
            case SQLITE_BUSY:
            case SQLITE_INTERRUPT:
            case SQLITE_CANTOPEN:
            case SQLITE_IOERR:
            case SQLITE_FULL:
                throw backend_unavailable_error(fmt::format("sqlite: {} (code {})", msg, rc));
            default:
                throw error(fmt::format("sqlite: {} (code {})", msg, rc));
        }
    }

    static void _check(sqlite3 *db, const int rc, const std::string_view what)
    {
        if (rc == SQLITE_OK) [[likely]]
            return;
        _throw_sqlite(rc, fmt::format("{}: {}", what, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
    }

    struct conn_t {
        conn_t(const std::string &path, const std::chrono::milliseconds op_timeout)
        {
            if (const int rc = sqlite3_open_v2(path.c_str(), &_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr); rc != SQLITE_OK) {
                const std::string msg = _db ? sqlite3_errmsg(_db) : sqlite3_errstr(rc);
                sqlite3_close_v2(_db);
                _db = nullptr;
                _throw_sqlite(rc, fmt::format("open {}: {}", path, msg));
            }
            sqlite3_extended_result_codes(_db, 1);
            sqlite3_busy_timeout(_db, numeric_cast<int>(op_timeout.count()));
            sqlite3_progress_handler(_db, 1000, &_progress, this);
        }

        ~conn_t()
        {
            sqlite3_close_v2(_db);
        }

        conn_t(const conn_t &) =delete;
        conn_t &operator=(const conn_t &) =delete;

        sqlite3 *db() const noexcept
        {
            return _db;
        }

        void arm(const std::chrono::milliseconds timeout)
        {
            _deadline = steady_clock::now() + timeout;
        }

        void disarm()
        {
            _deadline = steady_clock::time_point::max();
        }

        void exec(const std::string &sql)
        {
            char *err_msg = nullptr;
            if (const int rc = sqlite3_exec(_db, sql.c_str(), nullptr, nullptr, &err_msg); rc != SQLITE_OK) {
                const std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
                sqlite3_free(err_msg);
                _throw_sqlite(rc, fmt::format("exec '{}': {}", sql, msg));
            }
        }
    private:
        sqlite3 *_db = nullptr;
        steady_clock::time_point _deadline = steady_clock::time_point::max();

        // a non-zero return interrupts the running statement with SQLITE_INTERRUPT
        static int _progress(void *ctx)
        {
            return steady_clock::now() > static_cast<conn_t *>(ctx)->_deadline ? 1 : 0;
        }
    };

    struct stmt_t {
        stmt_t(conn_t &c, const std::string_view sql):
            _db { c.db() }
        {
            _check(_db, sqlite3_prepare_v2(_db, sql.data(), numeric_cast<int>(sql.size()), &_stmt, nullptr), "prepare");
        }

        ~stmt_t()
        {
            sqlite3_finalize(_stmt);
        }

        stmt_t(const stmt_t &) =delete;
        stmt_t &operator=(const stmt_t &) =delete;

        stmt_t &bind_text(const int idx, const std::string_view s)
        {
            _check(_db, sqlite3_bind_text(_stmt, idx, s.data(), numeric_cast<int>(s.size()), SQLITE_TRANSIENT), "bind_text");
            return *this;
        }

        stmt_t &bind_int(const int idx, const int64_t v)
        {
            _check(_db, sqlite3_bind_int64(_stmt, idx, v), "bind_int64");
            return *this;
        }

        stmt_t &bind_null(const int idx)
        {
            _check(_db, sqlite3_bind_null(_stmt, idx), "bind_null");
            return *this;
        }

        stmt_t &bind_opt(const int idx, const std::optional<std::string> &s)
        {
            return s ? bind_text(idx, *s) : bind_null(idx);
        }

        // true when a row is available
        bool step()
        {
            switch (const int rc = sqlite3_step(_stmt); rc) {
                case SQLITE_ROW: return true;
                case SQLITE_DONE: return false;
                default: _throw_sqlite(rc, fmt::format("step: {}", sqlite3_errmsg(_db)));
            }
        }

        [[nodiscard]] bool is_null(const int col) const
        {
            return sqlite3_column_type(_stmt, col) == SQLITE_NULL;
        }

        [[nodiscard]] std::string text(const int col) const
        {
            const auto *data = sqlite3_column_text(_stmt, col);
            if (!data)
                return {};
            return { reinterpret_cast<const char *>(data), static_cast<size_t>(sqlite3_column_bytes(_stmt, col)) };
        }

        [[nodiscard]] int64_t int64(const int col) const
        {
            return sqlite3_column_int64(_stmt, col);
        }
    private:
        sqlite3 *_db;
        sqlite3_stmt *_stmt = nullptr;
    };

    struct txn_t {
        explicit txn_t(conn_t &c):
            _c { c }
        {
            _c.exec("BEGIN IMMEDIATE");
        }

        ~txn_t()
        {
            if (_done)
                return;
            // the deadline may have passed already and the rollback must not be interrupted
            _c.disarm();
            if (const int rc = sqlite3_exec(_c.db(), "ROLLBACK", nullptr, nullptr, nullptr); rc != SQLITE_OK)
                logger::warn("sqlite: rollback failed: {}", sqlite3_errstr(rc));
        }

        txn_t(const txn_t &) =delete;
        txn_t &operator=(const txn_t &) =delete;

        void commit()
        {
            _c.exec("COMMIT");
            _done = true;
        }
    private:
        conn_t &_c;
        bool _done = false;
    };

    static constexpr std::string_view record_cols = "rid, anchor_id, slot, kind, ts, prev_hash, hash, payload, sig, sig_alg, sig_key, producer, version";
    static constexpr std::string_view checkpoint_cols = "cid, anchor_id, range_start, range_end, first_index, record_count, merkle_root, prev_root, hash_alg, sig, sig_alg, sig_key, created_at";

    static const char *schema_sql = R"(
        CREATE TABLE IF NOT EXISTS ledger_records (
            rid TEXT PRIMARY KEY,
            anchor_id TEXT NOT NULL,
            slot TEXT NOT NULL,
            kind TEXT NOT NULL,
            ts INTEGER NOT NULL,
            prev_hash TEXT NOT NULL,
            hash TEXT NOT NULL UNIQUE,
            payload TEXT NOT NULL,
            sig TEXT,
            sig_alg TEXT,
            sig_key TEXT,
            producer TEXT NOT NULL,
            version INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS ledger_records_anchor_ts ON ledger_records(anchor_id, ts);
        CREATE INDEX IF NOT EXISTS ledger_records_anchor_rid ON ledger_records(anchor_id, rid);
        CREATE TABLE IF NOT EXISTS ledger_checkpoints (
            cid TEXT PRIMARY KEY,
            anchor_id TEXT NOT NULL,
            range_start TEXT NOT NULL,
            range_end TEXT NOT NULL,
            first_index INTEGER NOT NULL,
            record_count INTEGER NOT NULL,
            merkle_root TEXT NOT NULL,
            prev_root TEXT NOT NULL,
            hash_alg TEXT NOT NULL,
            sig TEXT,
            sig_alg TEXT,
            sig_key TEXT,
            created_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS ledger_checkpoints_anchor ON ledger_checkpoints(anchor_id);
    )";

    static std::optional<ledger::signature_t> _read_sig(const stmt_t &s, const int col)
    {
        if (s.is_null(col))
            return {};
        return ledger::signature_t { uint8_vector::from_hex(s.text(col)), s.text(col + 1), s.text(col + 2) };
    }

    static ledger::record_t _read_record(const stmt_t &s)
    {
        ledger::record_t rec {};
        rec.id = s.text(0);
        rec.anchor_id = s.text(1);
        rec.slot = s.text(2);
        rec.kind = ledger::record_kind_t::from_name(s.text(3));
        rec.ts = s.int64(4);
        rec.prev_hash = ledger::hash_t::from_hex(s.text(5));
        rec.hash = ledger::hash_t::from_hex(s.text(6));
        const auto payload = codec::json::parse(s.text(7));
        if (!payload.is_object()) [[unlikely]]
            throw error(fmt::format("sqlite: the stored payload of record {} is not a JSON object", rec.id));
        rec.payload = payload.get_object();
        rec.sig = _read_sig(s, 8);
        rec.producer = s.text(11);
        rec.version = numeric_cast<uint32_t>(s.int64(12));
        return rec;
    }

    static ledger::checkpoint_t _read_checkpoint(const stmt_t &s)
    {
        ledger::checkpoint_t cp {};
        cp.id = s.text(0);
        cp.anchor_id = s.text(1);
        cp.range_start = s.text(2);
        cp.range_end = s.text(3);
        cp.first_index = numeric_cast<uint64_t>(s.int64(4));
        cp.record_count = numeric_cast<uint64_t>(s.int64(5));
        cp.merkle_root = ledger::hash_t::from_hex(s.text(6));
        cp.prev_root = ledger::hash_t::from_hex(s.text(7));
        cp.hash_algorithm = s.text(8);
        cp.sig = _read_sig(s, 9);
        cp.created_at = s.int64(12);
        return cp;
    }

    static void _bind_sig(stmt_t &s, const int idx, const std::optional<ledger::signature_t> &sig)
    {
        if (sig) {
            s.bind_text(idx, to_hex(sig->bytes));
            s.bind_text(idx + 1, sig->algorithm);
            s.bind_text(idx + 2, sig->key_ref);
        } else {
            s.bind_null(idx);
            s.bind_null(idx + 1);
            s.bind_null(idx + 2);
        }
    }

    struct backend_t::impl {
        impl(const std::string &path, const size_t pool_size, const std::chrono::milliseconds op_timeout):
            _path { path }, _op_timeout { op_timeout }
        {
            if (_path.empty() || _path == ":memory:" || _path.starts_with("file:"))
                throw error(fmt::format("sqlite: '{}' is not a supported database path", _path));
            if (pool_size == 0)
                throw error("sqlite: the connection pool size must be positive");
            try {
                if (const auto parent = std::filesystem::path { _path }.parent_path(); !parent.empty())
                    std::filesystem::create_directories(parent);
            } catch (const std::filesystem::filesystem_error &ex) {
                throw backend_unavailable_error(fmt::format("sqlite: can't create the directory for {}", _path), ex);
            }
            for (size_t i = 0; i < pool_size; ++i) {
                auto c = std::make_unique<conn_t>(_path, _op_timeout);
                if (i == 0) {
                    c->arm(_op_timeout);
                    c->exec("PRAGMA journal_mode=WAL");
                    c->exec(schema_sql);
                    c->disarm();
                }
                _free.emplace_back(std::move(c));
            }
            logger::debug("sqlite: opened {} with {} connections and a {} ms operation timeout", _path, pool_size, _op_timeout.count());
        }

        bool append(const ledger::record_t &rec)
        {
            auto c = _acquire();
            txn_t txn { *c };
            ledger::hash_t expected = ledger::genesis_hash;
            ledger::record_id_t last_id {};
            {
                stmt_t s { *c, "SELECT rid, hash FROM ledger_records WHERE anchor_id = ? ORDER BY rid DESC LIMIT 1" };
                s.bind_text(1, rec.anchor_id);
                if (s.step()) {
                    last_id = s.text(0);
                    expected = ledger::hash_t::from_hex(s.text(1));
                }
            }
            if (rec.prev_hash != expected || rec.id <= last_id)
                return false;
            {
                stmt_t s { *c, fmt::format("INSERT INTO ledger_records ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", record_cols) };
                s.bind_text(1, rec.id);
                s.bind_text(2, rec.anchor_id);
                s.bind_text(3, rec.slot);
                s.bind_text(4, rec.kind.name());
                s.bind_int(5, rec.ts);
                s.bind_text(6, to_hex(rec.prev_hash));
                s.bind_text(7, to_hex(rec.hash));
                s.bind_text(8, rec.payload_text());
                _bind_sig(s, 9, rec.sig);
                s.bind_text(12, rec.producer);
                s.bind_int(13, rec.version);
                s.step();
            }
            txn.commit();
            return true;
        }

        std::optional<tail_t> tail(const std::string_view anchor_id) const
        {
            auto c = _acquire();
            stmt_t s { *c, "SELECT rid, hash, (SELECT COUNT(*) FROM ledger_records WHERE anchor_id = ?1)"
                " FROM ledger_records WHERE anchor_id = ?1 ORDER BY rid DESC LIMIT 1" };
            s.bind_text(1, anchor_id);
            if (!s.step())
                return {};
            return tail_t { s.text(0), ledger::hash_t::from_hex(s.text(1)), numeric_cast<uint64_t>(s.int64(2)) };
        }

        void fetch(const std::string_view anchor_id, const range_t &range, const record_observer_t &obs) const
        {
            auto c = _acquire();
            stmt_t s { *c, fmt::format("SELECT {} FROM ledger_records WHERE anchor_id = ?1"
                " AND (?2 IS NULL OR rid >= ?2) AND (?3 IS NULL OR rid <= ?3) ORDER BY rid", record_cols) };
            s.bind_text(1, anchor_id);
            s.bind_opt(2, range.from);
            s.bind_opt(3, range.to);
            while (s.step())
                obs(_read_record(s));
        }

        std::vector<ledger::record_t> search(const search_filter_t &filter) const
        {
            std::string sql = fmt::format("SELECT {} FROM ledger_records WHERE 1 = 1", record_cols);
            if (filter.anchor_id)
                sql += " AND anchor_id = ?";
            if (filter.slot)
                sql += " AND slot = ?";
            if (filter.kind)
                sql += " AND kind = ?";
            if (filter.since)
                sql += " AND ts >= ?";
            sql += " ORDER BY ts DESC, rid DESC LIMIT ?";
            auto c = _acquire();
            stmt_t s { *c, sql };
            int idx = 0;
            if (filter.anchor_id)
                s.bind_text(++idx, *filter.anchor_id);
            if (filter.slot)
                s.bind_text(++idx, *filter.slot);
            if (filter.kind)
                s.bind_text(++idx, *filter.kind);
            if (filter.since)
                s.bind_int(++idx, *filter.since);
            s.bind_int(++idx, numeric_cast<int64_t>(filter.limit));
            std::vector<ledger::record_t> res {};
            while (s.step())
                res.emplace_back(_read_record(s));
            return res;
        }

        std::vector<std::string> anchors() const
        {
            auto c = _acquire();
            stmt_t s { *c, "SELECT DISTINCT anchor_id FROM ledger_records ORDER BY anchor_id" };
            std::vector<std::string> res {};
            while (s.step())
                res.emplace_back(s.text(0));
            return res;
        }

        void put_checkpoint(const ledger::checkpoint_t &cp)
        {
            auto c = _acquire();
            stmt_t s { *c, fmt::format("INSERT INTO ledger_checkpoints ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", checkpoint_cols) };
            s.bind_text(1, cp.id);
            s.bind_text(2, cp.anchor_id);
            s.bind_text(3, cp.range_start);
            s.bind_text(4, cp.range_end);
            s.bind_int(5, numeric_cast<int64_t>(cp.first_index));
            s.bind_int(6, numeric_cast<int64_t>(cp.record_count));
            s.bind_text(7, to_hex(cp.merkle_root));
            s.bind_text(8, to_hex(cp.prev_root));
            s.bind_text(9, cp.hash_algorithm);
            _bind_sig(s, 10, cp.sig);
            s.bind_int(13, cp.created_at);
            s.step();
        }

        std::optional<ledger::checkpoint_t> checkpoint(const std::string_view id) const
        {
            auto c = _acquire();
            stmt_t s { *c, fmt::format("SELECT {} FROM ledger_checkpoints WHERE cid = ?", checkpoint_cols) };
            s.bind_text(1, id);
            if (!s.step())
                return {};
            return _read_checkpoint(s);
        }

        std::vector<ledger::checkpoint_t> checkpoints(const std::string_view anchor_id) const
        {
            auto c = _acquire();
            stmt_t s { *c, fmt::format("SELECT {} FROM ledger_checkpoints WHERE anchor_id = ? ORDER BY rowid", checkpoint_cols) };
            s.bind_text(1, anchor_id);
            std::vector<ledger::checkpoint_t> res {};
            while (s.step())
                res.emplace_back(_read_checkpoint(s));
            return res;
        }

        backend_stats_t stats() const
        {
            auto c = _acquire();
            stmt_t s { *c, "SELECT (SELECT COUNT(*) FROM ledger_records), (SELECT COUNT(DISTINCT anchor_id) FROM ledger_records),"
                " (SELECT COUNT(*) FROM ledger_checkpoints)" };
            if (!s.step()) [[unlikely]]
                throw error("sqlite: the stats query returned no rows");
            return { numeric_cast<uint64_t>(s.int64(0)), numeric_cast<uint64_t>(s.int64(1)), numeric_cast<uint64_t>(s.int64(2)) };
        }

        void exec(const std::string &sql)
        {
            auto c = _acquire();
            c->exec(sql);
        }
    private:
        struct lease_t {
            const impl &pool;
            std::unique_ptr<conn_t> conn;

            ~lease_t()
            {
                pool._release(std::move(conn));
            }

            conn_t &operator*() const noexcept
            {
                return *conn;
            }

            conn_t *operator->() const noexcept
            {
                return conn.get();
            }
        };

        std::string _path;
        std::chrono::milliseconds _op_timeout;
        mutable std::mutex _pool_mutex {};
        mutable std::condition_variable _pool_cv {};
        mutable std::vector<std::unique_ptr<conn_t>> _free {};

        lease_t _acquire() const
        {
            std::unique_lock lk { _pool_mutex };
            if (!_pool_cv.wait_for(lk, _op_timeout, [&] { return !_free.empty(); }))
                throw backend_unavailable_error(fmt::format("sqlite: no free connection to {} within {} ms", _path, _op_timeout.count()));
            auto c = std::move(_free.back());
            _free.pop_back();
            c->arm(_op_timeout);
            return lease_t { *this, std::move(c) };
        }

        void _release(std::unique_ptr<conn_t> c) const
        {
            if (!c)
                return;
            c->disarm();
            {
                std::scoped_lock lk { _pool_mutex };
                _free.emplace_back(std::move(c));
            }
            _pool_cv.notify_one();
        }
    };

    backend_t::backend_t(const std::string &path, const size_t pool_size, const std::chrono::milliseconds op_timeout):
        _impl { std::make_unique<impl>(path, pool_size, op_timeout) }
    {
    }

    backend_t::~backend_t() =default;

    std::string backend_t::name() const
    {
        return "sqlite";
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

    void backend_t::exec(const std::string &sql)
    {
        _impl->exec(sql);
    }
}
