/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include "backend.hpp"
#include "lmdb.hpp"
#include "sqlite.hpp"

namespace verichain::storage {
    backend_ptr_t open_durable(const durable_config_t &cfg)
    {
        const std::string_view dsn { cfg.dsn };
        if (dsn.starts_with("sqlite:"))
            return std::make_shared<sqlite::backend_t>(std::string { dsn.substr(7) }, cfg.pool_size, cfg.op_timeout);
        if (dsn.starts_with("lmdb:"))
            return std::make_shared<lmdb::backend_t>(dsn.substr(5));
        if (dsn.find("://") != dsn.npos)
            throw error(fmt::format("unsupported durable backend connection string: '{}'", dsn));
        // a plain path is an SQLite database file
        return std::make_shared<sqlite::backend_t>(cfg.dsn, cfg.pool_size, cfg.op_timeout);
    }
}
