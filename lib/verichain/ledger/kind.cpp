/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <array>
#include <mutex>
#include <verichain/codec/canonical.hpp>
#include "kind.hpp"

namespace verichain::ledger {
    using namespace std::string_view_literals;

    static constexpr std::array core_names {
        std::pair { core_kind_t::create, "CREATE"sv },
        std::pair { core_kind_t::update, "UPDATE"sv },
        std::pair { core_kind_t::anchor_created, "ANCHOR_CREATED"sv },
        std::pair { core_kind_t::pqc_signed, "PQC_SIGNED"sv },
        std::pair { core_kind_t::pqc_verified, "PQC_VERIFIED"sv }
    };

    std::optional<core_kind_t> record_kind_t::core_from_name(const std::string_view name) noexcept
    {
        for (const auto &[k, k_name]: core_names) {
            if (k_name == name)
                return k;
        }
        return {};
    }

    std::string_view record_kind_t::core_name(const core_kind_t k) noexcept
    {
        for (const auto &[ck, k_name]: core_names) {
            if (ck == k)
                return k_name;
        }
        return "UNKNOWN"sv;
    }

    record_kind_t record_kind_t::from_name(const std::string_view name)
    {
        if (const auto core = core_from_name(name))
            return { *core };
        if (!kind_registry_t::valid_name(name)) [[unlikely]]
            throw codec::canonical::encoding_error(fmt::format("an invalid record kind name: '{}'", name));
        return record_kind_t { std::string { name } };
    }

    std::string_view record_kind_t::name() const noexcept
    {
        if (const auto *core = std::get_if<core_kind_t>(&_val))
            return core_name(*core);
        return std::get<std::string>(_val);
    }

    bool kind_registry_t::valid_name(const std::string_view name) noexcept
    {
        if (name.empty() || name.size() > 64 || !(name[0] >= 'A' && name[0] <= 'Z'))
            return false;
        for (const char c: name) {
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_'))
                return false;
        }
        return true;
    }

    kind_registry_t::kind_registry_t(const std::vector<std::string> &extended)
    {
        for (const auto &name: extended)
            add(name);
    }

    void kind_registry_t::add(const std::string_view name)
    {
        if (!valid_name(name)) [[unlikely]]
            throw error(fmt::format("an invalid record kind name: '{}'", name));
        if (record_kind_t::core_from_name(name))
            return;
        std::unique_lock lk { _mutex };
        _extended.emplace(name);
    }

    record_kind_t kind_registry_t::parse(const std::string_view name) const
    {
        if (const auto core = record_kind_t::core_from_name(name))
            return { *core };
        {
            std::shared_lock lk { _mutex };
            if (_extended.contains(name))
                return record_kind_t::from_name(name);
        }
        throw codec::canonical::encoding_error(fmt::format("an unregistered record kind: '{}'", name));
    }

    bool kind_registry_t::contains(const record_kind_t &k) const
    {
        if (k.is_core())
            return true;
        std::shared_lock lk { _mutex };
        return _extended.contains(k.name());
    }

    std::vector<std::string> kind_registry_t::names() const
    {
        std::vector<std::string> res {};
        for (const auto &[k, k_name]: core_names)
            res.emplace_back(k_name);
        std::shared_lock lk { _mutex };
        res.insert(res.end(), _extended.begin(), _extended.end());
        return res;
    }
}
