#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>
#include <verichain/common/format.hpp>
#include <verichain/common/mutex.hpp>

namespace verichain::ledger {
    enum class core_kind_t: uint8_t {
        create,
        update,
        anchor_created,
        pqc_signed,
        pqc_verified
    };

    // Either one of the closed set of core kinds or an extended kind name admitted by a kind_registry_t.
    struct record_kind_t {
        using value_t = std::variant<core_kind_t, std::string>;

        static std::optional<core_kind_t> core_from_name(std::string_view name) noexcept;
        static std::string_view core_name(core_kind_t k) noexcept;
        // Does not consult a registry. Intended for records that have been validated before they were stored.
        static record_kind_t from_name(std::string_view name);

        record_kind_t(core_kind_t k =core_kind_t::create):
            _val { k }
        {
        }

        [[nodiscard]] std::string_view name() const noexcept;

        [[nodiscard]] bool is_core() const noexcept
        {
            return std::holds_alternative<core_kind_t>(_val);
        }

        [[nodiscard]] const value_t &value() const noexcept
        {
            return _val;
        }

        bool operator==(const record_kind_t &o) const =default;
    private:
        explicit record_kind_t(std::string extended):
            _val { std::move(extended) }
        {
        }

        value_t _val;
    };

    struct kind_registry_t {
        static bool valid_name(std::string_view name) noexcept;

        kind_registry_t(const std::vector<std::string> &extended={});

        // Admits a new extended kind. Names must be 1..64 characters of A-Z, 0-9 and '_' and start with a letter.
        void add(std::string_view name);
        // Throws encoding_error for names that are neither core kinds nor registered.
        [[nodiscard]] record_kind_t parse(std::string_view name) const;
        [[nodiscard]] bool contains(const record_kind_t &k) const;
        [[nodiscard]] std::vector<std::string> names() const;
    private:
        alignas(mutex::alignment) mutable std::shared_mutex _mutex {};
        std::set<std::string, std::less<>> _extended {};
    };
}

namespace fmt {
    template<>
    struct formatter<verichain::ledger::record_kind_t>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const verichain::ledger::record_kind_t &k, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(k.name(), ctx);
        }
    };
}
