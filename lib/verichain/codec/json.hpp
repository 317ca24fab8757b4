#pragma once
/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <boost/json.hpp>
#include <verichain/common/bytes.hpp>

namespace verichain::codec::json {
    using namespace boost::json;

    inline std::string_view as_sv(const boost::json::string &s) noexcept
    {
        return { s.data(), s.size() };
    }

    inline std::string_view as_sv(const boost::json::string_view s) noexcept
    {
        return { s.data(), s.size() };
    }

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    extern void save_pretty(std::ostream& os, value const &jv, std::string *indent = nullptr);
    extern std::string serialize_pretty(const value &jv);
    extern void save_pretty(const std::string &path, const value &jv);

    // typed accessors for configuration-like documents with optional keys
    extern const value *find(const object &obj, std::string_view key);
    extern std::string get_string(const object &obj, std::string_view key, std::string_view def);
    extern uint64_t get_uint(const object &obj, std::string_view key, uint64_t def);
    extern double get_double(const object &obj, std::string_view key, double def);
    extern const object &get_object(const object &obj, std::string_view key);

    // numeric values of any JSON number kind as double
    extern std::optional<double> as_number(const value &jv);
}
