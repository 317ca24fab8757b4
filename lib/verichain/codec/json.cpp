/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <sstream>
#include <verichain/common/file.hpp>
#include "json.hpp"

namespace verichain::codec::json {
    value parse(const buffer &buf)
    {
        boost::system::error_code ec {};
        boost::json::parse_options opts {};
        // doubles must survive a serialize-parse cycle bit for bit since hashes are computed over their text
        opts.numbers = boost::json::number_precision::precise;
        auto jv = boost::json::parse(static_cast<std::string_view>(buf), ec, {}, opts);
        if (ec) [[unlikely]]
            throw error(fmt::format("invalid JSON: {}", ec.message()));
        return jv;
    }

    value load(const std::string &path)
    {
        return parse(file::read(path));
    }

    void save_pretty(std::ostream& os, value const &jv, std::string *indent)
    {
        static constexpr size_t indent_step = 2;
        std::string indent_ {};
        if(!indent)
            indent = &indent_;
        switch (jv.kind()) {
            case kind::object: {
                const auto &obj = jv.get_object();
                if (obj.empty()) {
                    os << "{}";
                    break;
                }
                os << "{\n";
                indent->append(indent_step, ' ');
                for (auto it = obj.begin(), last = std::prev(obj.end()); it != obj.end(); ++it) {
                    os << *indent << json::serialize(it->key()) << ": ";
                    save_pretty(os, it->value(), indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "}";
                break;
            }
            case kind::array: {
                const auto &arr = jv.get_array();
                if (arr.empty()) {
                    os << "[]";
                    break;
                }
                os << "[\n";
                indent->append(indent_step, ' ');
                for (auto it = arr.begin(), last = std::prev(arr.end()); it != arr.end(); ++it) {
                    os << *indent;
                    save_pretty(os, *it, indent);
                    if (it != last)
                        os << ',';
                    os << '\n';
                }
                indent->resize(indent->size() - indent_step);
                os << *indent << "]";
                break;
            }
            case kind::string:
                os << serialize(jv.get_string());
                break;
            case kind::uint64:
                os << jv.get_uint64();
                break;
            case kind::int64:
                os << jv.get_int64();
                break;
            case kind::double_:
                os << serialize(jv);
                break;
            case kind::bool_:
                if(jv.get_bool())
                    os << "true";
                else
                    os << "false";
                break;
            case kind::null:
                os << "null";
                break;
        }
    }

    std::string serialize_pretty(const value &jv)
    {
        std::ostringstream ss {};
        save_pretty(ss, jv);
        return ss.str();
    }

    void save_pretty(const std::string &path, const value &jv)
    {
        file::write(path, serialize_pretty(jv));
    }

    const value *find(const object &obj, const std::string_view key)
    {
        if (const auto it = obj.find(key); it != obj.end() && !it->value().is_null())
            return &it->value();
        return nullptr;
    }

    std::string get_string(const object &obj, const std::string_view key, const std::string_view def)
    {
        if (const auto *jv = find(obj, key)) {
            if (!jv->is_string()) [[unlikely]]
                throw error(fmt::format("the value of '{}' must be a string", key));
            return std::string { as_sv(jv->get_string()) };
        }
        return std::string { def };
    }

    uint64_t get_uint(const object &obj, const std::string_view key, const uint64_t def)
    {
        if (const auto *jv = find(obj, key)) {
            if (jv->is_uint64())
                return jv->get_uint64();
            if (jv->is_int64() && jv->get_int64() >= 0)
                return static_cast<uint64_t>(jv->get_int64());
            throw error(fmt::format("the value of '{}' must be a non-negative integer", key));
        }
        return def;
    }

    double get_double(const object &obj, const std::string_view key, const double def)
    {
        if (const auto *jv = find(obj, key)) {
            if (const auto num = as_number(*jv))
                return *num;
            throw error(fmt::format("the value of '{}' must be a number", key));
        }
        return def;
    }

    const object &get_object(const object &obj, const std::string_view key)
    {
        static const object empty {};
        if (const auto *jv = find(obj, key)) {
            if (!jv->is_object()) [[unlikely]]
                throw error(fmt::format("the value of '{}' must be an object", key));
            return jv->get_object();
        }
        return empty;
    }

    std::optional<double> as_number(const value &jv)
    {
        switch (jv.kind()) {
            case kind::double_: return jv.get_double();
            case kind::int64: return static_cast<double>(jv.get_int64());
            case kind::uint64: return static_cast<double>(jv.get_uint64());
            default: return {};
        }
    }
}
