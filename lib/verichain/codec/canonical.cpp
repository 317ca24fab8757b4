/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <algorithm>
#include <cmath>
#include "canonical.hpp"

namespace verichain::codec::canonical {
    bool valid_utf8(const std::string_view s) noexcept
    {
        size_t i = 0;
        while (i < s.size()) {
            const auto c = static_cast<uint8_t>(s[i]);
            size_t len;
            uint32_t cp;
            if (c < 0x80) {
                ++i;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (i + len > s.size())
                return false;
            for (size_t j = 1; j < len; ++j) {
                const auto cc = static_cast<uint8_t>(s[i + j]);
                if ((cc & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            // overlong forms, surrogates and values above the Unicode range
            if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
                    || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
                return false;
            i += len;
        }
        return true;
    }

    void encode_string(std::string &out, const std::string_view s)
    {
        if (!valid_utf8(s)) [[unlikely]]
            throw encoding_error("a string is not valid UTF-8");
        out += '"';
        for (const char c: s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<uint8_t>(c) < 0x20) {
                        out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                    } else {
                        out += c;
                    }
            }
        }
        out += '"';
    }

    static void encode_double(std::string &out, const double d)
    {
        if (!std::isfinite(d)) [[unlikely]]
            throw encoding_error(fmt::format("non-finite numbers are not serializable: {}", d));
        auto text = fmt::format("{}", d);
        if (text.find_first_of(".e") == std::string::npos)
            text += ".0";
        out += text;
    }

    static void encode(std::string &out, const json::value &jv, const size_t depth)
    {
        if (depth > max_depth) [[unlikely]]
            throw encoding_error(fmt::format("nesting is deeper than {} levels", max_depth));
        switch (jv.kind()) {
            case json::kind::object: {
                const auto &obj = jv.get_object();
                std::vector<const json::key_value_pair *> items {};
                items.reserve(obj.size());
                for (const auto &kv: obj)
                    items.emplace_back(&kv);
                std::sort(items.begin(), items.end(), [](const auto *l, const auto *r) { return json::as_sv(l->key()) < json::as_sv(r->key()); });
                out += '{';
                for (size_t i = 0; i < items.size(); ++i) {
                    if (i)
                        out += ',';
                    encode_string(out, json::as_sv(items[i]->key()));
                    out += ':';
                    encode(out, items[i]->value(), depth + 1);
                }
                out += '}';
                break;
            }
            case json::kind::array: {
                const auto &arr = jv.get_array();
                out += '[';
                for (size_t i = 0; i < arr.size(); ++i) {
                    if (i)
                        out += ',';
                    encode(out, arr[i], depth + 1);
                }
                out += ']';
                break;
            }
            case json::kind::string:
                encode_string(out, json::as_sv(jv.get_string()));
                break;
            case json::kind::uint64:
                out += fmt::format("{}", jv.get_uint64());
                break;
            case json::kind::int64:
                out += fmt::format("{}", jv.get_int64());
                break;
            case json::kind::double_:
                encode_double(out, jv.get_double());
                break;
            case json::kind::bool_:
                out += jv.get_bool() ? "true" : "false";
                break;
            case json::kind::null:
                out += "null";
                break;
        }
    }

    void encode(std::string &out, const json::value &jv)
    {
        encode(out, jv, 0);
    }

    std::string encode(const json::value &jv)
    {
        std::string out {};
        encode(out, jv, 0);
        return out;
    }
}
