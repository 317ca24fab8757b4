/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <cmath>
#include <limits>
#include <verichain/common/test.hpp>
#include "canonical.hpp"

namespace {
    using namespace verichain;
    using namespace verichain::codec;
    using namespace std::string_view_literals;

    std::string canon(const std::string_view text)
    {
        return canonical::encode(json::parse(text));
    }
}

suite verichain_codec_canonical_suite = [] {
    "verichain::codec::canonical"_test = [] {
        "key order and whitespace do not matter"_test = [] {
            const auto a = canon("{\"b\": 1, \"a\": {\"y\": [1, 2, {\"d\": true, \"c\": null}], \"x\": \"s\"}}");
            const auto b = canon("{\"a\":{\"x\":\"s\",\"y\":[1,2,{\"c\":null,\"d\":true}]},\"b\":1}");
            expect_equal(a, b);
            expect_equal(std::string { "{\"a\":{\"x\":\"s\",\"y\":[1,2,{\"c\":null,\"d\":true}]},\"b\":1}" }, a);
        };
        "array order matters"_test = [] {
            expect(canon("[1,2]") != canon("[2,1]"));
        };
        "integers and doubles differ"_test = [] {
            expect_equal(std::string { "{\"v\":1}" }, canon("{\"v\":1}"));
            expect_equal(std::string { "{\"v\":1.0}" }, canon("{\"v\":1.0}"));
            expect_equal(std::string { "{\"v\":0.93}" }, canon("{\"v\":0.930}"));
            expect_equal(std::string { "{\"v\":-5}" }, canon("{\"v\":-5}"));
            expect_equal(std::string { "18446744073709551615" }, canonical::encode(json::value { std::numeric_limits<uint64_t>::max() }));
        };
        "doubles survive a reparse"_test = [] {
            for (const double d: { 0.1, 1e21, 1e-7, -0.0, 123456.789, 5e-324 }) {
                const auto text = canonical::encode(json::value { d });
                expect_equal(text, canonical::encode(json::parse(text)));
            }
        };
        "non-finite numbers are rejected"_test = [] {
            expect(throws<canonical::encoding_error>([] { canonical::encode(json::value { std::numeric_limits<double>::quiet_NaN() }); }));
            expect(throws<canonical::encoding_error>([] { canonical::encode(json::value { std::numeric_limits<double>::infinity() }); }));
        };
        "string escaping"_test = [] {
            std::string out {};
            canonical::encode_string(out, "a\"b\\c\nd\x01\xc3\xa9");
            expect_equal(std::string { "\"a\\\"b\\\\c\\nd\\u0001\xc3\xa9\"" }, out);
        };
        "utf-8 validation"_test = [] {
            expect(canonical::valid_utf8("plain"sv));
            expect(canonical::valid_utf8("\xe2\x82\xac"sv));
            expect(!canonical::valid_utf8("\xc0\xaf"sv));
            expect(!canonical::valid_utf8("\xed\xa0\x80"sv));
            expect(!canonical::valid_utf8("\xe2\x82"sv));
            json::object obj {};
            obj["k"] = "\xff";
            expect(throws<canonical::encoding_error>([&] { canonical::encode(obj); }));
        };
        "nesting cap"_test = [] {
            json::value deep = json::array { 1 };
            for (size_t i = 0; i <= canonical::max_depth; ++i)
                deep = json::array { std::move(deep) };
            expect(throws<canonical::encoding_error>([&] { canonical::encode(deep); }));
            expect(boost::ut::nothrow([] { canon("[[[1]]]"); }));
        };
    };
};
