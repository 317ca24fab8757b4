/* This file is part of VeriChain project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file */

#include <verichain/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace verichain;
    namespace json = verichain::codec::json;
    using namespace std::string_view_literals;
}

suite verichain_codec_json_suite = [] {
    "verichain::codec::json"_test = [] {
        "save_pretty + reload object"_test = [] {
            file::tmp t { "json-save-pretty-object-test.json" };
            const auto j = json::object {
                { "backend", "durable" },
                { "pool_size", 5 }
            };
            json::save_pretty(t.path(), j);
            const auto buf = file::read(t.path());
            expect_equal(std::string_view { "{\n  \"backend\": \"durable\",\n  \"pool_size\": 5\n}" }, std::string_view { buf });
            const auto loaded = json::load(t.path());
            expect(j == loaded);
        };
        "save_pretty empty containers"_test = [] {
            expect_equal(std::string { "{}" }, json::serialize_pretty(json::object {}));
            expect_equal(std::string { "[]" }, json::serialize_pretty(json::array {}));
        };
        "parse errors"_test = [] {
            expect(throws<error>([] { json::parse("{\"a\":"sv); }));
            expect(boost::ut::nothrow([] { json::parse("{\"a\":1}"sv); }));
        };
        "typed accessors"_test = [] {
            const auto jv = json::parse("{\"s\":\"x\",\"u\":7,\"d\":0.25,\"o\":{\"k\":1},\"n\":null}"sv);
            const auto &obj = jv.as_object();
            expect_equal(std::string { "x" }, json::get_string(obj, "s", "def"));
            expect_equal(std::string { "def" }, json::get_string(obj, "missing", "def"));
            expect_equal(std::string { "def" }, json::get_string(obj, "n", "def"));
            expect_equal(uint64_t { 7 }, json::get_uint(obj, "u", 0));
            expect_near(0.25, json::get_double(obj, "d", 0.0));
            expect_near(7.0, json::get_double(obj, "u", 0.0));
            expect(json::get_object(obj, "o").contains("k"));
            expect(json::get_object(obj, "missing").empty());
            expect(throws<error>([&] { json::get_uint(obj, "s", 0); }));
            expect(throws<error>([&] { json::get_object(obj, "u"); }));
            expect(!json::as_number(obj.at("s")));
        };
    };
};
