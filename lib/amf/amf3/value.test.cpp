/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <amf/common/test.hpp>
#include "value.hpp"

using namespace amf_turbo;
using namespace amf_turbo::amf3;

suite amf3_value_suite = [] {
    "amf3::value"_test = [] {
        "scalars"_test = [] {
            expect(parse(uint8_vector::from_hex("00")).is_none());
            expect(parse(uint8_vector::from_hex("01")).is_none());
            expect(!parse(uint8_vector::from_hex("02")).as_bool());
            expect(parse(uint8_vector::from_hex("03")).as_bool());
            test_same(parse(uint8_vector::from_hex("0405")).as_uint(), 5);
            test_same(parse(uint8_vector::from_hex("0405")).as_int(), 5);
            test_same(parse(uint8_vector::from_hex("05000000000000D03F")).as_double(), 0.25);
        };
        "strings point into the input"_test = [] {
            const auto data = uint8_vector::from_hex("060B48656C6C6F");
            const auto v = parse(data);
            test_same(v.as_string(), std::string_view { "Hello" });
            expect(reinterpret_cast<const uint8_t *>(v.as_string().data()) == data.data() + 2);
        };
        "dense list"_test = [] {
            const auto v = parse(uint8_vector::from_hex("090701040104020403"));
            test_same(v.size(), 3);
            test_same(v.at(0).as_uint(), 1);
            test_same(v.at(1).as_uint(), 2);
            test_same(v.at(2).as_uint(), 3);
            expect(throws<error>([&] { static_cast<void>(v.at(3)); }));
            expect(v == value { value_list { value { uint64_t { 1 } }, value { uint64_t { 2 } }, value { uint64_t { 3 } } } });
        };
        "map"_test = [] {
            const auto v = parse(uint8_vector::from_hex("0901036104050362040701"));
            test_same(v.size(), 2);
            test_same(v.at("a").as_uint(), 5);
            test_same(v.at("b").as_uint(), 7);
            expect(v.find(std::string_view { "c" }) == nullptr);
            expect(throws<error>([&] { static_cast<void>(v.at("c")); }));
        };
        "map keeps the encoded key order"_test = [] {
            const auto v = parse(uint8_vector::from_hex("09070361040101046404650466"));
            const auto &m = v.as_map();
            test_same(m.size(), 4);
            expect(m[0].first == map_key { std::string_view { "a" } });
            expect(m[1].first == map_key { uint64_t { 2 } });
            expect(m[2].first == map_key { uint64_t { 1 } });
            expect(m[3].first == map_key { uint64_t { 0 } });
            test_same(m[1].second.as_uint(), 100);
            test_same(m[3].second.as_uint(), 102);
            expect(v.find(uint64_t { 0 }) != nullptr);
        };
        "type mismatch"_test = [] {
            const auto v = parse(uint8_vector::from_hex("0405"));
            test_same(v.type_name(), std::string_view { "uint" });
            expect(throws<error>([&] { static_cast<void>(v.as_string()); }));
            expect(throws<error>([&] { static_cast<void>(v.as_list()); }));
            expect(throws<error>([&] { static_cast<void>(v.size()); }));
            expect(throws<error>([] { static_cast<void>(value { std::numeric_limits<uint64_t>::max() }.as_int()); }));
            test_same(value { int64_t { -3 } }.as_int(), -3);
        };
        "errors propagate"_test = [] {
            expect(throws<invalid_marker_error>([] { parse(uint8_vector::from_hex("12")); }));
            expect(throws<end_of_stream_error>([] { parse(uint8_vector::from_hex("090701040104")); }));
            expect(throws<unsupported_error>([] { parse(uint8_vector::from_hex("0A0B01")); }));
        };
        "options"_test = [] {
            options opts {};
            opts.double_order = byte_order::big;
            test_same(parse(uint8_vector::from_hex("053FD0000000000000"), opts).as_double(), 0.25);
            opts.max_depth = 1;
            expect(throws<max_depth_error>([&] { parse(uint8_vector::from_hex("090301090101"), opts); }));
        };
        "format"_test = [] {
            test_same(fmt::format("{}", parse(uint8_vector::from_hex("0405"))), std::string { "U 5" });
            test_same(fmt::format("{}", parse(uint8_vector::from_hex("060361"))), std::string { "T 'a'" });
            test_same(fmt::format("{}", parse(uint8_vector::from_hex("03"))), std::string { "true" });
            test_same(fmt::format("{}", parse(uint8_vector::from_hex("01"))), std::string { "none" });
            test_same(fmt::format("{}", parse(uint8_vector::from_hex("090101"))), std::string { "[](size: 0)" });
            test_same(parse(uint8_vector::from_hex("0905010401060361")).to_string(),
                std::string { "[\n    #0: U 1\n    #1: T 'a'\n](size: 2)" });
            test_same(parse(uint8_vector::from_hex("0903036109030104020101")).to_string(),
                std::string { "{\n    #0: T 'a': [\n        #0: U 2\n    ](size: 1)\n    #1: U 0: none\n}(size: 2)" });
        };
        "to_json"_test = [] {
            const auto v = parse(uint8_vector::from_hex("0903036109050104020603620102"));
            const auto j = to_json(v);
            expect(j.is_object());
            const auto &obj = j.as_object();
            test_same(obj.size(), 2);
            const auto &arr = obj.at("a").as_array();
            test_same(arr.size(), 2);
            test_same(arr.at(0).as_uint64(), 2);
            test_same(std::string_view { arr.at(1).as_string() }, std::string_view { "b" });
            expect(obj.at("0").is_bool());
            expect(!obj.at("0").as_bool());
            expect(to_json(parse(uint8_vector::from_hex("00"))).is_null());
            test_same(to_json(parse(uint8_vector::from_hex("05000000000000D03F"))).as_double(), 0.25);
        };
        "to_json key collisions"_test = [] {
            const auto data = uint8_vector::from_hex("090303300401010402");
            const auto v = parse(data);
            test_same(v.size(), 2);
            expect(throws<error>([&] { to_json(v); }));
            const auto dup_data = uint8_vector::from_hex("0901036104010361040201");
            expect(throws<error>([&] { to_json(parse(dup_data)); }));
        };
    };
};
