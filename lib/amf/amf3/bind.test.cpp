/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <amf/common/test.hpp>
#include "bind.hpp"

using namespace amf_turbo;
using namespace amf_turbo::amf3;

namespace {
    struct strip_state {
        uint32_t action_index = 0;
        uint32_t id = 0;

        static auto fields(auto &self)
        {
            return std::make_tuple(
                amf3::field("actionIndex", self.action_index),
                amf3::field("id", self.id)
            );
        }
    };

    struct execution_state {
        uint32_t state_id = 0;
        std::vector<strip_state> strips {};

        static auto fields(auto &self)
        {
            return std::make_tuple(
                amf3::field("stateID", self.state_id),
                amf3::field("strips", self.strips)
            );
        }
    };

    struct user {
        std::string name {};
        std::optional<std::string_view> nick {};

        static auto fields(auto &self)
        {
            return std::make_tuple(amf3::field("name", self.name), amf3::field("nick", self.nick));
        }
    };

    struct on_interact {
        static constexpr std::string_view tag = "OnInteract";
        std::string callback_id {};

        static auto fields(auto &self)
        {
            return std::make_tuple(amf3::field("__callbackID__", self.callback_id));
        }
    };

    struct fly_up {
        static constexpr std::string_view tag = "FlyUp";
        double distance = 0;
        std::string callback_id {};

        static auto fields(auto &self)
        {
            return std::make_tuple(amf3::field("Distance", self.distance), amf3::field("__callbackID__", self.callback_id));
        }
    };

    struct fly_down {
        static constexpr std::string_view tag = "FlyDown";
        double distance = 0;
        std::string callback_id {};

        static auto fields(auto &self)
        {
            return std::make_tuple(amf3::field("Distance", self.distance), amf3::field("__callbackID__", self.callback_id));
        }
    };

    using action = std::variant<on_interact, fly_up, fly_down>;

    struct strip {
        uint32_t id = 0;
        std::vector<action> actions {};

        static auto fields(auto &self)
        {
            return std::make_tuple(amf3::field("id", self.id), amf3::field("actions", self.actions));
        }
    };
}

namespace amf_turbo::amf3 {
    template<>
    struct variant_tag_key<action> {
        static constexpr std::string_view value = "Type";
    };
}

namespace {
    template<typename T>
    T decode_hex(const std::string_view hex)
    {
        return amf3::decode<T>(uint8_vector::from_hex(hex));
    }
}

suite amf3_bind_suite = [] {
    "amf3::bind"_test = [] {
        "bool"_test = [] {
            expect(decode_hex<bool>("03"));
            expect(!decode_hex<bool>("02"));
            expect(throws<custom_error>([] { decode_hex<bool>("0401"); }));
        };
        "integers"_test = [] {
            test_same(decode_hex<uint8_t>("0405"), 5);
            test_same(decode_hex<int8_t>("0405"), 5);
            test_same(decode_hex<uint16_t>("0405"), 5);
            test_same(decode_hex<int16_t>("0405"), 5);
            test_same(decode_hex<uint32_t>("04FFFFFFFF"), 0x1FFFFFFFU);
            test_same(decode_hex<int32_t>("0405"), 5);
            test_same(decode_hex<uint64_t>("0405"), 5);
            test_same(decode_hex<int64_t>("0405"), 5);
            test_same(decode_hex<int32_t>("05000000000000F8BF"), -1);
            test_same(decode_hex<uint8_t>("050000000000C07240"), 255);
            expect(throws<custom_error>([] { decode_hex<int32_t>("060361"); }));
        };
        "integer range"_test = [] {
            uint8_t x = 0;
            binder<uint8_t> b { x };
            b.visit_u64(200);
            test_same(x, 200);
            expect(throws<custom_error>([&] { b.visit_u64(300); }));
            expect(throws<custom_error>([&] { b.visit_i64(-1); }));
        };
        "floating point"_test = [] {
            test_same(decode_hex<double>("05000000000000D03F"), 0.25);
            test_same(decode_hex<float>("05000000000000D03F"), 0.25F);
            test_same(decode_hex<double>("0405"), 5.0);
            test_same(decode_hex<float>("0405"), 5.0F);
        };
        "strings"_test = [] {
            test_same(decode_hex<std::string>("060B48656C6C6F"), std::string { "Hello" });
            const auto data = uint8_vector::from_hex("060B48656C6C6F");
            const auto sv = amf3::decode<std::string_view>(data);
            test_same(sv, std::string_view { "Hello" });
            expect(reinterpret_cast<const uint8_t *>(sv.data()) == data.data() + 2);
            expect(throws<custom_error>([] { decode_hex<std::string>("0405"); }));
        };
        "optional"_test = [] {
            expect(!decode_hex<std::optional<uint32_t>>("01").has_value());
            expect(!decode_hex<std::optional<uint32_t>>("00").has_value());
            test_same(decode_hex<std::optional<uint32_t>>("0405").value(), 5);
            test_same(decode_hex<std::optional<std::string>>("060361").value(), std::string { "a" });
            expect(throws<custom_error>([] { decode_hex<std::optional<uint32_t>>("03"); }));
        };
        "vector"_test = [] {
            test_same(decode_hex<std::vector<uint16_t>>("090701040104020403"), std::vector<uint16_t> { 1, 2, 3 });
            expect(decode_hex<std::vector<bool>>("0905010302") == std::vector<bool> { true, false });
            expect(decode_hex<std::vector<uint16_t>>("090101").empty());
            expect(throws<custom_error>([] { decode_hex<std::vector<uint16_t>>("0405"); }));
            expect(throws<custom_error>([] { decode_hex<std::vector<uint16_t>>("0901036104050362040701"); }));
        };
        "map"_test = [] {
            const auto m = decode_hex<std::map<std::string, uint32_t>>("0901036104050362040701");
            test_same(m.size(), 2);
            test_same(m.at("a"), 5);
            test_same(m.at("b"), 7);
            expect(throws<custom_error>([] { decode_hex<std::map<std::string, uint32_t>>("0903036104050101"); }));
        };
        "value"_test = [] {
            const auto data = uint8_vector::from_hex("0901036104050362040701");
            const auto v = amf3::decode<value>(data);
            test_same(v.at("b").as_uint(), 7);
        };
        "struct"_test = [] {
            const auto st = decode_hex<execution_state>(
                "09010F7374617465494404030D737472697073090501090117616374696F6E496E646578040105696404070109010404020604080B65787472610500000000000000000101");
            test_same(st.state_id, 3);
            test_same(st.strips.size(), 2);
            test_same(st.strips[0].action_index, 1);
            test_same(st.strips[0].id, 7);
            test_same(st.strips[1].action_index, 2);
            test_same(st.strips[1].id, 8);
        };
        "struct missing field"_test = [] {
            try {
                decode_hex<strip_state>("090117616374696F6E496E646578040101");
                expect(false);
            } catch (const custom_error &ex) {
                test_same(std::string_view { ex.what() }, std::string_view { "missing field `id`" });
            }
        };
        "struct duplicate field"_test = [] {
            expect(throws<custom_error>([] { decode_hex<strip_state>("0901056964040100040201"); }));
        };
        "struct wrong field type"_test = [] {
            expect(throws<custom_error>([] { decode_hex<strip_state>("090105696406037801"); }));
            expect(throws<custom_error>([] { decode_hex<strip_state>("090701040104020403"); }));
        };
        "struct optional field"_test = [] {
            {
                const auto u = decode_hex<user>("0901096E616D650607626F6201");
                test_same(u.name, std::string { "bob" });
                expect(!u.nick.has_value());
            }
            {
                const auto u = decode_hex<user>("0901096E616D650607626F62096E69636B0101");
                expect(!u.nick.has_value());
            }
            {
                const auto data = uint8_vector::from_hex("0901096E616D650607626F62096E69636B06036201");
                const auto u = amf3::decode<user>(data);
                test_same(u.nick.value(), std::string_view { "b" });
            }
        };
        "tagged variant"_test = [] {
            const auto s = decode_hex<strip>(
                "090105696404010F616374696F6E7309050109010954797065060B466C7955701144697374616E63650500000000000004401D5F5F63616C6C6261636B49445F5F06056331010901095479706506154F6E496E7465726163741D5F5F63616C6C6261636B49445F5F060563320101");
            test_same(s.id, 1);
            test_same(s.actions.size(), 2);
            expect(std::holds_alternative<fly_up>(s.actions.at(0)));
            test_same(std::get<fly_up>(s.actions.at(0)).distance, 2.5);
            test_same(std::get<fly_up>(s.actions.at(0)).callback_id, std::string { "c1" });
            expect(std::holds_alternative<on_interact>(s.actions.at(1)));
            test_same(std::get<on_interact>(s.actions.at(1)).callback_id, std::string { "c2" });
        };
        "tagged variant errors"_test = [] {
            // the tag is not the first entry
            expect(throws<custom_error>([] { decode_hex<action>("09011144697374616E63650500000000000004400954797065060B466C7955701D5F5F63616C6C6261636B49445F5F0605633101"); }));
            // unknown tag
            expect(throws<custom_error>([] { decode_hex<action>("0901095479706506094A756D701D5F5F63616C6C6261636B49445F5F0605633101"); }));
            // the alternative misses a field
            expect(throws<custom_error>([] { decode_hex<action>("09010954797065060F466C79446F776E1D5F5F63616C6C6261636B49445F5F0605633101"); }));
            // an empty map and a tag of a wrong type
            expect(throws<custom_error>([] { decode_hex<action>("090101"); }));
            expect(throws<custom_error>([] { decode_hex<action>("09010954797065040501"); }));
            expect(throws<custom_error>([] { decode_hex<action>("0405"); }));
        };
        "options"_test = [] {
            options opts {};
            opts.double_order = byte_order::big;
            test_same(amf3::decode<double>(uint8_vector::from_hex("053FD0000000000000"), opts), 0.25);
            opts.max_depth = 1;
            expect(throws<max_depth_error>([&] { amf3::decode<std::vector<std::vector<uint8_t>>>(uint8_vector::from_hex("090301090101"), opts); }));
        };
    };
};
