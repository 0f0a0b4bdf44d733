/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef AMF_TURBO_AMF3_TYPES_HPP
#define AMF_TURBO_AMF3_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <amf/common/error.hpp>
#include <amf/common/format.hpp>

namespace amf_turbo {
    struct config;
}

namespace amf_turbo::amf3 {
    enum class marker: uint8_t {
        undefined = 0x00,
        null = 0x01,
        s_false = 0x02,
        s_true = 0x03,
        integer = 0x04,
        dbl = 0x05,
        string = 0x06,
        xml_doc = 0x07,
        date = 0x08,
        array = 0x09,
        object = 0x0A,
        xml = 0x0B,
        byte_array = 0x0C,
        vector_int = 0x0D,
        vector_uint = 0x0E,
        vector_double = 0x0F,
        vector_object = 0x10,
        dictionary = 0x11
    };

    static constexpr uint8_t marker_end = 0x12;

    // the numeric type a consumer wants a number delivered as
    enum class width: uint8_t {
        any, i8, i16, i32, i64, u8, u16, u32, u64, f32, f64
    };

    enum class byte_order: uint8_t {
        little, big
    };

    struct options {
        static constexpr size_t default_max_depth = 64;

        size_t max_depth = default_max_depth;
        byte_order double_order = byte_order::little;

        // reads the optional maxDepth and doubleByteOrder keys
        static options from_config(const config &cfg);
    };

    typedef amf_turbo::error error;

    // the common base of all AMF3 format errors
    struct decode_error: error {
        using error::error;
    };

    struct invalid_marker_error: decode_error {
        explicit invalid_marker_error(const uint8_t byte):
            decode_error { fmt::format("an invalid AMF3 marker: #{:02X}", byte) }, _byte { byte }
        {
        }

        uint8_t byte() const noexcept
        {
            return _byte;
        }
    private:
        uint8_t _byte;
    };

    struct end_of_stream_error: decode_error {
        explicit end_of_stream_error(const size_t offset):
            decode_error { fmt::format("AMF3 value extends beyond the end of stream at offset {}", offset) }
        {
        }
    };

    struct string_decode_error: decode_error {
        explicit string_decode_error(const size_t offset):
            decode_error { fmt::format("AMF3 string contains invalid UTF-8 at offset {}", offset) }
        {
        }
    };

    struct missing_string_reference_error: decode_error {
        explicit missing_string_reference_error(const size_t idx, const size_t table_size):
            decode_error { fmt::format("AMF3 string reference #{} is missing: the table has only {} entries", idx, table_size) },
            _index { idx }
        {
        }

        size_t index() const noexcept
        {
            return _index;
        }
    private:
        size_t _index;
    };

    struct unsupported_error: decode_error {
        explicit unsupported_error(const marker m);

        explicit unsupported_error(const std::string_view what):
            decode_error { fmt::format("unsupported AMF3 value: {}", what) }
        {
        }
    };

    struct max_depth_error: decode_error {
        explicit max_depth_error(const size_t max_depth):
            decode_error { fmt::format("the AMF3 structure has more than {} levels!", max_depth) }
        {
        }
    };

    // raised by consumers when a decoded value does not fit the requested shape
    struct custom_error: decode_error {
        using decode_error::decode_error;
    };

    inline bool is_valid_marker(const uint8_t byte) noexcept
    {
        return byte < marker_end;
    }

    inline marker marker_from_byte(const uint8_t byte)
    {
        if (!is_valid_marker(byte)) [[unlikely]]
            throw invalid_marker_error { byte };
        return static_cast<marker>(byte);
    }
}

namespace fmt {
    template<>
    struct formatter<amf_turbo::amf3::marker>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using amf_turbo::amf3::marker;
            switch (v) {
                case marker::undefined: return fmt::format_to(ctx.out(), "undefined");
                case marker::null: return fmt::format_to(ctx.out(), "null");
                case marker::s_false: return fmt::format_to(ctx.out(), "false");
                case marker::s_true: return fmt::format_to(ctx.out(), "true");
                case marker::integer: return fmt::format_to(ctx.out(), "integer");
                case marker::dbl: return fmt::format_to(ctx.out(), "double");
                case marker::string: return fmt::format_to(ctx.out(), "string");
                case marker::xml_doc: return fmt::format_to(ctx.out(), "xml-doc");
                case marker::date: return fmt::format_to(ctx.out(), "date");
                case marker::array: return fmt::format_to(ctx.out(), "array");
                case marker::object: return fmt::format_to(ctx.out(), "object");
                case marker::xml: return fmt::format_to(ctx.out(), "xml");
                case marker::byte_array: return fmt::format_to(ctx.out(), "byte-array");
                case marker::vector_int: return fmt::format_to(ctx.out(), "vector-int");
                case marker::vector_uint: return fmt::format_to(ctx.out(), "vector-uint");
                case marker::vector_double: return fmt::format_to(ctx.out(), "vector-double");
                case marker::vector_object: return fmt::format_to(ctx.out(), "vector-object");
                case marker::dictionary: return fmt::format_to(ctx.out(), "dictionary");
                default: return fmt::format_to(ctx.out(), "marker: {}", static_cast<int>(v));
            }
        }
    };

    template<>
    struct formatter<amf_turbo::amf3::width>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using amf_turbo::amf3::width;
            switch (v) {
                case width::any: return fmt::format_to(ctx.out(), "any");
                case width::i8: return fmt::format_to(ctx.out(), "i8");
                case width::i16: return fmt::format_to(ctx.out(), "i16");
                case width::i32: return fmt::format_to(ctx.out(), "i32");
                case width::i64: return fmt::format_to(ctx.out(), "i64");
                case width::u8: return fmt::format_to(ctx.out(), "u8");
                case width::u16: return fmt::format_to(ctx.out(), "u16");
                case width::u32: return fmt::format_to(ctx.out(), "u32");
                case width::u64: return fmt::format_to(ctx.out(), "u64");
                case width::f32: return fmt::format_to(ctx.out(), "f32");
                case width::f64: return fmt::format_to(ctx.out(), "f64");
                default: return fmt::format_to(ctx.out(), "width: {}", static_cast<int>(v));
            }
        }
    };
}

namespace amf_turbo::amf3 {
    inline unsupported_error::unsupported_error(const marker m):
        decode_error { fmt::format("unsupported AMF3 value: {}", m) }
    {
    }
}

#endif // !AMF_TURBO_AMF3_TYPES_HPP
