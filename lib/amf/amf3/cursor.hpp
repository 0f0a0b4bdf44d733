#pragma once
#ifndef AMF_TURBO_AMF3_CURSOR_HPP
#define AMF_TURBO_AMF3_CURSOR_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * A forward-only zero-copy reader of AMF3 primitives. Strings returned by the cursor
 * and the entries of its string reference table point into the input buffer,
 * so the buffer must outlive the cursor and all values obtained from it.
 */

#include <bit>
#include <string_view>
#include <vector>
#include <utf8.h>
#include <amf/common/bytes.hpp>
#include "types.hpp"

namespace amf_turbo::amf3 {
    using string_table = std::vector<std::string_view>;

    struct cursor {
        explicit cursor(const buffer data):
            _begin { data.data() },
            _ptr { data.data() },
            _end { data.data() + data.size() }
        {
        }

        cursor(const cursor &) =delete;

        bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        size_t offset() const noexcept
        {
            return _ptr - _begin;
        }

        size_t remaining() const noexcept
        {
            return _end - _ptr;
        }

        const string_table &strings() const noexcept
        {
            return _strings;
        }

        uint8_t read_byte()
        {
            if (empty()) [[unlikely]]
                throw end_of_stream_error { offset() };
            return *_ptr++;
        }

        marker read_marker()
        {
            return marker_from_byte(read_byte());
        }

        // 0x00000000 - 0x0000007F : 0xxxxxxx
        // 0x00000080 - 0x00003FFF : 1xxxxxxx 0xxxxxxx
        // 0x00004000 - 0x001FFFFF : 1xxxxxxx 1xxxxxxx 0xxxxxxx
        // 0x00200000 - 0x3FFFFFFF : 1xxxxxxx 1xxxxxxx 1xxxxxxx xxxxxxxx
        uint32_t read_u29()
        {
            const uint8_t first = read_byte();
            uint32_t val = first & 0x7F;
            if (first & 0x80) {
                const uint8_t second = read_byte();
                val = (val << 7) | (second & 0x7F);
                if (second & 0x80) {
                    const uint8_t third = read_byte();
                    val = (val << 7) | (third & 0x7F);
                    if (third & 0x80) {
                        // the fourth byte contributes all of its 8 bits
                        val = (val << 8) | read_byte();
                    }
                }
            }
            return val;
        }

        double read_double(const byte_order order=byte_order::little)
        {
            const auto bytes = _take(sizeof(double));
            uint64_t bits = 0;
            if (order == byte_order::little) {
                for (size_t i = bytes.size(); i > 0; --i)
                    bits = (bits << 8) | bytes[i - 1];
            } else {
                for (const auto b: bytes)
                    bits = (bits << 8) | b;
            }
            return std::bit_cast<double>(bits);
        }

        std::string_view read_string()
        {
            const auto header = read_u29();
            const size_t val = header >> 1;
            if ((header & 1) == 0) {
                if (val >= _strings.size()) [[unlikely]]
                    throw missing_string_reference_error { val, _strings.size() };
                return _strings[val];
            }
            const auto start_off = offset();
            const auto bytes = _take(val);
            const auto *begin = reinterpret_cast<const char *>(bytes.data());
            const auto *end = begin + bytes.size();
            if (const auto *invalid = utf8::find_invalid(begin, end); invalid != end) [[unlikely]]
                throw string_decode_error { start_off + static_cast<size_t>(invalid - begin) };
            const std::string_view s { begin, bytes.size() };
            if (!s.empty())
                _strings.emplace_back(s);
            return s;
        }

        // only scalars can be skipped; composite values require a full decode
        void skip()
        {
            switch (const auto m = read_marker(); m) {
                case marker::undefined:
                case marker::null:
                case marker::s_false:
                case marker::s_true:
                    break;
                case marker::integer:
                    read_u29();
                    break;
                case marker::dbl:
                    _take(sizeof(double));
                    break;
                [[unlikely]] default:
                    throw unsupported_error { m };
            }
        }
    private:
        const uint8_t *_begin;
        const uint8_t *_ptr;
        const uint8_t *_end;
        string_table _strings {};

        buffer _take(const size_t num_bytes)
        {
            if (remaining() < num_bytes) [[unlikely]]
                throw end_of_stream_error { offset() };
            const buffer res { _ptr, num_bytes };
            _ptr += num_bytes;
            return res;
        }
    };
}

#endif // !AMF_TURBO_AMF3_CURSOR_HPP
