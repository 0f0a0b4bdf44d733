#pragma once
#ifndef AMF_TURBO_AMF3_DECODER_HPP
#define AMF_TURBO_AMF3_DECODER_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * A pull decoder of AMF3 values that delivers them to a visitor.
 * The hot-path methods are defined in this header to enable inlining.
 */

#include <cmath>
#include <limits>
#include <type_traits>
#include "cursor.hpp"
#include "visitor.hpp"

namespace amf_turbo::amf3 {
    struct decoder;

    struct seq_reader {
        seq_reader(const seq_reader &) =delete;

        size_t size() const noexcept
        {
            return _size;
        }

        size_t remaining() const noexcept
        {
            return _size - _pos;
        }

        bool done() const noexcept
        {
            return _pos >= _size;
        }

        void read(visitor &v, width w=width::any);
        // skips the next element, which must be a scalar
        void ignore();
    private:
        friend decoder;

        decoder &_dec;
        const size_t _size;
        size_t _pos = 0;

        seq_reader(decoder &dec, const size_t size) noexcept:
            _dec { dec }, _size { size }
        {
        }

        void _consume();
    };

    // associative entries come first in the encoded order followed by the dense ones with keys N-1 down to 0
    struct map_reader {
        map_reader(const map_reader &) =delete;

        bool done() const noexcept
        {
            return !_key_read && _next_key.empty() && _dense_left == 0;
        }

        size_t dense_size() const noexcept
        {
            return _dense_size;
        }

        // delivers a string key with visit_str and a dense key with visit_u64
        void read_key(visitor &v);
        void read_val(visitor &v, width w=width::any);
        // skips the value of the last read key, which must be a scalar
        void ignore_val();
    private:
        friend decoder;

        decoder &_dec;
        std::string_view _next_key;
        const size_t _dense_size;
        size_t _dense_left;
        bool _key_read = false;

        map_reader(decoder &dec, const std::string_view first_key, const size_t dense_size) noexcept:
            _dec { dec }, _next_key { first_key }, _dense_size { dense_size }, _dense_left { dense_size }
        {
        }

        void _begin_val();
        void _end_val();
        void _consume();
    };

    // a float-to-integer cast that maps NaN to zero and clamps values outside of the target range
    template<typename T>
    T saturate_cast(const double v)
    {
        if constexpr (std::is_floating_point_v<T>) {
            if constexpr (sizeof(T) < sizeof(double)) {
                if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<T>::max()) [[unlikely]]
                    return v > 0 ? std::numeric_limits<T>::infinity() : -std::numeric_limits<T>::infinity();
            }
            return static_cast<T>(v);
        } else {
            if (std::isnan(v)) [[unlikely]]
                return 0;
            if (v <= static_cast<double>(std::numeric_limits<T>::min()))
                return std::numeric_limits<T>::min();
            if (v >= static_cast<double>(std::numeric_limits<T>::max()))
                return std::numeric_limits<T>::max();
            return static_cast<T>(v);
        }
    }

    struct decoder {
        explicit decoder(const buffer data, const options &opts={}):
            _cur { data }, _opts { opts }
        {
        }

        decoder(const decoder &) =delete;

        void decode(visitor &v, width w=width::any);

        // skips a scalar value and reports it as none
        void ignore(visitor &v)
        {
            _cur.skip();
            v.visit_none();
        }

        bool done() const noexcept
        {
            return _cur.empty();
        }

        const cursor &input() const noexcept
        {
            return _cur;
        }

        const options &opts() const noexcept
        {
            return _opts;
        }

        size_t depth() const noexcept
        {
            return _depth;
        }
    private:
        friend seq_reader;
        friend map_reader;

        struct depth_guard {
            explicit depth_guard(decoder &dec):
                _dec { dec }
            {
                if (_dec._depth >= _dec._opts.max_depth) [[unlikely]]
                    throw max_depth_error { _dec._opts.max_depth };
                ++_dec._depth;
            }

            depth_guard(const depth_guard &) =delete;

            ~depth_guard()
            {
                --_dec._depth;
            }
        private:
            decoder &_dec;
        };

        cursor _cur;
        const options _opts;
        size_t _depth = 0;

        void _visit_int(visitor &v, width w, uint32_t val);
        void _visit_double(visitor &v, width w, double val);
        void _decode_array(visitor &v);
    };

    // decodes the first value of the buffer and ignores the bytes that follow it
    extern void decode(buffer data, visitor &v, width w=width::any, const options &opts={});
    // same as decode but also fails if any bytes remain after the value
    extern void decode_all(buffer data, visitor &v, width w=width::any, const options &opts={});

    inline void decoder::decode(visitor &v, const width w)
    {
        switch (const auto m = _cur.read_marker(); m) {
            case marker::undefined:
            case marker::null:
                return v.visit_none();
            case marker::s_false: return v.visit_bool(false);
            case marker::s_true: return v.visit_bool(true);
            case marker::integer: return _visit_int(v, w, _cur.read_u29());
            case marker::dbl: return _visit_double(v, w, _cur.read_double(_opts.double_order));
            case marker::string: return v.visit_str(_cur.read_string());
            case marker::array: return _decode_array(v);
            [[unlikely]] default: throw unsupported_error { m };
        }
    }

    inline void decoder::_visit_int(visitor &v, const width w, const uint32_t val)
    {
        switch (w) {
            case width::i8: return v.visit_i8(static_cast<int8_t>(val));
            case width::i16: return v.visit_i16(static_cast<int16_t>(val));
            case width::i32: return v.visit_i32(static_cast<int32_t>(val));
            case width::i64: return v.visit_i64(static_cast<int64_t>(val));
            case width::u8: return v.visit_u8(static_cast<uint8_t>(val));
            case width::u16: return v.visit_u16(static_cast<uint16_t>(val));
            case width::any:
            case width::u32: return v.visit_u32(val);
            case width::u64: return v.visit_u64(val);
            case width::f32: return v.visit_f32(static_cast<float>(val));
            case width::f64: return v.visit_f64(static_cast<double>(val));
            [[unlikely]] default: throw error(fmt::format("unsupported numeric width: {}", static_cast<int>(w)));
        }
    }

    inline void decoder::_visit_double(visitor &v, const width w, const double val)
    {
        switch (w) {
            case width::i8: return v.visit_i8(saturate_cast<int8_t>(val));
            case width::i16: return v.visit_i16(saturate_cast<int16_t>(val));
            case width::i32: return v.visit_i32(saturate_cast<int32_t>(val));
            case width::i64: return v.visit_i64(saturate_cast<int64_t>(val));
            case width::u8: return v.visit_u8(saturate_cast<uint8_t>(val));
            case width::u16: return v.visit_u16(saturate_cast<uint16_t>(val));
            case width::u32: return v.visit_u32(saturate_cast<uint32_t>(val));
            case width::u64: return v.visit_u64(saturate_cast<uint64_t>(val));
            case width::f32: return v.visit_f32(saturate_cast<float>(val));
            case width::any:
            case width::f64: return v.visit_f64(val);
            [[unlikely]] default: throw error(fmt::format("unsupported numeric width: {}", static_cast<int>(w)));
        }
    }

    inline void decoder::_decode_array(visitor &v)
    {
        const auto header = _cur.read_u29();
        if ((header & 1) == 0) [[unlikely]]
            throw unsupported_error { "array by reference" };
        const size_t size = header >> 1;
        const depth_guard guard { *this };
        if (const auto key = _cur.read_string(); key.empty()) {
            seq_reader seq { *this, size };
            v.visit_seq(seq);
            seq._consume();
        } else {
            map_reader map { *this, key, size };
            v.visit_map(map);
            map._consume();
        }
    }

    inline void seq_reader::read(visitor &v, const width w)
    {
        if (done()) [[unlikely]]
            throw decode_error("iteration past the end of the array!");
        ++_pos;
        _dec.decode(v, w);
    }

    inline void seq_reader::ignore()
    {
        if (done()) [[unlikely]]
            throw decode_error("iteration past the end of the array!");
        ++_pos;
        _dec._cur.skip();
    }

    inline void seq_reader::_consume()
    {
        while (!done())
            ignore();
    }

    inline void map_reader::read_key(visitor &v)
    {
        if (_key_read) [[unlikely]]
            throw decode_error("read_key called twice without a read_val!");
        if (done()) [[unlikely]]
            throw decode_error("iteration past the end of the map!");
        _key_read = true;
        if (!_next_key.empty())
            return v.visit_str(_next_key);
        v.visit_u64(--_dense_left);
    }

    inline void map_reader::read_val(visitor &v, const width w)
    {
        _begin_val();
        _dec.decode(v, w);
        _end_val();
    }

    inline void map_reader::ignore_val()
    {
        _begin_val();
        _dec._cur.skip();
        _end_val();
    }

    inline void map_reader::_begin_val()
    {
        if (!_key_read) [[unlikely]]
            throw decode_error("read_val called without a preceding read_key!");
        _key_read = false;
    }

    inline void map_reader::_end_val()
    {
        if (!_next_key.empty())
            _next_key = _dec._cur.read_string();
    }

    inline void map_reader::_consume()
    {
        while (!done()) {
            if (!_key_read) {
                _key_read = true;
                if (_next_key.empty())
                    --_dense_left;
            }
            ignore_val();
        }
    }
}

#endif // !AMF_TURBO_AMF3_DECODER_HPP
