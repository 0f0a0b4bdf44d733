/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <amf/amf3/decoder.hpp>
#include <amf/config.hpp>
#include <amf/logger.hpp>

namespace amf_turbo::amf3 {
    options options::from_config(const config &cfg)
    {
        options opts {};
        if (const auto *max_depth = cfg.find("maxDepth"); max_depth) {
            const auto v = json::value_to<int64_t>(*max_depth);
            if (v <= 0)
                throw error(fmt::format("maxDepth must be a positive number but got {}", v));
            opts.max_depth = static_cast<size_t>(v);
        }
        if (const auto *order = cfg.find("doubleByteOrder"); order) {
            const std::string_view order_s = order->as_string();
            if (order_s == "little")
                opts.double_order = byte_order::little;
            else if (order_s == "big")
                opts.double_order = byte_order::big;
            else
                throw error(fmt::format("doubleByteOrder must be either 'little' or 'big' but got '{}'", order_s));
        }
        return opts;
    }

    std::string visitor::expecting() const
    {
        return "a supported value";
    }

    void visitor::_unexpected(const std::string_view what) const
    {
        throw custom_error(fmt::format("invalid type: {}, expected {}", what, expecting()));
    }

    void visitor::visit_none()
    {
        _unexpected("none");
    }

    void visitor::visit_bool(const bool v)
    {
        _unexpected(fmt::format("boolean {}", v));
    }

    void visitor::visit_i64(const int64_t v)
    {
        _unexpected(fmt::format("integer {}", v));
    }

    void visitor::visit_u64(const uint64_t v)
    {
        _unexpected(fmt::format("integer {}", v));
    }

    void visitor::visit_f64(const double v)
    {
        _unexpected(fmt::format("floating point {}", v));
    }

    void visitor::visit_str(const std::string_view v)
    {
        _unexpected(fmt::format("string '{}'", v));
    }

    void visitor::visit_seq(seq_reader &)
    {
        _unexpected("sequence");
    }

    void visitor::visit_map(map_reader &)
    {
        _unexpected("map");
    }

    void decode(const buffer data, visitor &v, const width w, const options &opts)
    {
        logger::trace("amf3: decoding a value from {} bytes with max depth {}", data.size(), opts.max_depth);
        decoder dec { data, opts };
        dec.decode(v, w);
        logger::trace("amf3: the value took {} bytes, {} strings interned", dec.input().offset(), dec.input().strings().size());
    }

    void decode_all(const buffer data, visitor &v, const width w, const options &opts)
    {
        logger::trace("amf3: decoding a value from {} bytes with max depth {}", data.size(), opts.max_depth);
        decoder dec { data, opts };
        dec.decode(v, w);
        if (!dec.done()) [[unlikely]]
            throw decode_error(fmt::format("{} trailing bytes after the AMF3 value at offset {}", dec.input().remaining(), dec.input().offset()));
        logger::trace("amf3: the value took {} bytes, {} strings interned", dec.input().offset(), dec.input().strings().size());
    }
}
