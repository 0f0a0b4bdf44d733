/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef AMF_TURBO_AMF3_VISITOR_HPP
#define AMF_TURBO_AMF3_VISITOR_HPP

#include <string>
#include <string_view>
#include "types.hpp"

namespace amf_turbo::amf3 {
    struct seq_reader;
    struct map_reader;

    /*
     * The set of capabilities a consumer of decoded values provides.
     * Narrower numeric widths forward to the 64-bit ones by default.
     * All other defaults reject the value with a custom_error,
     * so a consumer overrides only the methods for the values it accepts.
     */
    struct visitor {
        virtual ~visitor() =default;

        // a human-readable description of the values the consumer accepts, used in error messages
        virtual std::string expecting() const;

        virtual void visit_none();
        virtual void visit_bool(bool v);

        virtual void visit_i8(const int8_t v)
        {
            visit_i64(v);
        }

        virtual void visit_i16(const int16_t v)
        {
            visit_i64(v);
        }

        virtual void visit_i32(const int32_t v)
        {
            visit_i64(v);
        }

        virtual void visit_i64(int64_t v);

        virtual void visit_u8(const uint8_t v)
        {
            visit_u64(v);
        }

        virtual void visit_u16(const uint16_t v)
        {
            visit_u64(v);
        }

        virtual void visit_u32(const uint32_t v)
        {
            visit_u64(v);
        }

        virtual void visit_u64(uint64_t v);

        virtual void visit_f32(const float v)
        {
            visit_f64(v);
        }

        virtual void visit_f64(double v);
        // the view points into the input buffer
        virtual void visit_str(std::string_view v);
        // the reader is valid only until the call returns; unread elements are skipped afterwards
        virtual void visit_seq(seq_reader &seq);
        virtual void visit_map(map_reader &map);
    protected:
        [[noreturn]] void _unexpected(std::string_view what) const;
    };
}

#endif // !AMF_TURBO_AMF3_VISITOR_HPP
