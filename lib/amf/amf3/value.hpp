#pragma once
#ifndef AMF_TURBO_AMF3_VALUE_HPP
#define AMF_TURBO_AMF3_VALUE_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <amf/json.hpp>
#include "decoder.hpp"

namespace amf_turbo::amf3 {
    struct value;
    using value_list = std::vector<value>;
    using map_key = std::variant<std::string_view, uint64_t>;
    // entries are kept in the encoded order: associative keys first, then dense keys in descending order
    using value_map = std::vector<std::pair<map_key, value>>;

    // a decoded value tree; strings point into the input buffer
    struct value {
        using storage_type = std::variant<std::monostate, bool, uint64_t, int64_t, double, std::string_view, value_list, value_map>;

        value() =default;

        value(const bool v): _storage { v }
        {
        }

        value(const uint64_t v): _storage { v }
        {
        }

        value(const int64_t v): _storage { v }
        {
        }

        value(const double v): _storage { v }
        {
        }

        value(const std::string_view v): _storage { v }
        {
        }

        value(const char *v): _storage { std::string_view { v } }
        {
        }

        value(value_list &&v): _storage { std::move(v) }
        {
        }

        value(value_map &&v): _storage { std::move(v) }
        {
        }

        bool operator==(const value &o) const
        {
            return _storage == o._storage;
        }

        const storage_type &storage() const noexcept
        {
            return _storage;
        }

        std::string_view type_name() const noexcept;

        bool is_none() const noexcept
        {
            return std::holds_alternative<std::monostate>(_storage);
        }

        bool as_bool() const
        {
            return _get<bool>();
        }

        uint64_t as_uint() const
        {
            return _get<uint64_t>();
        }

        // accepts both signed and unsigned values that fit into int64_t
        int64_t as_int() const;

        double as_double() const
        {
            return _get<double>();
        }

        std::string_view as_string() const
        {
            return _get<std::string_view>();
        }

        const value_list &as_list() const
        {
            return _get<value_list>();
        }

        const value_map &as_map() const
        {
            return _get<value_map>();
        }

        // the number of elements of a list or of entries of a map
        size_t size() const;
        const value &at(size_t idx) const;
        const value &at(std::string_view key) const;
        const value *find(const map_key &key) const;
        std::string to_string() const;
    private:
        storage_type _storage {};

        template<typename T>
        const T &_get() const
        {
            if (const auto *v = std::get_if<T>(&_storage); v) [[likely]]
                return *v;
            throw error(fmt::format("expected AMF3 value of type {} but got {}", _type_name(storage_type { std::in_place_type<T> }), type_name()));
        }

        static std::string_view _type_name(const storage_type &s) noexcept;
    };

    // collects the decoded values into a value tree
    struct value_builder: visitor {
        explicit value_builder(value &out):
            _out { out }
        {
        }

        std::string expecting() const override;
        void visit_none() override;
        void visit_bool(bool v) override;
        void visit_i64(int64_t v) override;
        void visit_u64(uint64_t v) override;
        void visit_f64(double v) override;
        void visit_str(std::string_view v) override;
        void visit_seq(seq_reader &seq) override;
        void visit_map(map_reader &map) override;
    private:
        value &_out;
    };

    // decodes the first value of the buffer into a value tree
    extern value parse(buffer data, const options &opts={});
    extern json::value to_json(const value &v);

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const map_key &k)
    {
        if (const auto *s = std::get_if<std::string_view>(&k); s)
            return fmt::format_to(out_it, "T '{}'", *s);
        return fmt::format_to(out_it, "U {}", std::get<uint64_t>(k));
    }

    template<typename OUT_IT>
    OUT_IT format_to(OUT_IT out_it, const value &v, const size_t depth=0, const size_t max_seq_to_expand=std::numeric_limits<size_t>::max())
    {
        return std::visit([&](const auto &vv) {
            using T = std::decay_t<decltype(vv)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return fmt::format_to(out_it, "none");
            } else if constexpr (std::is_same_v<T, bool>) {
                return fmt::format_to(out_it, "{}", vv);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                return fmt::format_to(out_it, "U {}", vv);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return fmt::format_to(out_it, "I {}", vv);
            } else if constexpr (std::is_same_v<T, double>) {
                return fmt::format_to(out_it, "F {}", vv);
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return fmt::format_to(out_it, "T '{}'", vv);
            } else if constexpr (std::is_same_v<T, value_list>) {
                out_it = fmt::format_to(out_it, "[");
                if (!vv.empty()) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; i < vv.size() && i < max_seq_to_expand; ++i) {
                        out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                        out_it = amf3::format_to(out_it, vv[i], depth + 1, max_seq_to_expand);
                        out_it = fmt::format_to(out_it, "\n");
                    }
                    if (vv.size() > max_seq_to_expand)
                        out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                return fmt::format_to(out_it, "](size: {})", vv.size());
            } else {
                out_it = fmt::format_to(out_it, "{{");
                if (!vv.empty()) {
                    out_it = fmt::format_to(out_it, "\n");
                    for (size_t i = 0; i < vv.size() && i < max_seq_to_expand; ++i) {
                        out_it = fmt::format_to(out_it, "{:{}}    #{}: ", "", depth * 4, i);
                        out_it = amf3::format_to(out_it, vv[i].first);
                        out_it = fmt::format_to(out_it, ": ");
                        out_it = amf3::format_to(out_it, vv[i].second, depth + 1, max_seq_to_expand);
                        out_it = fmt::format_to(out_it, "\n");
                    }
                    if (vv.size() > max_seq_to_expand)
                        out_it = fmt::format_to(out_it, "{:{}}    ...\n", "", depth * 4);
                    out_it = fmt::format_to(out_it, "{:{}}", "", depth * 4);
                }
                return fmt::format_to(out_it, "}}(size: {})", vv.size());
            }
        }, v.storage());
    }
}

namespace fmt {
    template<>
    struct formatter<amf_turbo::amf3::value>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return amf_turbo::amf3::format_to(ctx.out(), v);
        }
    };
}

#endif // !AMF_TURBO_AMF3_VALUE_HPP
