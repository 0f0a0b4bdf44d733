#pragma once
#ifndef AMF_TURBO_AMF3_BIND_HPP
#define AMF_TURBO_AMF3_BIND_HPP
/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

/*
 * Maps decoded values onto C++ types. A struct becomes bindable by listing its fields:
 *
 * struct point {
 *     int32_t x = 0;
 *     int32_t y = 0;
 *
 *     static auto fields(auto &self)
 *     {
 *         return std::make_tuple(amf3::field("x", self.x), amf3::field("y", self.y));
 *     }
 * };
 *
 * A std::variant of such structs is read from a map whose first entry names the alternative.
 * Each alternative declares its name as a static tag member and the key of the entry
 * is given by variant_tag_key:
 *
 * struct fly_up {
 *     static constexpr std::string_view tag = "FlyUp";
 *     double distance = 0;
 *     ...
 * };
 * using action = std::variant<fly_up, fly_down>;
 *
 * namespace amf_turbo::amf3 {
 *     template<>
 *     struct variant_tag_key<action> {
 *         static constexpr std::string_view value = "Type";
 *     };
 * }
 */

#include <algorithm>
#include <array>
#include <concepts>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>
#include "value.hpp"

namespace amf_turbo::amf3 {
    template<typename T>
    struct field_ref {
        std::string_view name;
        T &val;
    };

    template<typename T>
    field_ref<T> field(const std::string_view name, T &val)
    {
        return { name, val };
    }

    template<typename T>
    concept bindable_struct = requires(T &t) {
        T::fields(t);
    };

    template<typename T>
    concept tagged_struct = bindable_struct<T> && requires {
        { T::tag } -> std::convertible_to<std::string_view>;
    };

    template<typename V>
    struct variant_tag_key {
        static constexpr std::string_view value = "type";
    };

    template<typename T>
    struct is_optional: std::false_type {};

    template<typename T>
    struct is_optional<std::optional<T>>: std::true_type {};

    template<typename T>
    constexpr width width_of() noexcept
    {
        if constexpr (std::is_floating_point_v<T>) {
            return sizeof(T) <= sizeof(float) ? width::f32 : width::f64;
        } else if constexpr (std::is_signed_v<T>) {
            switch (sizeof(T)) {
                case 1: return width::i8;
                case 2: return width::i16;
                case 4: return width::i32;
                default: return width::i64;
            }
        } else {
            switch (sizeof(T)) {
                case 1: return width::u8;
                case 2: return width::u16;
                case 4: return width::u32;
                default: return width::u64;
            }
        }
    }

    template<typename T>
    struct binder;

    // integer keys never match a field name
    struct field_name_reader: visitor {
        explicit field_name_reader(std::optional<std::string_view> &out):
            _out { out }
        {
        }

        void visit_u64(const uint64_t) override
        {
            _out.reset();
        }

        void visit_str(const std::string_view v) override
        {
            _out = v;
        }
    private:
        std::optional<std::string_view> &_out;
    };

    template<>
    struct binder<bool>: visitor {
        static constexpr width hint = width::any;

        explicit binder(bool &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a boolean";
        }

        void visit_bool(const bool v) override
        {
            _out = v;
        }
    private:
        bool &_out;
    };

    template<std::integral T>
        requires (!std::is_same_v<T, bool>)
    struct binder<T>: visitor {
        static constexpr width hint = width_of<T>();

        explicit binder(T &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return fmt::format("an integer of type {}", hint);
        }

        void visit_i64(const int64_t v) override
        {
            _out = _checked(v);
        }

        void visit_u64(const uint64_t v) override
        {
            _out = _checked(v);
        }
    private:
        T &_out;

        template<typename V>
        T _checked(const V v) const
        {
            if (!std::in_range<T>(v)) [[unlikely]]
                throw custom_error(fmt::format("invalid value: integer {}, expected {}", v, expecting()));
            return static_cast<T>(v);
        }
    };

    template<std::floating_point T>
    struct binder<T>: visitor {
        static constexpr width hint = width_of<T>();

        explicit binder(T &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return fmt::format("a floating point number of type {}", hint);
        }

        void visit_i64(const int64_t v) override
        {
            _out = static_cast<T>(v);
        }

        void visit_u64(const uint64_t v) override
        {
            _out = static_cast<T>(v);
        }

        void visit_f64(const double v) override
        {
            _out = static_cast<T>(v);
        }
    private:
        T &_out;
    };

    // the view points into the input buffer
    template<>
    struct binder<std::string_view>: visitor {
        static constexpr width hint = width::any;

        explicit binder(std::string_view &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a string";
        }

        void visit_str(const std::string_view v) override
        {
            _out = v;
        }
    private:
        std::string_view &_out;
    };

    template<>
    struct binder<std::string>: visitor {
        static constexpr width hint = width::any;

        explicit binder(std::string &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a string";
        }

        void visit_str(const std::string_view v) override
        {
            _out.assign(v);
        }
    private:
        std::string &_out;
    };

    template<>
    struct binder<value>: value_builder {
        static constexpr width hint = width::any;

        using value_builder::value_builder;
    };

    template<typename T>
    struct binder<std::optional<T>>: visitor {
        static constexpr width hint = binder<T>::hint;

        explicit binder(std::optional<T> &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "an optional value";
        }

        void visit_none() override
        {
            _out.reset();
        }

        void visit_bool(const bool v) override
        {
            _inner().visit_bool(v);
        }

        void visit_i8(const int8_t v) override
        {
            _inner().visit_i8(v);
        }

        void visit_i16(const int16_t v) override
        {
            _inner().visit_i16(v);
        }

        void visit_i32(const int32_t v) override
        {
            _inner().visit_i32(v);
        }

        void visit_i64(const int64_t v) override
        {
            _inner().visit_i64(v);
        }

        void visit_u8(const uint8_t v) override
        {
            _inner().visit_u8(v);
        }

        void visit_u16(const uint16_t v) override
        {
            _inner().visit_u16(v);
        }

        void visit_u32(const uint32_t v) override
        {
            _inner().visit_u32(v);
        }

        void visit_u64(const uint64_t v) override
        {
            _inner().visit_u64(v);
        }

        void visit_f32(const float v) override
        {
            _inner().visit_f32(v);
        }

        void visit_f64(const double v) override
        {
            _inner().visit_f64(v);
        }

        void visit_str(const std::string_view v) override
        {
            _inner().visit_str(v);
        }

        void visit_seq(seq_reader &seq) override
        {
            _inner().visit_seq(seq);
        }

        void visit_map(map_reader &map) override
        {
            _inner().visit_map(map);
        }
    private:
        std::optional<T> &_out;
        std::optional<binder<T>> _binder {};

        binder<T> &_inner()
        {
            if (!_binder)
                _binder.emplace(_out.emplace());
            return *_binder;
        }
    };

    template<typename T>
    struct binder<std::vector<T>>: visitor {
        static constexpr width hint = width::any;

        explicit binder(std::vector<T> &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a sequence";
        }

        void visit_seq(seq_reader &seq) override
        {
            _out.clear();
            _out.reserve(std::min(seq.size(), max_reserve));
            while (!seq.done()) {
                T item {};
                binder<T> item_binder { item };
                seq.read(item_binder, binder<T>::hint);
                _out.emplace_back(std::move(item));
            }
        }
    private:
        static constexpr size_t max_reserve = 1024;

        std::vector<T> &_out;
    };

    // dense entries have integer keys and fail the binding of the string key
    template<typename T>
    struct binder<std::map<std::string, T>>: visitor {
        static constexpr width hint = width::any;

        explicit binder(std::map<std::string, T> &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a map with string keys";
        }

        void visit_map(map_reader &map) override
        {
            _out.clear();
            while (!map.done()) {
                std::string key {};
                binder<std::string> key_binder { key };
                map.read_key(key_binder);
                T val {};
                binder<T> val_binder { val };
                map.read_val(val_binder, binder<T>::hint);
                _out.insert_or_assign(std::move(key), std::move(val));
            }
        }
    private:
        std::map<std::string, T> &_out;
    };

    template<bindable_struct T>
    struct binder<T>: visitor {
        static constexpr width hint = width::any;

        explicit binder(T &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return "a map of named fields";
        }

        void visit_map(map_reader &map) override
        {
            read_fields(map, _out);
        }

        // reads the remaining entries of the map
        static void read_fields(map_reader &map, T &out)
        {
            auto fields = T::fields(out);
            constexpr size_t num_fields = std::tuple_size_v<decltype(fields)>;
            std::array<bool, num_fields> seen {};
            while (!map.done()) {
                std::optional<std::string_view> name {};
                field_name_reader name_reader { name };
                map.read_key(name_reader);
                if (!name || !_read_field(map, fields, *name, seen, std::make_index_sequence<num_fields> {}))
                    map.ignore_val();
            }
            _check_missing(fields, seen, std::make_index_sequence<num_fields> {});
        }
    private:
        T &_out;

        template<typename F, size_t N, size_t... I>
        static bool _read_field(map_reader &map, F &fields, const std::string_view name, std::array<bool, N> &seen, std::index_sequence<I...>)
        {
            return (_read_field_at(map, std::get<I>(fields), name, seen[I]) || ...);
        }

        template<typename V>
        static bool _read_field_at(map_reader &map, const field_ref<V> &f, const std::string_view name, bool &seen)
        {
            if (f.name != name)
                return false;
            if (seen) [[unlikely]]
                throw custom_error(fmt::format("duplicate field `{}`", name));
            seen = true;
            binder<V> val_binder { f.val };
            map.read_val(val_binder, binder<V>::hint);
            return true;
        }

        template<typename F, size_t N, size_t... I>
        static void _check_missing(const F &fields, const std::array<bool, N> &seen, std::index_sequence<I...>)
        {
            (_check_field(std::get<I>(fields), seen[I]), ...);
        }

        // optional fields may be absent
        template<typename V>
        static void _check_field(const field_ref<V> &f, const bool seen)
        {
            if constexpr (!is_optional<V>::value) {
                if (!seen) [[unlikely]]
                    throw custom_error(fmt::format("missing field `{}`", f.name));
            }
        }
    };

    template<tagged_struct... Alts>
    struct binder<std::variant<Alts...>>: visitor {
        using variant_type = std::variant<Alts...>;
        static constexpr width hint = width::any;
        static constexpr std::string_view tag_key = variant_tag_key<variant_type>::value;

        explicit binder(variant_type &out):
            _out { out }
        {
        }

        std::string expecting() const override
        {
            return fmt::format("a map tagged with the `{}` field", tag_key);
        }

        void visit_map(map_reader &map) override
        {
            if (map.done()) [[unlikely]]
                throw custom_error(fmt::format("missing field `{}`", tag_key));
            std::optional<std::string_view> name {};
            field_name_reader name_reader { name };
            map.read_key(name_reader);
            if (!name || *name != tag_key) [[unlikely]]
                throw custom_error(fmt::format("the first field must be `{}`", tag_key));
            std::string_view tag {};
            binder<std::string_view> tag_binder { tag };
            map.read_val(tag_binder);
            if (!_select(map, tag, std::index_sequence_for<Alts...> {})) [[unlikely]]
                throw custom_error(fmt::format("unknown variant `{}`", tag));
        }
    private:
        variant_type &_out;

        template<size_t... I>
        bool _select(map_reader &map, const std::string_view tag, std::index_sequence<I...>)
        {
            return (_select_at<I>(map, tag) || ...);
        }

        template<size_t I>
        bool _select_at(map_reader &map, const std::string_view tag)
        {
            using alt_type = std::variant_alternative_t<I, variant_type>;
            if (alt_type::tag != tag)
                return false;
            binder<alt_type>::read_fields(map, _out.template emplace<I>());
            return true;
        }
    };

    template<typename T>
    T decode(const buffer data, const options &opts={})
    {
        T res {};
        binder<T> res_binder { res };
        amf3::decode(data, res_binder, binder<T>::hint, opts);
        return res;
    }
}

#endif // !AMF_TURBO_AMF3_BIND_HPP
