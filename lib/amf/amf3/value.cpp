/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */

#include <iterator>
#include <amf/amf3/value.hpp>

namespace amf_turbo::amf3 {
    namespace {
        struct key_builder: visitor {
            explicit key_builder(map_key &out):
                _out { out }
            {
            }

            std::string expecting() const override
            {
                return "a map key";
            }

            void visit_u64(const uint64_t v) override
            {
                _out = v;
            }

            void visit_str(const std::string_view v) override
            {
                _out = v;
            }
        private:
            map_key &_out;
        };
    }

    std::string_view value::_type_name(const storage_type &s) noexcept
    {
        switch (s.index()) {
            case 0: return "none";
            case 1: return "bool";
            case 2: return "uint";
            case 3: return "int";
            case 4: return "double";
            case 5: return "string";
            case 6: return "list";
            case 7: return "map";
            default: return "unknown";
        }
    }

    std::string_view value::type_name() const noexcept
    {
        return _type_name(_storage);
    }

    int64_t value::as_int() const
    {
        if (const auto *v = std::get_if<int64_t>(&_storage); v)
            return *v;
        const auto u = as_uint();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) [[unlikely]]
            throw error(fmt::format("AMF3 value {} does not fit into int64", u));
        return static_cast<int64_t>(u);
    }

    size_t value::size() const
    {
        if (const auto *l = std::get_if<value_list>(&_storage); l)
            return l->size();
        if (const auto *m = std::get_if<value_map>(&_storage); m)
            return m->size();
        throw error(fmt::format("size() requires an AMF3 list or map but got {}", type_name()));
    }

    const value &value::at(const size_t idx) const
    {
        const auto &l = as_list();
        if (idx >= l.size())
            throw error(fmt::format("AMF3 list index {} is out of range: size {}", idx, l.size()));
        return l[idx];
    }

    const value &value::at(const std::string_view key) const
    {
        if (const auto *v = find(key); v)
            return *v;
        throw error(fmt::format("AMF3 map does not have the key '{}'", key));
    }

    const value *value::find(const map_key &key) const
    {
        for (const auto &[k, v]: as_map()) {
            if (k == key)
                return &v;
        }
        return nullptr;
    }

    std::string value::to_string() const
    {
        std::string res {};
        amf3::format_to(std::back_inserter(res), *this);
        return res;
    }

    std::string value_builder::expecting() const
    {
        return "any AMF3 value";
    }

    void value_builder::visit_none()
    {
        _out = value {};
    }

    void value_builder::visit_bool(const bool v)
    {
        _out = value { v };
    }

    void value_builder::visit_i64(const int64_t v)
    {
        _out = value { v };
    }

    void value_builder::visit_u64(const uint64_t v)
    {
        _out = value { v };
    }

    void value_builder::visit_f64(const double v)
    {
        _out = value { v };
    }

    void value_builder::visit_str(const std::string_view v)
    {
        _out = value { v };
    }

    void value_builder::visit_seq(seq_reader &seq)
    {
        value_list items {};
        while (!seq.done()) {
            value_builder item_builder { items.emplace_back() };
            seq.read(item_builder);
        }
        _out = value { std::move(items) };
    }

    void value_builder::visit_map(map_reader &map)
    {
        value_map entries {};
        while (!map.done()) {
            auto &[key, val] = entries.emplace_back();
            key_builder kb { key };
            map.read_key(kb);
            value_builder vb { val };
            map.read_val(vb);
        }
        _out = value { std::move(entries) };
    }

    value parse(const buffer data, const options &opts)
    {
        value res {};
        value_builder builder { res };
        decode(data, builder, width::any, opts);
        return res;
    }

    json::value to_json(const value &v)
    {
        return std::visit([](const auto &vv) -> json::value {
            using T = std::decay_t<decltype(vv)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, value_list>) {
                json::array arr {};
                arr.reserve(vv.size());
                for (const auto &item: vv)
                    arr.emplace_back(to_json(item));
                return arr;
            } else if constexpr (std::is_same_v<T, value_map>) {
                json::object obj {};
                for (const auto &[k, item]: vv) {
                    const auto *s = std::get_if<std::string_view>(&k);
                    const auto key = s ? std::string { *s } : fmt::format("{}", std::get<uint64_t>(k));
                    // dense keys become decimal strings and may collide with string keys
                    if (const auto [it, created] = obj.emplace(key, to_json(item)); !created) [[unlikely]]
                        throw error(fmt::format("the JSON object already has a key '{}'", key));
                }
                return obj;
            } else if constexpr (std::is_same_v<T, std::string_view>) {
                return json::string { vv };
            } else {
                return vv;
            }
        }, v.storage());
    }
}
