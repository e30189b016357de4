/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/validate.hpp"
#include "wa/errors.hpp"
#include "wa/internal/utils.hpp"

#include <type_traits>

namespace wa {

FieldDefault FieldDefault::text(std::string value) {
    FieldDefault d;
    d._kind = Kind::Text;
    d._text = std::move(value);
    return d;
}

FieldDefault FieldDefault::list(std::vector<std::string> values) {
    FieldDefault d;
    d._kind = Kind::List;
    d._list = std::move(values);
    return d;
}

FieldDefault FieldDefault::file() {
    FieldDefault d;
    d._kind = Kind::File;
    return d;
}

Value FieldDefault::value() const {
    switch (_kind) {
        case Kind::List: return Value(std::in_place_index<1>, _list);
        case Kind::File: return Value(std::in_place_index<2>, FilePtr());
        case Kind::Text: break;
    }
    return Value(std::in_place_index<0>, _text);
}

namespace {

std::string text_of(const std::string& s, bool unicode) {
    return unicode ? internal::to_text(s) : s;
}

std::string text_of(const FilePtr& f, bool unicode) {
    (void)unicode;
    return f ? f->value() : std::string();
}

Value shape(const Value& in, const FieldDefault* def, bool unicode) {
    const bool want_list = def && def->kind() == FieldDefault::Kind::List;
    const bool want_file = def && def->kind() == FieldDefault::Kind::File;

    return std::visit([&](const auto& v) -> Value {
        using T = std::decay_t<decltype(v)>;

        if constexpr (std::is_same_v<T, std::string>) {
            std::string s = text_of(v, unicode);
            if (want_list) return Value(std::in_place_index<1>, std::vector<std::string>{std::move(s)});
            return Value(std::in_place_index<0>, std::move(s));
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (want_list) {
                std::vector<std::string> out;
                out.reserve(v.size());
                for (const auto& s : v) out.push_back(text_of(s, unicode));
                return Value(std::in_place_index<1>, std::move(out));
            }
            std::string last = v.empty() ? std::string() : v.back();
            return Value(std::in_place_index<0>, text_of(last, unicode));
        } else if constexpr (std::is_same_v<T, FilePtr>) {
            if (want_file) return Value(std::in_place_index<2>, v);
            std::string s = text_of(v, unicode);
            if (want_list) return Value(std::in_place_index<1>, std::vector<std::string>{std::move(s)});
            return Value(std::in_place_index<0>, std::move(s));
        } else {
            if (want_list) {
                std::vector<std::string> out;
                out.reserve(v.size());
                for (const auto& f : v) out.push_back(text_of(f, unicode));
                return Value(std::in_place_index<1>, std::move(out));
            }
            FilePtr last = v.empty() ? FilePtr() : v.back();
            if (want_file) return Value(std::in_place_index<2>, last);
            return Value(std::in_place_index<0>, text_of(last, unicode));
        }
    }, in);
}

} // namespace

Storage storify(const Storage& raw,
                const std::vector<std::string>& required,
                const Defaults& defaults,
                bool unicode)
{
    Storage out;

    std::vector<std::string> names = required;
    for (const auto& kv : raw) names.push_back(kv.first);

    for (const auto& name : names) {
        if (out.contains(name)) continue;
        const Value* v = raw.get(name);
        if (!v) throw MissingFieldError(name);
        out.set(name, shape(*v, defaults.get(name), unicode));
    }

    for (const auto& kv : defaults) {
        if (!out.contains(kv.first)) out.set(kv.first, kv.second.value());
    }
    return out;
}

} // namespace wa
