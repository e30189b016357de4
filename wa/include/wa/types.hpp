/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <variant>
#include <utility>
#include "wa/storage.hpp"
#include "wa/file_upload.hpp"

namespace wa {

// Text field: one value, or a list when 0 or 2+ values were submitted.
using FieldValue = std::variant<std::string, std::vector<std::string>>;

// Upload(s) under one field name, same collapse rule as FieldValue.
using FileValue = std::variant<FilePtr, std::vector<FilePtr>>;

// Anything a request field can hold once text fields and uploads share
// one namespace.
using Value = std::variant<std::string, std::vector<std::string>,
                           FilePtr, std::vector<FilePtr>>;

using FieldMap   = OrderedMap<FieldValue>;
using FileMap    = OrderedMap<FileValue>;
using Storage    = OrderedMap<Value>;
using CookieMap  = OrderedMap<std::string>;

// Scalar collapse: exactly one value becomes a scalar.
template <class T>
std::variant<T, std::vector<T>> collapse(std::vector<T> values) {
    using Collapsed = std::variant<T, std::vector<T>>;
    if (values.size() == 1) return Collapsed(std::in_place_index<0>, std::move(values.front()));
    return Collapsed(std::in_place_index<1>, std::move(values));
}

// Accumulates values per name in first-seen order, then collapses.
template <class T>
class MultiDict {
public:
    void add(const std::string& name, T value) {
        std::vector<T>* slot = _lists.get(name);
        if (slot) {
            slot->push_back(std::move(value));
        } else {
            std::vector<T> v;
            v.push_back(std::move(value));
            _lists.set(name, std::move(v));
        }
    }

    OrderedMap<std::variant<T, std::vector<T>>> flatten() const {
        OrderedMap<std::variant<T, std::vector<T>>> out;
        for (const auto& kv : _lists) out.set(kv.first, collapse(kv.second));
        return out;
    }

    const OrderedMap<std::vector<T>>& lists() const { return _lists; }
    bool empty() const { return _lists.empty(); }

private:
    OrderedMap<std::vector<T>> _lists;
};

Value to_value(const FieldValue& v);
Value to_value(const FileValue& v);

// Field readers: nullptr when the value is not of that shape.
const std::string* as_text(const Value* v);
const std::vector<std::string>* as_list(const Value* v);
FilePtr as_file(const Value* v);

// Text form of a value; the last one for lists, raw bytes for uploads.
std::string text_or(const Value* v, const std::string& fallback = {});

} // namespace wa
