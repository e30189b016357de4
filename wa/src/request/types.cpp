/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/types.hpp"

namespace wa {

Value to_value(const FieldValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    return std::get<std::vector<std::string>>(v);
}

Value to_value(const FileValue& v) {
    if (const auto* f = std::get_if<FilePtr>(&v)) return *f;
    return std::get<std::vector<FilePtr>>(v);
}

const std::string* as_text(const Value* v) {
    return v ? std::get_if<std::string>(v) : nullptr;
}

const std::vector<std::string>* as_list(const Value* v) {
    return v ? std::get_if<std::vector<std::string>>(v) : nullptr;
}

FilePtr as_file(const Value* v) {
    if (!v) return nullptr;
    if (const auto* f = std::get_if<FilePtr>(v)) return *f;
    return nullptr;
}

std::string text_or(const Value* v, const std::string& fallback) {
    if (!v) return fallback;
    if (const auto* s = std::get_if<std::string>(v)) return *s;
    if (const auto* l = std::get_if<std::vector<std::string>>(v)) {
        return l->empty() ? fallback : l->back();
    }
    if (const auto* f = std::get_if<FilePtr>(v)) {
        return *f ? (*f)->value() : fallback;
    }
    const auto& files = std::get<std::vector<FilePtr>>(*v);
    return (files.empty() || !files.back()) ? fallback : files.back()->value();
}

} // namespace wa
