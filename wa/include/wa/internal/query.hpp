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
#include <utility>
#include <unordered_map>
#include "wa/types.hpp"

namespace wa::internal {

// Parse "a=1&b=&c" into ordered pairs. Keys and values are percent-decoded
// with '+' as space; blank values (and bare keys) are kept.
std::vector<std::pair<std::string, std::string>> parse_qsl(const std::string& q);

// parse_qsl grouped by key, then scalar-collapsed.
FieldMap parse_qs(const std::string& q);

// "multipart/form-data; boundary=xyz" -> {"multipart/form-data", {boundary: xyz}}
// The value is lower-cased; option names are lower-cased; quoted option
// values are unescaped.
struct OptionsHeader {
    std::string value;
    std::unordered_map<std::string, std::string> options;

    std::string option(const std::string& key, const std::string& def = {}) const;
};
OptionsHeader parse_options_header(const std::string& header);

} // namespace wa::internal
