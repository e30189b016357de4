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

namespace wa::internal {

struct UrlParts {
    std::string scheme;
    std::string authority;
    std::string path;
    std::string query;
    std::string fragment;
    bool has_scheme    = false;
    bool has_authority = false;
    bool has_query     = false;
    bool has_fragment  = false;
};

UrlParts split_url(const std::string& url);
std::string unsplit_url(const UrlParts& u);

// RFC 3986 section 5.2.4
std::string remove_dot_segments(const std::string& path);

// Resolve `ref` against `base` (RFC 3986 section 5.2.2). An empty base
// returns ref unchanged; an empty ref returns base.
std::string urljoin(const std::string& base, const std::string& ref);

} // namespace wa::internal
