/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/url.hpp"
#include <cctype>

namespace wa::internal {

static bool is_scheme_char(char c) {
    return std::isalnum((unsigned char)c) || c == '+' || c == '-' || c == '.';
}

UrlParts split_url(const std::string& url) {
    UrlParts u;
    std::size_t pos = 0;

    // scheme ":"
    if (!url.empty() && std::isalpha((unsigned char)url[0])) {
        std::size_t i = 1;
        while (i < url.size() && is_scheme_char(url[i])) ++i;
        if (i < url.size() && url[i] == ':') {
            u.scheme = url.substr(0, i);
            u.has_scheme = true;
            pos = i + 1;
        }
    }

    // "//" authority
    if (url.compare(pos, 2, "//") == 0) {
        std::size_t end = url.find_first_of("/?#", pos + 2);
        if (end == std::string::npos) end = url.size();
        u.authority = url.substr(pos + 2, end - pos - 2);
        u.has_authority = true;
        pos = end;
    }

    std::size_t end = url.find_first_of("?#", pos);
    if (end == std::string::npos) end = url.size();
    u.path = url.substr(pos, end - pos);
    pos = end;

    if (pos < url.size() && url[pos] == '?') {
        end = url.find('#', pos);
        if (end == std::string::npos) end = url.size();
        u.query = url.substr(pos + 1, end - pos - 1);
        u.has_query = true;
        pos = end;
    }
    if (pos < url.size() && url[pos] == '#') {
        u.fragment = url.substr(pos + 1);
        u.has_fragment = true;
    }
    return u;
}

std::string unsplit_url(const UrlParts& u) {
    std::string out;
    if (u.has_scheme) out += u.scheme + ":";
    if (u.has_authority) out += "//" + u.authority;
    out += u.path;
    if (u.has_query) out += "?" + u.query;
    if (u.has_fragment) out += "#" + u.fragment;
    return out;
}

static void drop_last_segment(std::string& out) {
    std::size_t slash = out.rfind('/');
    if (slash == std::string::npos) out.clear();
    else out.erase(slash);
}

std::string remove_dot_segments(const std::string& path) {
    std::string in = path;
    std::string out;
    while (!in.empty()) {
        if (in.compare(0, 3, "../") == 0) {
            in.erase(0, 3);
        } else if (in.compare(0, 2, "./") == 0) {
            in.erase(0, 2);
        } else if (in.compare(0, 3, "/./") == 0) {
            in.erase(0, 2);
        } else if (in == "/.") {
            in = "/";
        } else if (in.compare(0, 4, "/../") == 0) {
            in.erase(0, 3);
            drop_last_segment(out);
        } else if (in == "/..") {
            in = "/";
            drop_last_segment(out);
        } else if (in == "." || in == "..") {
            in.clear();
        } else {
            std::size_t next = in.find('/', in[0] == '/' ? 1 : 0);
            if (next == std::string::npos) next = in.size();
            out += in.substr(0, next);
            in.erase(0, next);
        }
    }
    return out;
}

static std::string merge_paths(const UrlParts& base, const std::string& rel) {
    if (base.has_authority && base.path.empty()) return "/" + rel;
    std::size_t slash = base.path.rfind('/');
    if (slash == std::string::npos) return rel;
    return base.path.substr(0, slash + 1) + rel;
}

std::string urljoin(const std::string& base, const std::string& ref) {
    if (base.empty()) return ref;
    if (ref.empty()) return base;

    UrlParts r = split_url(ref);
    if (r.has_scheme) return ref;

    UrlParts b = split_url(base);
    UrlParts t;
    t.scheme = b.scheme;
    t.has_scheme = b.has_scheme;

    if (r.has_authority) {
        t.authority = r.authority;
        t.has_authority = true;
        t.path = remove_dot_segments(r.path);
        t.query = r.query;
        t.has_query = r.has_query;
    } else {
        t.authority = b.authority;
        t.has_authority = b.has_authority;
        if (r.path.empty()) {
            t.path = b.path;
            if (r.has_query) {
                t.query = r.query;
                t.has_query = true;
            } else {
                t.query = b.query;
                t.has_query = b.has_query;
            }
        } else {
            if (r.path[0] == '/') t.path = remove_dot_segments(r.path);
            else t.path = remove_dot_segments(merge_paths(b, r.path));
            t.query = r.query;
            t.has_query = r.has_query;
        }
    }
    t.fragment = r.fragment;
    t.has_fragment = r.has_fragment;
    return unsplit_url(t);
}

} // namespace wa::internal
