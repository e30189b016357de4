/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/query.hpp"
#include "wa/internal/utils.hpp"

namespace wa::internal {

std::vector<std::pair<std::string, std::string>> parse_qsl(const std::string& q) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t p = 0;
    while (p <= q.size()) {
        std::size_t amp = q.find('&', p);
        if (amp == std::string::npos) amp = q.size();
        const std::string seg = q.substr(p, amp - p);
        p = amp + 1;
        if (seg.empty()) continue;

        std::size_t eq = seg.find('=');
        if (eq == std::string::npos) {
            out.emplace_back(url_unquote(seg, true), std::string());
        } else {
            out.emplace_back(url_unquote(seg.substr(0, eq), true),
                             url_unquote(seg.substr(eq + 1), true));
        }
    }
    return out;
}

FieldMap parse_qs(const std::string& q) {
    MultiDict<std::string> grouped;
    for (auto& kv : parse_qsl(q)) grouped.add(kv.first, std::move(kv.second));
    return grouped.flatten();
}

std::string OptionsHeader::option(const std::string& key, const std::string& def) const {
    auto it = options.find(key);
    return it == options.end() ? def : it->second;
}

namespace {

bool is_token_char(char c) {
    if (c <= 0x20 || c >= 0x7F) return false;
    switch (c) {
        case '(': case ')': case '<': case '>': case '@': case ',': case ';':
        case ':': case '\\': case '"': case '/': case '[': case ']': case '?':
        case '=': case '{': case '}':
            return false;
        default:
            return true;
    }
}

void skip_ws(const std::string& s, std::size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
}

// Reads a quoted-string starting at s[i] == '"'. Missing close quote is
// tolerated (rest of the header is taken).
std::string read_quoted(const std::string& s, std::size_t& i) {
    std::string v;
    ++i;
    while (i < s.size()) {
        char c = s[i];
        if (c == '"') { ++i; break; }
        if (c == '\\' && i + 1 < s.size()) { v.push_back(s[i+1]); i += 2; continue; }
        v.push_back(c);
        ++i;
    }
    return v;
}

} // namespace

OptionsHeader parse_options_header(const std::string& header) {
    OptionsHeader h;
    std::size_t semi = header.find(';');
    h.value = lower_copy(trim_copy(header.substr(0, semi)));
    if (semi == std::string::npos) return h;

    std::size_t i = semi;
    while (i < header.size()) {
        if (header[i] != ';') {
            // garbage between options: resync on the next ';'
            std::size_t next = header.find(';', i);
            if (next == std::string::npos) break;
            i = next;
        }
        ++i;
        skip_ws(header, i);
        std::size_t k0 = i;
        while (i < header.size() && is_token_char(header[i])) ++i;
        std::string key = lower_copy(header.substr(k0, i - k0));
        skip_ws(header, i);
        if (key.empty() || i >= header.size() || header[i] != '=') continue;
        ++i;
        skip_ws(header, i);

        std::string val;
        if (i < header.size() && header[i] == '"') {
            val = read_quoted(header, i);
            if (key == "filename") {
                // Old IE sends the full client path.
                std::size_t bs = val.rfind('\\');
                if (bs != std::string::npos) val = val.substr(bs + 1);
            }
        } else {
            std::size_t v0 = i;
            while (i < header.size() && header[i] != ';') ++i;
            val = trim_copy(header.substr(v0, i - v0));
        }
        h.options[key] = val;
        skip_ws(header, i);
    }
    return h;
}

} // namespace wa::internal
