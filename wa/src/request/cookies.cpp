/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/cookies.hpp"
#include "wa/context.hpp"
#include "wa/errors.hpp"
#include "wa/header.hpp"
#include "wa/log.hpp"
#include "wa/internal/time.hpp"
#include "wa/internal/utils.hpp"

#include <cctype>
#include <cstring>
#include <utility>
#include <vector>

namespace wa {

namespace {

// Offset used for "expire immediately": far enough in the past for any
// client clock.
constexpr std::int64_t kExpireNowOffset = -1000000000;

bool is_legal_name_char(char c) {
    if (std::isalnum((unsigned char)c) && (unsigned char)c < 0x80) return true;
    return c != 0 && std::strchr("!#$%&'*+-.^_`|~:", c) != nullptr;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_word(char c) {
    return (std::isalnum((unsigned char)c) && (unsigned char)c < 0x80) || c == '_';
}

bool is_key_char(char c) {
    return is_word(c) || (c != 0 && std::strchr("!#%&'~`><@,:/$*+-.^|)(?}{=", c) != nullptr);
}

bool is_value_char(char c) {
    return is_key_char(c) || c == '[' || c == ']';
}

bool is_reserved(const std::string& lower) {
    static const char* kReserved[] = {"expires", "path", "comment", "domain", "max-age",
                                      "secure", "httponly", "version", "samesite"};
    for (const char* r : kReserved) if (lower == r) return true;
    return false;
}

bool is_flag(const std::string& lower) {
    return lower == "secure" || lower == "httponly";
}

// "Wdy, DD-Mon-YYYY HH:MM:SS GMT" at s[i]; returns match length or 0.
std::size_t match_date(const std::string& s, std::size_t i) {
    const std::size_t n = s.size();
    if (i + 5 > n) return 0;
    for (std::size_t k = 0; k < 3; ++k) if (!is_word(s[i+k])) return 0;
    if (s[i+3] != ',' || !is_space(s[i+4])) return 0;
    for (std::size_t len = 11; len >= 9; --len) {
        std::size_t p = i + 5;
        if (p + len + 1 + 8 + 1 + 3 > n) continue;
        bool ok = true;
        for (std::size_t k = 0; k < len && ok; ++k) {
            char c = s[p+k];
            ok = is_word(c) || is_space(c) || c == '-';
        }
        if (!ok) continue;
        p += len;
        if (!is_space(s[p])) continue;
        ++p;
        for (std::size_t k = 0; k < 8 && ok; ++k) {
            char c = s[p+k];
            ok = (c >= '0' && c <= '9') || c == ':';
        }
        if (!ok) continue;
        p += 8;
        if (!is_space(s[p]) || s.compare(p + 1, 3, "GMT") != 0) continue;
        return p + 4 - i;
    }
    return 0;
}

// Strips surrounding quotes and resolves \ooo and \x escapes.
std::string unquote_cookie_value(const std::string& v) {
    if (v.size() < 2 || v.front() != '"' || v.back() != '"') return v;
    const std::string s = v.substr(1, v.size() - 2);
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) { out.push_back(s[i]); continue; }
        if (i + 3 < s.size() && s[i+1] >= '0' && s[i+1] <= '3' &&
            s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
            out.push_back((char)(((s[i+1]-'0') << 6) | ((s[i+2]-'0') << 3) | (s[i+3]-'0')));
            i += 3;
        } else {
            out.push_back(s[i+1]);
            i += 1;
        }
    }
    return out;
}

// RFC 2109/6265 style grammar with quoted strings. Attributes ($Path,
// Path=..., Secure) are recognised and dropped. Returns false, leaving
// `out` untouched, when the string does not follow the grammar.
bool parse_cookie_strict(const std::string& s, CookieMap& out) {
    std::vector<std::pair<std::string, std::string>> items;
    const std::size_t n = s.size();
    bool morsel_seen = false;
    std::size_t i = 0;

    while (true) {
        while (i < n && is_space(s[i])) ++i;
        if (i >= n) break;

        const std::size_t k0 = i;
        while (i < n && s[i] != '=' && is_key_char(s[i])) ++i;
        if (i == k0) return false;
        const std::string key = s.substr(k0, i - k0);

        bool has_value = false;
        std::string raw;
        std::size_t j = i;
        while (j < n && is_space(s[j])) ++j;
        if (j < n && s[j] == '=') {
            ++j;
            while (j < n && is_space(s[j])) ++j;
            if (j < n && s[j] == '"') {
                std::size_t k = j + 1;
                while (k < n && s[k] != '"') k += (s[k] == '\\') ? 2 : 1;
                if (k >= n) return false;
                raw = s.substr(j, k + 1 - j);
                j = k + 1;
            } else if (std::size_t dl = match_date(s, j)) {
                raw = s.substr(j, dl);
                j += dl;
            } else {
                const std::size_t v0 = j;
                while (j < n && is_value_char(s[j])) ++j;
                raw = s.substr(v0, j - v0);
            }
            has_value = true;
            i = j;
        }

        const std::size_t before_ws = i;
        while (i < n && is_space(s[i])) ++i;
        if (i < n && s[i] == ';') ++i;
        else if (i < n && i == before_ws) return false;

        if (key[0] == '$') continue;
        const std::string lower = internal::lower_copy(key);
        if (is_reserved(lower)) {
            if (!morsel_seen) return false;
            if (!has_value && !is_flag(lower)) return false;
            continue;
        }
        if (!has_value) return false;
        for (char c : key) if (!is_legal_name_char(c)) return false;

        items.emplace_back(key, internal::url_unquote(unquote_cookie_value(raw), false));
        morsel_seen = true;
    }

    for (auto& kv : items) out.set(kv.first, std::move(kv.second));
    return true;
}

CookieMap parse_cookies_quoted(const std::string& http_cookie) {
    CookieMap cookies;
    if (parse_cookie_strict(http_cookie, cookies)) return cookies;

    std::size_t total = 0, kept = 0;
    std::size_t p = 0;
    while (p <= http_cookie.size()) {
        std::size_t semi = http_cookie.find(';', p);
        if (semi == std::string::npos) semi = http_cookie.size();
        ++total;
        if (parse_cookie_strict(http_cookie.substr(p, semi - p), cookies)) ++kept;
        p = semi + 1;
    }
    wa::log_line("[COOKIE] malformed Cookie header: kept " + std::to_string(kept) +
                 " of " + std::to_string(total) + " segments");
    return cookies;
}

CookieMap parse_cookies_fast(const std::string& http_cookie) {
    CookieMap cookies;
    std::size_t p = 0;
    while (p <= http_cookie.size()) {
        std::size_t semi = http_cookie.find(';', p);
        if (semi == std::string::npos) semi = http_cookie.size();
        const std::string seg = http_cookie.substr(p, semi - p);
        p = semi + 1;

        std::size_t eq = seg.find('=');
        if (eq == std::string::npos) continue;
        cookies.set(internal::trim_copy(seg.substr(0, eq)),
                    internal::url_unquote(internal::trim_copy(seg.substr(eq + 1)), false));
    }
    return cookies;
}

std::string normalize_samesite(const std::string& v) {
    const std::string l = internal::lower_copy(v);
    if (l == "strict") return "Strict";
    if (l == "lax")    return "Lax";
    if (l == "none")   return "None";
    return {};
}

} // namespace

std::string encode_cookie(const std::string& name,
                          const std::string& value,
                          const CookieOptions& opt,
                          const std::string& default_path,
                          std::time_t now)
{
    if (name.empty()) throw InvalidHeaderError("empty cookie name");
    for (char c : name) {
        if (!is_legal_name_char(c)) throw InvalidHeaderError("illegal cookie name: " + name);
    }

    std::string out = name + "=" + internal::url_quote(value, "/");

    if (opt.expires_in) {
        std::int64_t offset = *opt.expires_in;
        if (offset < 0) offset = kExpireNowOffset;
        out += "; expires=" + internal::http_date(now + static_cast<std::time_t>(offset));
    } else if (!opt.expires.empty()) {
        out += "; expires=" + opt.expires;
    }

    out += "; Path=" + (opt.path.empty() ? default_path : opt.path);
    if (!opt.domain.empty()) out += "; Domain=" + opt.domain;
    if (opt.secure)   out += "; Secure";
    if (opt.httponly) out += "; HttpOnly";

    const std::string samesite = normalize_samesite(opt.samesite);
    if (!samesite.empty()) out += "; SameSite=" + samesite;
    return out;
}

void setcookie(Context& ctx,
               const std::string& name,
               const std::string& value,
               const CookieOptions& opt)
{
    header(ctx, "Set-Cookie", encode_cookie(name, value, opt, ctx.homepath() + "/"));
}

CookieMap parse_cookies(const std::string& http_cookie) {
    if (http_cookie.find('"') != std::string::npos) {
        return parse_cookies_quoted(http_cookie);
    }
    return parse_cookies_fast(http_cookie);
}

} // namespace wa
