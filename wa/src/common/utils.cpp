/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <limits>
#include <openssl/rand.h>

namespace wa::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string trim_copy(std::string s) {
    trim_inplace(s);
    return s;
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) return {};
    return bytes_to_hex((const unsigned char*)b.data(), b.size());
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool iequals(const std::string& a, const std::string& b){
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

bool istarts_with(const std::string& s, const std::string& prefix){
    if (s.size() < prefix.size()) return false;
    return iequals(s.substr(0, prefix.size()), prefix);
}

std::string url_unquote(const std::string& s, bool plus_as_space){
    std::string o; o.reserve(s.size());
    for(std::size_t i=0;i<s.size();++i){
        if(s[i]=='%' && i+2<s.size()){
            int hi=hexval(s[i+1]), lo=hexval(s[i+2]);
            if(hi>=0 && lo>=0){ o.push_back((char)((hi<<4)|lo)); i+=2; continue; }
        }
        if(plus_as_space && s[i]=='+'){ o.push_back(' '); continue; }
        o.push_back(s[i]);
    }
    return o;
}

std::string url_quote(const std::string& s, const char* safe){
    static const char* H="0123456789ABCDEF";
    auto keep = [safe](unsigned char c){
        if (std::isalnum(c) && c < 0x80) return true;
        if (c=='-' || c=='.' || c=='_' || c=='~') return true;
        return safe && c != 0 && std::strchr(safe, c) != nullptr;
    };
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if(keep(c)) { out.push_back((char)c); continue; }
        out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
    }
    return out;
}

std::string to_text(const std::string& raw){
    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out; out.reserve(raw.size());
    const std::size_t n = raw.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = (unsigned char)raw[i];
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80)                { out.push_back((char)c); ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else { out += kReplacement; ++i; continue; }

        std::size_t k = 1;
        for (; k < len && i + k < n; ++k) {
            unsigned char cc = (unsigned char)raw[i+k];
            if ((cc & 0xC0) != 0x80) break;
            cp = (cp << 6) | (cc & 0x3F);
        }
        const bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                              (len == 4 && cp < 0x10000);
        const bool invalid  = cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF);
        if (k != len || overlong || invalid) {
            out += kReplacement;
            i += (k == len) ? len : std::max<std::size_t>(k, 1);
            continue;
        }
        out.append(raw, i, len);
        i += len;
    }
    return out;
}

namespace {
struct IconvHandle {
    iconv_t cd;
    explicit IconvHandle(iconv_t h) : cd(h) {}
    ~IconvHandle() { if (cd != (iconv_t)-1) iconv_close(cd); }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;
};
} // namespace

std::string to_utf8(const std::string& raw, const std::string& charset){
    const std::string cs = lower_copy(trim_copy(charset));
    if (cs.empty() || cs == "utf-8" || cs == "utf8" || raw.empty()) return raw;

    IconvHandle h(iconv_open("UTF-8", cs.c_str()));
    if (h.cd == (iconv_t)-1) return raw;

    static const char kReplacement[] = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(raw.size() + raw.size() / 2);
    char buf[4096];
    char* in = const_cast<char*>(raw.data());
    std::size_t in_left = raw.size();
    while (in_left > 0) {
        char* dst = buf;
        std::size_t dst_left = sizeof(buf);
        std::size_t rc = iconv(h.cd, &in, &in_left, &dst, &dst_left);
        out.append(buf, sizeof(buf) - dst_left);
        if (rc != (std::size_t)-1) continue;
        if (errno == E2BIG) continue;
        // EILSEQ / EINVAL: replace one byte and restart the shift state.
        out += kReplacement;
        ++in; --in_left;
        iconv(h.cd, nullptr, nullptr, nullptr, nullptr);
    }
    char* dst = buf;
    std::size_t dst_left = sizeof(buf);
    iconv(h.cd, nullptr, nullptr, &dst, &dst_left);
    out.append(buf, sizeof(buf) - dst_left);
    return out;
}

bool is_write_method(const std::string& method){
    const std::string m = upper_copy(method);
    return m == "POST" || m == "PUT" || m == "PATCH";
}

bool parse_size(const std::string& s, std::size_t& out){
    std::string t = trim_copy(s);
    if (t.empty()) return false;
    std::size_t v = 0;
    for (char c : t) {
        if (c < '0' || c > '9') return false;
        std::size_t d = (std::size_t)(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace wa::internal
