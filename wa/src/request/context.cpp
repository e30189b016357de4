/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/context.hpp"
#include "wa/application.hpp"
#include "wa/cookies.hpp"
#include "wa/errors.hpp"
#include "wa/form.hpp"
#include "wa/log.hpp"
#include "wa/internal/query.hpp"
#include "wa/internal/utils.hpp"

#include <sstream>
#include <stdexcept>

namespace wa {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

Storage to_storage(const FieldMap& fields) {
    Storage out;
    for (const auto& kv : fields) out.set(kv.first, to_value(kv.second));
    return out;
}

Storage to_storage(const CookieMap& cookies) {
    Storage out;
    for (const auto& kv : cookies) out.set(kv.first, Value(std::in_place_index<0>, kv.second));
    return out;
}

std::string read_all(std::istream& in) {
    std::string out;
    char buf[kReadChunk];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        out.append(buf, static_cast<std::size_t>(in.gcount()));
    }
    return out;
}

// Grows with what actually arrives, not with what Content-Length claims.
std::string read_exact(std::istream& in, std::size_t n) {
    std::string out;
    char buf[kReadChunk];
    while (n > 0) {
        std::size_t want = n < sizeof(buf) ? n : sizeof(buf);
        in.read(buf, static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;
        out.append(buf, got);
        n -= got;
    }
    return out;
}

} // namespace

Context::Context(Environment env, AppConfig cfg)
    : _env(std::move(env)), _cfg(std::move(cfg))
{
    const std::string scheme = _env.get("URL_SCHEME");
    if (scheme == "http" || scheme == "https") {
        _protocol = scheme;
    } else {
        const std::string https = internal::lower_copy(_env.get("HTTPS"));
        _protocol = (https == "on" || https == "true" || https == "1") ? "https" : "http";
    }

    _host       = _env.get("HTTP_HOST", "[unknown]");
    _homedomain = _protocol + "://" + _host;
    _homepath   = _env.get("SCRIPT_NAME");
    _home       = _homedomain + _homepath;
    _realhome   = _home;
    _ip         = _env.get("REMOTE_ADDR");
    _method     = _env.get("REQUEST_METHOD");
    _path       = _env.get("PATH_INFO");

    const std::string qs = _env.get("QUERY_STRING");
    _query    = qs.empty() ? std::string() : "?" + qs;
    _fullpath = _path + _query;
}

const std::string& Context::data() {
    if (!_data) {
        std::string body;
        if (_env.input) {
            if (_env.get("HTTP_TRANSFER_ENCODING") == "chunked") {
                body = read_all(*_env.input);
            } else {
                std::size_t cl = 0;
                if (!internal::parse_size(_env.get("CONTENT_LENGTH"), cl)) cl = 0;
                body = read_exact(*_env.input, cl);
            }
        }
        _data = std::move(body);
    }
    return *_data;
}

Storage Context::raw_input(const std::string& method) {
    const std::string m = internal::lower_copy(method.empty() ? std::string("both") : method);
    if (m != "both" && m != "get" && m != "post" && m != "put" && m != "patch") {
        throw std::invalid_argument("raw_input: unknown method selector '" + method + "'");
    }

    Storage post;
    if (m != "get" && internal::is_write_method(_env.get("REQUEST_METHOD"))) {
        const std::string ct = _env.get("CONTENT_TYPE");
        if (internal::istarts_with(ct, "multipart/")) {
            if (!_form) {
                const std::string& body = data();
                std::istringstream in(body);
                try {
                    FormData fd = decode_form(_env.get("REQUEST_METHOD"), ct,
                                              static_cast<long long>(body.size()), &in,
                                              true, _cfg.form);
                    _form = merge_form(fd);
                } catch (const DecodeError& e) {
                    wa::log_line(std::string("[FORM] multipart body dropped: ") + e.what());
                    _form = Storage{};
                }
            }
            post = *_form;
        } else {
            post = to_storage(internal::parse_qs(data()));
        }
    }

    Storage out;
    if (m == "both" || m == "get") {
        out = to_storage(internal::parse_qs(_env.get("QUERY_STRING")));
    }
    for (const auto& kv : post) out.set(kv.first, kv.second);
    return out;
}

Validated Context::validate(const Storage& raw, const std::vector<std::string>& required,
                            const Defaults& defaults, bool unicode)
{
    Validated v;
    try {
        v.data = storify(raw, required, defaults, unicode);
        v.ok = true;
    } catch (const MissingFieldError& e) {
        v.missing = e.field();
        v.outcome = badrequest(*this);
    }
    return v;
}

Validated Context::input(const std::vector<std::string>& required,
                         const Defaults& defaults,
                         const InputOptions& opt)
{
    return validate(raw_input(opt.method), required, defaults, opt.unicode);
}

Validated Context::cookies(const std::vector<std::string>& required,
                           const Defaults& defaults,
                           bool unicode)
{
    if (!_cookies) _cookies = parse_cookies(_env.get("HTTP_COOKIE"));
    return validate(to_storage(*_cookies), required, defaults, unicode);
}

void Context::mount(const std::string& prefix, const Application* app) {
    MountFrame f;
    f.home     = _home;
    f.homepath = _homepath;
    f.path     = _path;
    f.fullpath = _fullpath;
    f.pushed   = app != nullptr;
    _mounts.push_back(std::move(f));

    _home     += prefix;
    _homepath += prefix;
    if (_path.compare(0, prefix.size(), prefix) == 0) _path.erase(0, prefix.size());
    _fullpath = _path + _query;
    if (app) _apps.push_back(app);
}

void Context::unmount() {
    if (_mounts.empty()) throw std::logic_error("unmount without mount");
    MountFrame f = std::move(_mounts.back());
    _mounts.pop_back();

    _home     = std::move(f.home);
    _homepath = std::move(f.homepath);
    _path     = std::move(f.path);
    _fullpath = std::move(f.fullpath);
    if (f.pushed) _apps.pop_back();
}

const Application* Context::current_app() const {
    return _apps.empty() ? nullptr : _apps.back();
}

} // namespace wa
