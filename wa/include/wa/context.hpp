/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "wa/app_config.hpp"
#include "wa/environment.hpp"
#include "wa/http_outcome.hpp"
#include "wa/storage.hpp"
#include "wa/types.hpp"
#include "wa/validate.hpp"

namespace wa {

class Application;

struct InputOptions {
    std::string method = "both"; // get | post | both (put, patch = post)
    bool unicode = true;
};

// input()/cookies() result. On a missing required name `ok` is false and
// `outcome` holds the 400 already applied to the context.
struct Validated {
    bool ok = false;
    Storage data;
    std::optional<HttpOutcome> outcome;
    std::string missing;
};

// Per-request state. One per request, used from one thread.
class Context {
public:
    explicit Context(Environment env, AppConfig cfg = AppConfig{});

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const Environment& env() const { return _env; }
    const AppConfig& config() const { return _cfg; }

    // Outbound response state
    const std::string& status() const { return _status; }
    void set_status(std::string line) { _status = std::move(line); }
    const HeaderList& headers() const { return _headers; }
    HeaderList& headers() { return _headers; }

    // Request-derived
    const std::string& protocol() const { return _protocol; }
    const std::string& host() const { return _host; }
    const std::string& homedomain() const { return _homedomain; }
    const std::string& homepath() const { return _homepath; }
    const std::string& home() const { return _home; }
    const std::string& realhome() const { return _realhome; }
    const std::string& ip() const { return _ip; }
    const std::string& method() const { return _method; }
    const std::string& path() const { return _path; }
    const std::string& query() const { return _query; }
    const std::string& fullpath() const { return _fullpath; }

    // Request body, read from env().input once and cached.
    const std::string& data();

    // Undecoded-shape fields from the query string and/or body.
    Storage raw_input(const std::string& method = "both");

    Validated input(const std::vector<std::string>& required = {},
                    const Defaults& defaults = Defaults{},
                    const InputOptions& opt = InputOptions{});

    Validated cookies(const std::vector<std::string>& required = {},
                      const Defaults& defaults = Defaults{},
                      bool unicode = false);

    // Nested applications. mount() moves `prefix` from path into
    // home/homepath and makes `app` innermost; unmount() undoes the last mount.
    void mount(const std::string& prefix, const Application* app = nullptr);
    void unmount();

    const Application* current_app() const;
    const std::vector<const Application*>& app_stack() const { return _apps; }

private:
    Validated validate(const Storage& raw, const std::vector<std::string>& required,
                       const Defaults& defaults, bool unicode);

    struct MountFrame {
        std::string home;
        std::string homepath;
        std::string path;
        std::string fullpath;
        bool        pushed = false;
    };

    Environment _env;
    AppConfig   _cfg;

    std::string _status = "200 OK";
    HeaderList  _headers;

    std::string _protocol;
    std::string _host;
    std::string _homedomain;
    std::string _homepath;
    std::string _home;
    std::string _realhome;
    std::string _ip;
    std::string _method;
    std::string _path;
    std::string _query;
    std::string _fullpath;

    std::optional<std::string> _data;
    std::optional<Storage>     _form;
    std::optional<CookieMap>   _cookies;

    std::vector<const Application*> _apps;
    std::vector<MountFrame>         _mounts;
};

} // namespace wa
