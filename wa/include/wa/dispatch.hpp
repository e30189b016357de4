/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <string>
#include <variant>

#include "wa/app_config.hpp"
#include "wa/environment.hpp"
#include "wa/http_outcome.hpp"
#include "wa/storage.hpp"

namespace wa {

class Application;
class Context;

// A handler returns a body, or an outcome whose body is used.
using HandlerResult = std::variant<std::string, HttpOutcome>;
using Handler = std::function<HandlerResult(Context&)>;

struct Response {
    std::string status = "200 OK";
    HeaderList  headers;
    std::string body;
};

/**
 * Run one handler against a fresh Context built from env.
 *
 * Status and headers are taken from the Context after the handler returns.
 * An exception escaping the handler becomes a 500 built on a new Context
 * (root_app's internal error page when given); the exception text is only
 * exposed with cfg.debug and without cfg.redact_errors.
 */
Response handle(const Environment& env,
                const AppConfig& cfg,
                const Handler& handler,
                const Application* root_app = nullptr);

// "Status: 200 OK\r\n" + headers + "\r\n" + body
std::string to_cgi(const Response& r);

} // namespace wa
