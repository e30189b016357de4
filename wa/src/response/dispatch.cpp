/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/dispatch.hpp"
#include "wa/application.hpp"
#include "wa/context.hpp"
#include "wa/log.hpp"

#include <sstream>

namespace wa {

static std::string ctx_label(const Environment& env) {
    return env.get("REQUEST_METHOD", "-") + " " + env.get("PATH_INFO", "/") + ": ";
}

static Response collect(Context& ctx, std::string body) {
    Response r;
    r.status  = ctx.status();
    r.headers = ctx.headers();
    r.body    = std::move(body);
    return r;
}

static Response server_error(const Environment& env, const AppConfig& cfg,
                             const Application* root_app, const std::string& what)
{
    Context ctx(env, cfg);
    if (root_app) ctx.mount("", root_app);

    std::string message;
    if (cfg.debug && !cfg.redact_errors) message = "internal server error: " + what;

    try {
        HttpOutcome out = internalerror(ctx, message);
        return collect(ctx, out.body());
    } catch (const std::exception& e) {
        // The application's error page failed; use the built-in 500 on clean state.
        wa::log_line(std::string("[500] ") + ctx_label(env) + "error page failed: " + e.what());
        Context fresh(env, cfg);
        HttpOutcome out = make_outcome(fresh, Status::InternalServerError, message);
        return collect(fresh, out.body());
    }
}

Response handle(const Environment& env,
                const AppConfig& cfg,
                const Handler& handler,
                const Application* root_app)
{
    try {
        Context ctx(env, cfg);
        if (root_app) ctx.mount("", root_app);

        HandlerResult res = handler(ctx);
        if (auto* out = std::get_if<HttpOutcome>(&res)) return collect(ctx, out->body());
        return collect(ctx, std::move(std::get<std::string>(res)));
    } catch (const std::exception& e) {
        wa::log_line(std::string("[500] ") + ctx_label(env) + e.what());
        return server_error(env, cfg, root_app, e.what());
    }
}

std::string to_cgi(const Response& r) {
    std::ostringstream os;
    os << "Status: " << r.status << "\r\n";
    for (const auto& h : r.headers) os << h.first << ": " << h.second << "\r\n";
    os << "\r\n" << r.body;
    return os.str();
}

} // namespace wa
