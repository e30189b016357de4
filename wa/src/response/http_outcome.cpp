/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/http_outcome.hpp"
#include "wa/application.hpp"
#include "wa/context.hpp"
#include "wa/header.hpp"
#include "wa/internal/url.hpp"
#include "wa/internal/utils.hpp"

#include <stdexcept>

namespace wa {

namespace {

constexpr const char* kHtml     = "text/html";
constexpr const char* kHtmlUtf8 = "text/html; charset=utf-8";

const StatusInfo kStatusTable[] = {
    {Status::Ok,                         "OK",                            "",                              nullptr,   OutcomeKind::Success,     false},
    {Status::Created,                    "Created",                       "Created",                       nullptr,   OutcomeKind::Success,     false},
    {Status::Accepted,                   "Accepted",                      "Accepted",                      nullptr,   OutcomeKind::Success,     false},
    {Status::NoContent,                  "No Content",                    "No Content",                    nullptr,   OutcomeKind::Success,     false},
    {Status::MovedPermanently,           "Moved Permanently",             "",                              kHtml,     OutcomeKind::Redirect,    false},
    {Status::Found,                      "Found",                         "",                              kHtml,     OutcomeKind::Redirect,    false},
    {Status::SeeOther,                   "See Other",                     "",                              kHtml,     OutcomeKind::Redirect,    false},
    {Status::NotModified,                "Not Modified",                  "",                              nullptr,   OutcomeKind::Redirect,    false},
    {Status::TemporaryRedirect,          "Temporary Redirect",            "",                              kHtml,     OutcomeKind::Redirect,    false},
    {Status::BadRequest,                 "Bad Request",                   "bad request",                   kHtml,     OutcomeKind::ClientError, false},
    {Status::Unauthorized,               "Unauthorized",                  "unauthorized",                  kHtml,     OutcomeKind::ClientError, false},
    {Status::Forbidden,                  "Forbidden",                     "forbidden",                     kHtml,     OutcomeKind::ClientError, false},
    {Status::NotFound,                   "Not Found",                     "not found",                     kHtmlUtf8, OutcomeKind::ClientError, true},
    {Status::MethodNotAllowed,           "Method Not Allowed",            "method not allowed",            kHtml,     OutcomeKind::ClientError, false},
    {Status::NotAcceptable,              "Not Acceptable",                "not acceptable",                kHtml,     OutcomeKind::ClientError, false},
    {Status::Conflict,                   "Conflict",                      "conflict",                      kHtml,     OutcomeKind::ClientError, false},
    {Status::Gone,                       "Gone",                          "gone",                          kHtml,     OutcomeKind::ClientError, false},
    {Status::PreconditionFailed,         "Precondition Failed",           "precondition failed",           kHtml,     OutcomeKind::ClientError, false},
    {Status::UnsupportedMediaType,       "Unsupported Media Type",        "unsupported media type",        kHtml,     OutcomeKind::ClientError, false},
    {Status::UnavailableForLegalReasons, "Unavailable For Legal Reasons", "unavailable for legal reasons", kHtml,     OutcomeKind::ClientError, true},
    {Status::InternalServerError,        "Internal Server Error",         "internal server error",         kHtml,     OutcomeKind::ServerError, true},
};

const char* const kAllMethods[] = {"GET", "HEAD", "POST", "PUT", "DELETE"};

HttpOutcome redirect_to(Context& ctx, const std::string& url, Status code, bool absolute) {
    std::string loc = internal::urljoin(ctx.path(), url);
    if (!loc.empty() && loc[0] == '/')
        loc = (absolute ? ctx.realhome() : ctx.home()) + loc;

    HeaderList h;
    h.emplace_back("Content-Type", status_info(code).content_type);
    h.emplace_back("Location", loc);
    return HttpOutcome::emit(ctx, code, std::move(h), std::string());
}

HttpOutcome method_not_allowed(Context& ctx, const std::string& allow) {
    const StatusInfo& info = status_info(Status::MethodNotAllowed);
    HeaderList h;
    h.emplace_back("Content-Type", info.content_type);
    h.emplace_back("Allow", allow);
    return HttpOutcome::emit(ctx, Status::MethodNotAllowed, std::move(h), info.default_body);
}

} // namespace

const StatusInfo& status_info(Status code) {
    for (const auto& row : kStatusTable) {
        if (row.code == code) return row;
    }
    throw std::invalid_argument("unknown status " + std::to_string(static_cast<int>(code)));
}

std::string status_line(Status code) {
    return std::to_string(static_cast<int>(code)) + " " + status_info(code).reason;
}

const char* kind_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:     return "success";
        case OutcomeKind::Redirect:    return "redirect";
        case OutcomeKind::ClientError: return "client-error";
        case OutcomeKind::ServerError: return "server-error";
    }
    return "unknown";
}

HttpOutcome::HttpOutcome(Status code, HeaderList headers, std::string body)
    : _code(code),
      _kind(status_info(code).kind),
      _status(status_line(code)),
      _headers(std::move(headers)),
      _body(std::move(body)) {}

HttpOutcome HttpOutcome::emit(Context& ctx, Status code, HeaderList headers, std::string body) {
    HttpOutcome out(code, std::move(headers), std::move(body));
    ctx.set_status(out._status);
    for (const auto& h : out._headers) header(ctx, h.first, h.second);
    return out;
}

HttpOutcome make_outcome(Context& ctx, Status code, const std::string& message) {
    const StatusInfo& info = status_info(code);
    if (info.kind == OutcomeKind::Redirect && code != Status::NotModified)
        throw std::invalid_argument(status_line(code) + " needs a target url");

    HeaderList h;
    if (info.content_type) h.emplace_back("Content-Type", info.content_type);
    std::string body = message.empty() ? std::string(info.default_body) : message;
    if (code == Status::NotModified) body.clear();
    return HttpOutcome::emit(ctx, code, std::move(h), std::move(body));
}

HttpOutcome ok(Context& ctx, const std::string& body)        { return make_outcome(ctx, Status::Ok, body); }
HttpOutcome created(Context& ctx, const std::string& body)   { return make_outcome(ctx, Status::Created, body); }
HttpOutcome accepted(Context& ctx, const std::string& body)  { return make_outcome(ctx, Status::Accepted, body); }
HttpOutcome nocontent(Context& ctx, const std::string& body) { return make_outcome(ctx, Status::NoContent, body); }

HttpOutcome redirect(Context& ctx, const std::string& url, Status code, bool absolute) {
    const StatusInfo& info = status_info(code);
    if (info.kind != OutcomeKind::Redirect || code == Status::NotModified)
        throw std::invalid_argument(status_line(code) + " is not a redirect status");
    return redirect_to(ctx, url, code, absolute);
}

HttpOutcome found(Context& ctx, const std::string& url, bool absolute) {
    return redirect_to(ctx, url, Status::Found, absolute);
}

HttpOutcome seeother(Context& ctx, const std::string& url, bool absolute) {
    return redirect_to(ctx, url, Status::SeeOther, absolute);
}

HttpOutcome tempredirect(Context& ctx, const std::string& url, bool absolute) {
    return redirect_to(ctx, url, Status::TemporaryRedirect, absolute);
}

HttpOutcome notmodified(Context& ctx) { return make_outcome(ctx, Status::NotModified); }

HttpOutcome badrequest(Context& ctx, const std::string& m)           { return make_outcome(ctx, Status::BadRequest, m); }
HttpOutcome unauthorized(Context& ctx, const std::string& m)         { return make_outcome(ctx, Status::Unauthorized, m); }
HttpOutcome forbidden(Context& ctx, const std::string& m)            { return make_outcome(ctx, Status::Forbidden, m); }
HttpOutcome notacceptable(Context& ctx, const std::string& m)        { return make_outcome(ctx, Status::NotAcceptable, m); }
HttpOutcome conflict(Context& ctx, const std::string& m)             { return make_outcome(ctx, Status::Conflict, m); }
HttpOutcome gone(Context& ctx, const std::string& m)                 { return make_outcome(ctx, Status::Gone, m); }
HttpOutcome preconditionfailed(Context& ctx, const std::string& m)   { return make_outcome(ctx, Status::PreconditionFailed, m); }
HttpOutcome unsupportedmediatype(Context& ctx, const std::string& m) { return make_outcome(ctx, Status::UnsupportedMediaType, m); }

HttpOutcome notfound(Context& ctx, const std::string& message) {
    if (message.empty()) {
        if (const Application* app = ctx.current_app()) return app->notfound(ctx);
    }
    return make_outcome(ctx, Status::NotFound, message);
}

HttpOutcome unavailableforlegalreasons(Context& ctx, const std::string& message) {
    if (message.empty()) {
        if (const Application* app = ctx.current_app()) return app->unavailableforlegalreasons(ctx);
    }
    return make_outcome(ctx, Status::UnavailableForLegalReasons, message);
}

HttpOutcome internalerror(Context& ctx, const std::string& message) {
    if (message.empty()) {
        if (const Application* app = ctx.current_app()) return app->internalerror(ctx);
    }
    return make_outcome(ctx, Status::InternalServerError, message);
}

HttpOutcome nomethod(Context& ctx) {
    std::string allow;
    for (const char* m : kAllMethods) {
        if (!allow.empty()) allow += ", ";
        allow += m;
    }
    return method_not_allowed(ctx, allow);
}

HttpOutcome nomethod(Context& ctx, const std::vector<std::string>& exposed) {
    std::string allow;
    for (const char* m : kAllMethods) {
        for (const auto& e : exposed) {
            if (internal::iequals(e, m)) {
                if (!allow.empty()) allow += ", ";
                allow += m;
                break;
            }
        }
    }
    return method_not_allowed(ctx, allow);
}

// Application defaults: the built-in pages.

HttpOutcome Application::notfound(Context& ctx) const {
    return make_outcome(ctx, Status::NotFound);
}

HttpOutcome Application::unavailableforlegalreasons(Context& ctx) const {
    return make_outcome(ctx, Status::UnavailableForLegalReasons);
}

HttpOutcome Application::internalerror(Context& ctx) const {
    return make_outcome(ctx, Status::InternalServerError);
}

} // namespace wa
