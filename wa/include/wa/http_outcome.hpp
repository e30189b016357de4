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
#include <vector>
#include "wa/storage.hpp"

namespace wa {

class Context;

enum class Status : int {
    Ok                         = 200,
    Created                    = 201,
    Accepted                   = 202,
    NoContent                  = 204,
    MovedPermanently           = 301,
    Found                      = 302,
    SeeOther                   = 303,
    NotModified                = 304,
    TemporaryRedirect          = 307,
    BadRequest                 = 400,
    Unauthorized               = 401,
    Forbidden                  = 403,
    NotFound                   = 404,
    MethodNotAllowed           = 405,
    NotAcceptable              = 406,
    Conflict                   = 409,
    Gone                       = 410,
    PreconditionFailed         = 412,
    UnsupportedMediaType       = 415,
    UnavailableForLegalReasons = 451,
    InternalServerError        = 500,
};

enum class OutcomeKind { Success, Redirect, ClientError, ServerError };

struct StatusInfo {
    Status      code;
    const char* reason;
    const char* default_body;
    const char* content_type;  // nullptr: no Content-Type header
    OutcomeKind kind;
    bool        delegates;     // custom page from the innermost application
};

// Table row for `code`. Every enumerator has one.
const StatusInfo& status_info(Status code);

// "404 Not Found"
std::string status_line(Status code);

const char* kind_name(OutcomeKind kind);

// Terminal result of a handler. Built only through the constructors below,
// which also set ctx.status and queue the headers on the context.
class HttpOutcome {
public:
    Status code() const { return _code; }
    int code_number() const { return static_cast<int>(_code); }
    OutcomeKind kind() const { return _kind; }
    const std::string& status() const { return _status; }
    const HeaderList& headers() const { return _headers; }
    const std::string& body() const { return _body; }

    // Apply status and headers to ctx (through the header guard).
    static HttpOutcome emit(Context& ctx, Status code, HeaderList headers,
                            std::string body);

private:
    HttpOutcome(Status code, HeaderList headers, std::string body);

    Status      _code;
    OutcomeKind _kind;
    std::string _status;
    HeaderList  _headers;
    std::string _body;
};

// Built-in outcome for a success or error status; an empty message takes
// the table body. Never delegates. Redirect statuses other than 304 need a
// target and throw std::invalid_argument here.
HttpOutcome make_outcome(Context& ctx, Status code, const std::string& message = {});

// 2xx
HttpOutcome ok(Context& ctx, const std::string& body = {});
HttpOutcome created(Context& ctx, const std::string& body = {});
HttpOutcome accepted(Context& ctx, const std::string& body = {});
HttpOutcome nocontent(Context& ctx, const std::string& body = {});

// 3xx. Location is url resolved against ctx.path(); a site-relative result
// is prefixed with ctx.home() (ctx.realhome() when absolute).
HttpOutcome redirect(Context& ctx, const std::string& url,
                     Status code = Status::MovedPermanently, bool absolute = false);
HttpOutcome found(Context& ctx, const std::string& url, bool absolute = false);
HttpOutcome seeother(Context& ctx, const std::string& url, bool absolute = false);
HttpOutcome tempredirect(Context& ctx, const std::string& url, bool absolute = false);
HttpOutcome notmodified(Context& ctx);

// 4xx / 5xx
HttpOutcome badrequest(Context& ctx, const std::string& message = {});
HttpOutcome unauthorized(Context& ctx, const std::string& message = {});
HttpOutcome forbidden(Context& ctx, const std::string& message = {});
HttpOutcome notacceptable(Context& ctx, const std::string& message = {});
HttpOutcome conflict(Context& ctx, const std::string& message = {});
HttpOutcome gone(Context& ctx, const std::string& message = {});
HttpOutcome preconditionfailed(Context& ctx, const std::string& message = {});
HttpOutcome unsupportedmediatype(Context& ctx, const std::string& message = {});

// With an empty message these ask the innermost mounted application for
// its page; an empty stack gives the built-in one.
HttpOutcome notfound(Context& ctx, const std::string& message = {});
HttpOutcome unavailableforlegalreasons(Context& ctx, const std::string& message = {});
HttpOutcome internalerror(Context& ctx, const std::string& message = {});

// 405 with Allow listing every method in GET, HEAD, POST, PUT, DELETE.
HttpOutcome nomethod(Context& ctx);
// 405 with Allow restricted to the methods the target handler exposes,
// kept in GET, HEAD, POST, PUT, DELETE order.
HttpOutcome nomethod(Context& ctx, const std::vector<std::string>& exposed);

} // namespace wa
