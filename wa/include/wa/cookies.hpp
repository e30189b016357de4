/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include "wa/types.hpp"

namespace wa {

class Context;

struct CookieOptions {
    std::string expires;                    // literal date, emitted as-is
    std::optional<std::int64_t> expires_in; // seconds from now; < 0 expires immediately
    std::string domain;
    bool        secure   = false;
    bool        httponly = false;
    std::string path;                       // empty: ctx.homepath + "/"
    std::string samesite;                   // strict | lax | none (any case)
};

// Set-Cookie value. Throws InvalidHeaderError on an illegal cookie name.
std::string encode_cookie(const std::string& name,
                          const std::string& value,
                          const CookieOptions& opt,
                          const std::string& default_path,
                          std::time_t now = std::time(nullptr));

// encode_cookie + Set-Cookie header on the context.
void setcookie(Context& ctx,
               const std::string& name,
               const std::string& value,
               const CookieOptions& opt = CookieOptions{});

// Cookie request header -> name/value pairs. Never throws; malformed input
// yields whatever could be recovered.
CookieMap parse_cookies(const std::string& http_cookie);

} // namespace wa
