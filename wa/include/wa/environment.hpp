/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <istream>
#include <string>
#include <unordered_map>

namespace wa {

// Gateway-supplied request metadata, CGI naming:
// REQUEST_METHOD, CONTENT_TYPE, CONTENT_LENGTH, HTTP_TRANSFER_ENCODING,
// HTTP_COOKIE, QUERY_STRING, PATH_INFO, SCRIPT_NAME, HTTP_HOST, HTTPS,
// REMOTE_ADDR, URL_SCHEME ...
struct Environment {
    std::unordered_map<std::string, std::string> vars;
    std::istream* input = nullptr; // not owned; read at most once

    std::string get(const std::string& key, const std::string& def = {}) const;
    bool has(const std::string& key) const;
};

// Build from a CGI process environment block (KEY=VALUE entries).
Environment environment_from_cgi(char** envp, std::istream* input);

} // namespace wa
