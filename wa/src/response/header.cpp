/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/header.hpp"
#include "wa/context.hpp"
#include "wa/errors.hpp"
#include "wa/log.hpp"
#include "wa/internal/utils.hpp"

namespace wa {

static bool has_crlf(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

void validate_header(const std::string& name, const std::string& value) {
    // protection against HTTP response splitting
    if (has_crlf(name) || has_crlf(value)) {
        wa::log_line("[HDR] rejected header with CR/LF, name length=" +
                     std::to_string(name.size()));
        throw InvalidHeaderError("invalid characters in header");
    }
}

void append_header(HeaderList& headers, const std::string& name,
                   const std::string& value, bool unique)
{
    validate_header(name, value);
    if (unique) {
        for (const auto& h : headers) {
            if (internal::iequals(h.first, name)) return;
        }
    }
    headers.emplace_back(name, value);
}

void header(Context& ctx, const std::string& name,
            const std::string& value, bool unique)
{
    append_header(ctx.headers(), name, value, unique);
}

} // namespace wa
