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
#include "wa/storage.hpp"

namespace wa {

class Context;

// Throws InvalidHeaderError when name or value contains CR or LF.
void validate_header(const std::string& name, const std::string& value);

// Appends (name, value) after validation. With unique == true an existing
// header of the same name (case-insensitive) turns the call into a no-op.
void append_header(HeaderList& headers, const std::string& name,
                   const std::string& value, bool unique = false);

// append_header on the context's outbound headers.
void header(Context& ctx, const std::string& name,
            const std::string& value, bool unique = false);

} // namespace wa
