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

namespace wa {

// Thread-safe logging (to optional file + stderr).
// stdout is left alone: under CGI it carries the response.
void set_log_file(const std::string& path);
void set_log_console(bool enabled);
void log_line(const std::string& line);

} // namespace wa
