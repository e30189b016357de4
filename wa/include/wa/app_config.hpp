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
#include <cstddef>

namespace wa {

// Multipart decoding limits.
struct FormLimits {
    std::size_t memfile_limit    = 256 * 1024;          // spool parts above this
    std::size_t mem_limit        = 1024 * 1024;         // total buffered bytes
    std::size_t disk_limit       = 1024 * 1024 * 1024;  // total spooled bytes
    std::size_t buffer_size      = 64 * 1024;           // read chunk / max line
    std::size_t max_header_bytes = 8 * 1024;            // per part
    std::string tmp_dir          = "/tmp";
};

struct AppConfig {
    // Debug: 500 bodies carry the exception text
    bool debug = false;

    // Logging
    std::string log_file;

    // Error redaction (wins over debug)
    bool redact_errors = false;

    FormLimits form;
};

} // namespace wa
