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
#include "wa/app_config.hpp"
#include "wa/environment.hpp"
#include "wa/types.hpp"

namespace wa {

// Decoded request body: text fields and uploads, each scalar-collapsed.
struct FormData {
    FieldMap fields;
    FileMap  files;

    bool empty() const { return fields.empty() && files.empty(); }

    // Close every upload (removes temporary files).
    void release();
};

/**
 * Decode a POST/PUT/PATCH body (multipart/form-data or
 * application/x-www-form-urlencoded). Other methods yield an empty result.
 *
 * strict == true : DecodeError / UnsupportedContentTypeError propagate and
 *                  uploads opened so far are released first.
 * strict == false: any decode error yields an empty FormData.
 *
 * content_length < 0 means unknown: the body runs to end of stream.
 */
FormData decode_form(const std::string& method,
                     const std::string& content_type,
                     long long content_length,
                     std::istream* body,
                     bool strict = false,
                     const FormLimits& limits = FormLimits{});

// Same, driven by REQUEST_METHOD / CONTENT_TYPE / CONTENT_LENGTH / input.
FormData decode_form(const Environment& env,
                     bool strict = false,
                     const FormLimits& limits = FormLimits{});

// Fields and uploads in one namespace; an upload replaces a text field
// of the same name.
Storage merge_form(const FormData& form);

} // namespace wa
