/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace wa {

// Header name/value carrying CR or LF (response splitting attempt).
class InvalidHeaderError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Malformed request body.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Body content type we cannot decode.
class UnsupportedContentTypeError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

// Required input field or cookie not present.
class MissingFieldError : public std::out_of_range {
public:
    explicit MissingFieldError(const std::string& field)
        : std::out_of_range("missing required field: " + field), _field(field) {}

    const std::string& field() const noexcept { return _field; }

private:
    std::string _field;
};

} // namespace wa
