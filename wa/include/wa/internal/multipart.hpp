/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <functional>
#include <istream>
#include <string>
#include <cstddef>
#include "wa/app_config.hpp"
#include "wa/storage.hpp"
#include "wa/internal/spool.hpp"

namespace wa::internal {

// Splits a bounded stream into lines of at most max_line bytes.
// A line longer than that is returned in pieces with an empty `nl`.
class LineReader {
public:
    LineReader(std::istream& in, long long content_length, std::size_t max_line);

    // false once the input is exhausted.
    bool next(std::string& line, std::string& nl);

private:
    std::istream& _in;
    long long     _remaining; // < 0: read to EOF
    std::size_t   _max_line;
    std::string   _buf;
    bool          _eof = false;

    void fill();
};

// One multipart/form-data part, headers parsed and body collected.
struct MultipartPart {
    std::string name;
    std::string filename;
    std::string content_type;
    std::string charset;
    HeaderList  headers;
    long long   content_length = -1;
    Spool       body;
};

/**
 * Streaming multipart/form-data reader (RFC 7578 framing).
 * Parts are handed to on_part in stream order; a part that is still being
 * read when an error occurs is released before DecodeError propagates.
 */
class MultipartParser {
public:
    MultipartParser(std::istream& in, const std::string& boundary,
                    long long content_length, const FormLimits& limits,
                    std::string charset = "utf-8");

    void parse(const std::function<void(MultipartPart&&)>& on_part);

private:
    LineReader  _lines;
    std::string _separator;
    std::string _terminator;
    FormLimits  _limits;
    std::string _charset;
};

} // namespace wa::internal
