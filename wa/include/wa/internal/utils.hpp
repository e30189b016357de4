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
#include <cstdint>
#include <cstddef>

namespace wa::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);
std::string trim_copy(std::string s);

// Hex helpers
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Random hex string of n_bytes entropy (OpenSSL RAND). Empty on RNG failure.
std::string random_hex(std::size_t n_bytes);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);
bool iequals(const std::string& a, const std::string& b);
bool istarts_with(const std::string& s, const std::string& prefix);

// Percent-decoding. Invalid escapes are kept literally.
std::string url_unquote(const std::string& s, bool plus_as_space);

// Percent-encoding; unreserved chars and anything in `safe` pass through.
std::string url_quote(const std::string& s, const char* safe = "/");

// Replace invalid UTF-8 sequences with U+FFFD.
std::string to_text(const std::string& raw);

// Convert `raw` from `charset` to UTF-8 via iconv(3). UTF-8 input is returned
// unchanged. Unknown charsets keep the raw bytes; undecodable bytes become U+FFFD.
std::string to_utf8(const std::string& raw, const std::string& charset);

// POST, PUT or PATCH, any case.
bool is_write_method(const std::string& method);

// Strict non-negative integer parse; false on empty/garbage/overflow.
bool parse_size(const std::string& s, std::size_t& out);

} // namespace wa::internal
