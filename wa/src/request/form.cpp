/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/form.hpp"
#include "wa/errors.hpp"
#include "wa/log.hpp"
#include "wa/internal/multipart.hpp"
#include "wa/internal/query.hpp"
#include "wa/internal/utils.hpp"

#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace wa {

void FormData::release() {
    for (const auto& kv : files) {
        if (const auto* one = std::get_if<FilePtr>(&kv.second)) {
            if (*one) (*one)->close();
        } else {
            for (const auto& f : std::get<std::vector<FilePtr>>(kv.second)) {
                if (f) f->close();
            }
        }
    }
}

namespace {

std::string read_body(std::istream* in, long long content_length) {
    std::string out;
    if (!in) return out;
    if (content_length >= 0) {
        char buf[64 * 1024];
        std::size_t left = static_cast<std::size_t>(content_length);
        while (left > 0) {
            const std::size_t want = left < sizeof(buf) ? left : sizeof(buf);
            in->read(buf, static_cast<std::streamsize>(want));
            const std::size_t got = static_cast<std::size_t>(in->gcount());
            if (got == 0) break;
            out.append(buf, got);
            left -= got;
        }
        return out;
    }
    std::ostringstream oss;
    oss << in->rdbuf();
    return oss.str();
}

void decode_multipart(std::istream* body, const std::string& boundary,
                      long long content_length, const FormLimits& limits,
                      const std::string& charset,
                      MultiDict<std::string>& fields, MultiDict<FilePtr>& files)
{
    std::istringstream empty;
    std::istream& in = body ? *body : empty;

    internal::MultipartParser parser(in, boundary, content_length, limits, charset);
    parser.parse([&](internal::MultipartPart&& part) {
        if (!part.filename.empty() || !part.body.is_buffered()) {
            auto up = std::make_shared<FileUpload>(part.name, part.filename,
                                                   part.content_type, std::move(part.body));
            files.add(part.name, std::move(up));
        } else {
            fields.add(part.name, internal::to_utf8(part.body.read_all(), part.charset));
        }
    });
}

void close_all(const MultiDict<FilePtr>& files) {
    for (const auto& kv : files.lists()) {
        for (const auto& f : kv.second) {
            if (f) f->close();
        }
    }
}

} // namespace

FormData decode_form(const std::string& method,
                     const std::string& content_type,
                     long long content_length,
                     std::istream* body,
                     bool strict,
                     const FormLimits& limits)
{
    FormData out;
    if (!internal::is_write_method(method)) return out;

    MultiDict<std::string> fields;
    MultiDict<FilePtr> files;
    try {
        if (internal::trim_copy(content_type).empty()) {
            throw DecodeError("Missing Content-Type header.");
        }
        internal::OptionsHeader ct = internal::parse_options_header(content_type);
        const std::string charset = ct.option("charset", "utf-8");

        if (ct.value == "multipart/form-data") {
            const std::string boundary = ct.option("boundary");
            if (boundary.empty()) throw DecodeError("No boundary for multipart/form-data.");
            decode_multipart(body, boundary, content_length, limits, charset, fields, files);
        } else if (ct.value == "application/x-www-form-urlencoded") {
            for (auto& kv : internal::parse_qsl(read_body(body, content_length))) {
                fields.add(kv.first, std::move(kv.second));
            }
        } else {
            throw UnsupportedContentTypeError("Unsupported content type: " + ct.value);
        }
    } catch (const DecodeError& e) {
        close_all(files);
        if (strict) throw;
        wa::log_line(std::string("[FORM] body ignored: ") + e.what());
        return FormData{};
    }

    out.fields = fields.flatten();
    out.files = files.flatten();
    return out;
}

FormData decode_form(const Environment& env, bool strict, const FormLimits& limits) {
    long long content_length = -1;
    std::size_t n = 0;
    if (internal::parse_size(env.get("CONTENT_LENGTH"), n)) {
        content_length = static_cast<long long>(n);
    }
    return decode_form(env.get("REQUEST_METHOD", "GET"), env.get("CONTENT_TYPE"),
                       content_length, env.input, strict, limits);
}

Storage merge_form(const FormData& form) {
    Storage out;
    for (const auto& kv : form.fields) out.set(kv.first, to_value(kv.second));
    for (const auto& kv : form.files) out.set(kv.first, to_value(kv.second));
    return out;
}

} // namespace wa
