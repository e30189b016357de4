/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/file_upload.hpp"
#include <utility>

namespace wa {

FileUpload::FileUpload(std::string name, std::string filename,
                       std::string content_type, internal::Spool body)
    : _name(std::move(name)),
      _filename(std::move(filename)),
      _content_type(std::move(content_type)),
      _body(std::move(body)) {}

std::string FileUpload::value() const {
    return _body.read_all();
}

} // namespace wa
