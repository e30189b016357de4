/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <string>
#include <cstddef>
#include "wa/internal/spool.hpp"

namespace wa {

// One uploaded multipart part. value() is always the raw payload,
// whatever charset the part declared.
class FileUpload {
public:
    FileUpload(std::string name, std::string filename,
               std::string content_type, internal::Spool body);

    FileUpload(const FileUpload&) = delete;
    FileUpload& operator=(const FileUpload&) = delete;

    const std::string& name() const { return _name; }
    const std::string& filename() const { return _filename; }
    const std::string& content_type() const { return _content_type; }

    std::string value() const;
    std::size_t size() const { return _body.size(); }

    // False when the payload lives in a temporary file.
    bool is_buffered() const { return _body.is_buffered(); }
    const std::string& spool_path() const { return _body.path(); }

    // Drops the payload and removes any temporary file.
    void close() { _body.close(); }
    bool closed() const { return _body.closed(); }

private:
    std::string _name;
    std::string _filename;
    std::string _content_type;
    internal::Spool _body;
};

using FilePtr = std::shared_ptr<FileUpload>;

} // namespace wa
