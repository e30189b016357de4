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

namespace wa::internal {

/**
 * Byte sink that keeps data in memory until memfile_limit is exceeded, then
 * moves everything to an exclusive temporary file under tmp_dir.
 * The file is unlinked on close() / destruction.
 */
class Spool {
public:
    Spool() = default;
    Spool(std::size_t memfile_limit, std::string tmp_dir);
    ~Spool();

    Spool(const Spool&) = delete;
    Spool& operator=(const Spool&) = delete;
    Spool(Spool&& o) noexcept;
    Spool& operator=(Spool&& o) noexcept;

    // Throws DecodeError when the temporary file cannot be created or written.
    void write(const char* p, std::size_t n);

    // Whole content. Throws DecodeError on read failure or after close().
    std::string read_all() const;

    bool is_buffered() const { return _fd < 0; }
    std::size_t size() const { return _size; }
    const std::string& path() const { return _path; }
    bool closed() const { return _closed; }

    void close();

private:
    std::size_t _memfile_limit = 0;
    std::string _tmp_dir;
    std::string _mem;
    std::string _path;
    int         _fd = -1;
    std::size_t _size = 0;
    bool        _closed = false;

    void spill_to_disk();
    void write_fd(const char* p, std::size_t n);
    void release() noexcept;
};

} // namespace wa::internal
