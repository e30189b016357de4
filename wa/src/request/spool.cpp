/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/spool.hpp"
#include "wa/internal/utils.hpp"
#include "wa/errors.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace wa::internal {

Spool::Spool(std::size_t memfile_limit, std::string tmp_dir)
    : _memfile_limit(memfile_limit), _tmp_dir(std::move(tmp_dir)) {}

Spool::~Spool() {
    release();
}

Spool::Spool(Spool&& o) noexcept
    : _memfile_limit(o._memfile_limit),
      _tmp_dir(std::move(o._tmp_dir)),
      _mem(std::move(o._mem)),
      _path(std::move(o._path)),
      _fd(o._fd),
      _size(o._size),
      _closed(o._closed)
{
    o._fd = -1;
    o._path.clear();
    o._size = 0;
}

Spool& Spool::operator=(Spool&& o) noexcept {
    if (this != &o) {
        release();
        _memfile_limit = o._memfile_limit;
        _tmp_dir = std::move(o._tmp_dir);
        _mem = std::move(o._mem);
        _path = std::move(o._path);
        _fd = o._fd;
        _size = o._size;
        _closed = o._closed;
        o._fd = -1;
        o._path.clear();
        o._size = 0;
    }
    return *this;
}

void Spool::write(const char* p, std::size_t n) {
    if (_closed) throw DecodeError("write to a released upload");
    if (n == 0) return;
    if (_fd < 0 && _mem.size() + n > _memfile_limit) {
        spill_to_disk();
    }
    if (_fd >= 0) {
        write_fd(p, n);
    } else {
        _mem.append(p, n);
    }
    _size += n;
}

void Spool::spill_to_disk() {
    const std::string suffix = random_hex(8);
    if (suffix.empty()) throw DecodeError("cannot name spool file: RNG failure");
    std::string dir = _tmp_dir.empty() ? std::string("/tmp") : _tmp_dir;
    if (dir.back() == '/') dir.pop_back();
    _path = dir + "/wa-upload-" + suffix;

    _fd = ::open(_path.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (_fd < 0) {
        const std::string why = std::strerror(errno);
        _path.clear();
        throw DecodeError("cannot create spool file: " + why);
    }
    std::string pending;
    pending.swap(_mem);
    write_fd(pending.data(), pending.size());
}

void Spool::write_fd(const char* p, std::size_t n) {
    std::size_t off = 0;
    while (off < n) {
        ssize_t w = ::write(_fd, p + off, n - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw DecodeError(std::string("spool write failed: ") + std::strerror(errno));
        }
        off += static_cast<std::size_t>(w);
    }
}

std::string Spool::read_all() const {
    if (_closed) throw DecodeError("read from a released upload");
    if (_fd < 0) return _mem;

    std::string out;
    out.resize(_size);
    std::size_t off = 0;
    while (off < _size) {
        ssize_t r = ::pread(_fd, &out[off], _size - off, static_cast<off_t>(off));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw DecodeError(std::string("spool read failed: ") + std::strerror(errno));
        }
        if (r == 0) break;
        off += static_cast<std::size_t>(r);
    }
    out.resize(off);
    return out;
}

void Spool::close() {
    release();
    _closed = true;
}

void Spool::release() noexcept {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
    if (!_path.empty()) {
        ::unlink(_path.c_str());
        _path.clear();
    }
    _mem.clear();
    _mem.shrink_to_fit();
}

} // namespace wa::internal
