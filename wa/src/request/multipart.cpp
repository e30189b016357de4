/*
 * Part of the WebApi (WA) project.
 *
 * SPDX-FileCopyrightText: 2025 WebApi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of WebApi (WA). See LICENSE for details.
 */

#include "wa/internal/multipart.hpp"
#include "wa/internal/query.hpp"
#include "wa/internal/utils.hpp"
#include "wa/errors.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace wa::internal {

// --- LineReader ---

LineReader::LineReader(std::istream& in, long long content_length, std::size_t max_line)
    : _in(in), _remaining(content_length), _max_line(std::max<std::size_t>(max_line, 2)) {}

void LineReader::fill() {
    if (_eof) return;
    std::size_t want = _max_line;
    if (_remaining >= 0) want = std::min<std::size_t>(want, static_cast<std::size_t>(_remaining));
    if (want == 0) { _eof = true; return; }

    std::vector<char> chunk(want);
    _in.read(chunk.data(), static_cast<std::streamsize>(want));
    const std::streamsize got = _in.gcount();
    if (got <= 0) { _eof = true; return; }
    _buf.append(chunk.data(), static_cast<std::size_t>(got));
    if (_remaining >= 0) _remaining -= got;
}

bool LineReader::next(std::string& line, std::string& nl) {
    while (true) {
        const std::size_t limit = std::min(_buf.size(), _max_line + 1);
        const std::size_t lf = _buf.find('\n');
        if (lf != std::string::npos && lf < limit) {
            if (lf > 0 && _buf[lf-1] == '\r') {
                line.assign(_buf, 0, lf - 1);
                nl = "\r\n";
            } else {
                line.assign(_buf, 0, lf);
                nl = "\n";
            }
            _buf.erase(0, lf + 1);
            return true;
        }
        if (_buf.size() > _max_line) {
            line.assign(_buf, 0, _max_line);
            nl.clear();
            _buf.erase(0, _max_line);
            return true;
        }
        if (_eof) {
            if (_buf.empty()) return false;
            line.swap(_buf);
            _buf.clear();
            nl.clear();
            return true;
        }
        fill();
    }
}

// --- Part assembly ---

namespace {

class PartBuilder {
public:
    PartBuilder(const FormLimits& limits, const std::string& charset)
        : _limits(limits)
    {
        _part.charset = charset;
    }

    bool in_body() const { return _in_body; }
    std::size_t size() const { return _part.body.size(); }
    bool is_buffered() const { return _part.body.is_buffered(); }

    void feed(const std::string& line, const std::string& nl) {
        if (_in_body) write_body(line, nl);
        else          write_header(line, nl);
    }

    MultipartPart take() {
        if (!_in_body) throw DecodeError("Unexpected end of part headers.");
        return std::move(_part);
    }

private:
    const FormLimits& _limits;
    MultipartPart     _part;
    bool              _in_body = false;
    std::size_t       _header_bytes = 0;
    std::string       _pending_nl; // belongs to the delimiter if one follows

    void write_header(const std::string& line, const std::string& nl) {
        if (nl.empty()) throw DecodeError("Unexpected end of line in header.");
        _header_bytes += line.size() + nl.size();
        if (_header_bytes > _limits.max_header_bytes) {
            throw DecodeError("Maximum size of part headers exceeded.");
        }
        if (trim_copy(line).empty()) {
            finish_header();
        } else if ((line[0] == ' ' || line[0] == '\t') && !_part.headers.empty()) {
            _part.headers.back().second += trim_copy(line);
        } else {
            std::size_t c = line.find(':');
            if (c == std::string::npos) throw DecodeError("Syntax error in header: No colon.");
            _part.headers.emplace_back(trim_copy(line.substr(0, c)), trim_copy(line.substr(c + 1)));
        }
    }

    std::string header(const char* name) const {
        for (const auto& h : _part.headers) {
            if (iequals(h.first, name)) return h.second;
        }
        return {};
    }

    void finish_header() {
        const std::string disposition = header("Content-Disposition");
        if (disposition.empty()) throw DecodeError("Content-Disposition header is missing.");

        OptionsHeader cd = parse_options_header(disposition);
        auto name = cd.options.find("name");
        if (name == cd.options.end()) throw DecodeError("Content-Disposition header has no name.");
        _part.name = name->second;
        _part.filename = cd.option("filename");

        OptionsHeader ct = parse_options_header(header("Content-Type"));
        _part.content_type = ct.value;
        const std::string cs = ct.option("charset");
        if (!cs.empty()) _part.charset = cs;

        const std::string cl = header("Content-Length");
        std::size_t n = 0;
        if (!cl.empty() && parse_size(cl, n)) _part.content_length = static_cast<long long>(n);

        _part.body = Spool(_limits.memfile_limit, _limits.tmp_dir);
        _in_body = true;
    }

    void write_body(const std::string& line, const std::string& nl) {
        if (line.empty() && nl.empty()) return;
        if (!_pending_nl.empty()) _part.body.write(_pending_nl.data(), _pending_nl.size());
        _part.body.write(line.data(), line.size());
        _pending_nl = nl;
        if (_part.content_length >= 0 &&
            _part.body.size() > static_cast<std::size_t>(_part.content_length)) {
            throw DecodeError("Size of body exceeds Content-Length header.");
        }
    }
};

} // namespace

// --- MultipartParser ---

MultipartParser::MultipartParser(std::istream& in, const std::string& boundary,
                                 long long content_length, const FormLimits& limits,
                                 std::string charset)
    : _lines(in, content_length, limits.buffer_size),
      _separator("--" + boundary),
      _terminator("--" + boundary + "--"),
      _limits(limits),
      _charset(std::move(charset)) {}

void MultipartParser::parse(const std::function<void(MultipartPart&&)>& on_part) {
    std::string line, nl;

    // Skip the preamble.
    bool found = false;
    while (_lines.next(line, nl)) {
        if (line == _separator || line == _terminator) { found = true; break; }
    }
    if (!found) throw DecodeError("Stream does not contain boundary");

    if (line == _terminator) {
        if (_lines.next(line, nl)) throw DecodeError("Data after end of stream");
        return;
    }

    std::size_t mem_used = 0, disk_used = 0;
    bool is_tail = false;
    bool terminated = false;
    auto part = std::make_unique<PartBuilder>(_limits, _charset);

    while (_lines.next(line, nl)) {
        if (!is_tail && line == _terminator) {
            on_part(part->take());
            terminated = true;
            break;
        }
        if (!is_tail && line == _separator) {
            if (part->is_buffered()) mem_used += part->size();
            else                     disk_used += part->size();
            on_part(part->take());
            part = std::make_unique<PartBuilder>(_limits, _charset);
            continue;
        }
        is_tail = nl.empty();
        part->feed(line, nl);
        if (part->in_body()) {
            if (part->is_buffered()) {
                if (part->size() + mem_used > _limits.mem_limit) {
                    throw DecodeError("Memory limit reached.");
                }
            } else if (part->size() + disk_used > _limits.disk_limit) {
                throw DecodeError("Disk limit reached.");
            }
        }
    }
    if (!terminated) throw DecodeError("Unexpected end of multipart stream.");
}

} // namespace wa::internal
