#include <gtest/gtest.h>
#include "wa/errors.hpp"
#include "wa/internal/multipart.hpp"
#include "wa/internal/spool.hpp"

#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace wa;
using namespace wa::internal;

namespace {

const char* kBoundary = "XyZ";

std::string field_part(const std::string& name, const std::string& body) {
    return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" + body + "\r\n";
}

std::string file_part(const std::string& name, const std::string& filename, const std::string& body) {
    return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename +
           "\"\r\nContent-Type: application/octet-stream\r\n\r\n" + body + "\r\n";
}

std::string closing() { return "--XyZ--\r\n"; }

FormLimits test_limits() {
    FormLimits l;
    l.tmp_dir = ::testing::TempDir();
    return l;
}

std::vector<MultipartPart> parse_all(const std::string& body, const FormLimits& limits = test_limits()) {
    std::istringstream in(body);
    MultipartParser parser(in, kBoundary, -1, limits);
    std::vector<MultipartPart> parts;
    parser.parse([&](MultipartPart&& p) { parts.push_back(std::move(p)); });
    return parts;
}

bool exists(const std::string& path) { return ::access(path.c_str(), F_OK) == 0; }

} // namespace

// =============================================================================
// Framing
// =============================================================================
TEST(Multipart, TwoFields) {
    auto parts = parse_all(field_part("a", "1") + field_part("b", "two") + closing());
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].name, "a");
    EXPECT_EQ(parts[0].body.read_all(), "1");
    EXPECT_EQ(parts[1].name, "b");
    EXPECT_EQ(parts[1].body.read_all(), "two");
}

TEST(Multipart, LineBreaksInsideBodyKept) {
    auto parts = parse_all(field_part("t", "line1\r\nline2\n\r\n") + closing());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body.read_all(), "line1\r\nline2\n\r\n");
}

TEST(Multipart, BinaryPayloadIntact) {
    std::string payload("\x00\x01\xFF\r\x89PNG", 8);
    auto parts = parse_all(file_part("f", "x.bin", payload) + closing());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].filename, "x.bin");
    EXPECT_EQ(parts[0].content_type, "application/octet-stream");
    EXPECT_EQ(parts[0].body.read_all(), payload);
}

TEST(Multipart, PreambleAndEpilogueIgnored) {
    auto parts = parse_all("This is a preamble.\r\n" + field_part("a", "1") + closing() + "epilogue");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body.read_all(), "1");
}

TEST(Multipart, EmptyBodyWithOnlyTerminator) {
    EXPECT_TRUE(parse_all(closing()).empty());
}

TEST(Multipart, DataAfterTerminatorOnlyBody) {
    EXPECT_THROW(parse_all("--XyZ--\r\ntrailing"), DecodeError);
}

TEST(Multipart, NoBoundaryInStream) {
    try {
        parse_all("just some text\r\n");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_STREQ(e.what(), "Stream does not contain boundary");
    }
}

TEST(Multipart, MissingTerminator) {
    EXPECT_THROW(parse_all(field_part("a", "1")), DecodeError);
}

TEST(Multipart, FoldedHeaderContinues) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data;\r\n name=\"folded\"\r\n\r\nv\r\n" + closing();
    auto parts = parse_all(body);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "folded");
}

TEST(Multipart, CharsetFromPartContentType) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\n"
                       "Content-Type: text/plain; charset=latin-1\r\n\r\nv\r\n" + closing();
    auto parts = parse_all(body);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].charset, "latin-1");
    EXPECT_EQ(parts[0].content_type, "text/plain");
}

// =============================================================================
// Malformed parts
// =============================================================================
TEST(Multipart, MissingDisposition) {
    std::string body = "--XyZ\r\nContent-Type: text/plain\r\n\r\nv\r\n" + closing();
    EXPECT_THROW(parse_all(body), DecodeError);
}

TEST(Multipart, DispositionWithoutName) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data\r\n\r\nv\r\n" + closing();
    EXPECT_THROW(parse_all(body), DecodeError);
}

TEST(Multipart, HeaderWithoutColon) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\nbogus\r\n\r\nv\r\n" + closing();
    EXPECT_THROW(parse_all(body), DecodeError);
}

TEST(Multipart, HeaderSizeLimit) {
    FormLimits l = test_limits();
    l.max_header_bytes = 32;
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"a-rather-long-field-name\"\r\n\r\nv\r\n" + closing();
    EXPECT_THROW(parse_all(body, l), DecodeError);
}

TEST(Multipart, PartContentLengthExceeded) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"a\"\r\nContent-Length: 2\r\n\r\nlonger\r\n" + closing();
    EXPECT_THROW(parse_all(body), DecodeError);
}

// =============================================================================
// Limits and spooling
// =============================================================================
TEST(Multipart, LongLinesReassembled) {
    FormLimits l = test_limits();
    l.buffer_size = 64;
    std::string big(500, 'a');
    auto parts = parse_all(field_part("big", big) + closing(), l);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body.read_all(), big);
}

TEST(Multipart, BoundaryInsideLongLineIsData) {
    FormLimits l = test_limits();
    l.buffer_size = 64;
    std::string tricky = std::string(64, 'b') + "--XyZ--";
    auto parts = parse_all(field_part("t", tricky) + closing(), l);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].body.read_all(), tricky);
}

TEST(Multipart, LargePartSpooledToDisk) {
    FormLimits l = test_limits();
    l.memfile_limit = 16;
    std::string big(1000, 'z');
    std::string path;
    {
        auto parts = parse_all(field_part("blob", big) + closing(), l);
        ASSERT_EQ(parts.size(), 1u);
        EXPECT_FALSE(parts[0].body.is_buffered());
        path = parts[0].body.path();
        ASSERT_FALSE(path.empty());
        EXPECT_TRUE(exists(path));
        EXPECT_EQ(parts[0].body.read_all(), big);
    }
    EXPECT_FALSE(exists(path));
}

TEST(Multipart, MemoryLimit) {
    FormLimits l = test_limits();
    l.mem_limit = 10;
    EXPECT_THROW(parse_all(field_part("a", "123456") + field_part("b", "7890ab") + closing(), l),
                 DecodeError);
}

TEST(Multipart, DiskLimit) {
    FormLimits l = test_limits();
    l.memfile_limit = 4;
    l.disk_limit = 100;
    EXPECT_THROW(parse_all(field_part("a", std::string(200, 'x')) + closing(), l), DecodeError);
}

TEST(Multipart, ContentLengthBoundsStream) {
    std::string body = field_part("a", "1") + closing();
    std::string stream = body + "garbage that must not be read";
    std::istringstream in(stream);
    MultipartParser parser(in, kBoundary, static_cast<long long>(body.size()), test_limits());
    std::vector<MultipartPart> parts;
    parser.parse([&](MultipartPart&& p) { parts.push_back(std::move(p)); });
    ASSERT_EQ(parts.size(), 1u);
}

// =============================================================================
// Spool
// =============================================================================
TEST(Spool, StaysInMemoryBelowLimit) {
    Spool s(10, ::testing::TempDir());
    s.write("hello", 5);
    EXPECT_TRUE(s.is_buffered());
    EXPECT_EQ(s.read_all(), "hello");
}

TEST(Spool, CloseUnlinksFile) {
    Spool s(2, ::testing::TempDir());
    s.write("hello", 5);
    ASSERT_FALSE(s.is_buffered());
    std::string path = s.path();
    EXPECT_TRUE(exists(path));
    s.close();
    EXPECT_TRUE(s.closed());
    EXPECT_FALSE(exists(path));
    EXPECT_THROW(s.read_all(), DecodeError);
}

TEST(Spool, UnwritableDirectory) {
    Spool s(1, "/nonexistent-wa-dir");
    EXPECT_THROW(s.write("abc", 3), DecodeError);
}
