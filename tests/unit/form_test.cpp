#include <gtest/gtest.h>
#include "wa/errors.hpp"
#include "wa/form.hpp"

#include <sstream>
#include <string>
#include <cstdlib>
#include <dirent.h>
#include <unistd.h>

using namespace wa;

namespace {

const char* kMultipartType = "multipart/form-data; boundary=XyZ";

std::string field_part(const std::string& name, const std::string& body) {
    return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" + body + "\r\n";
}

std::string file_part(const std::string& name, const std::string& filename, const std::string& body) {
    return "--XyZ\r\nContent-Disposition: form-data; name=\"" + name + "\"; filename=\"" + filename +
           "\"\r\nContent-Type: text/plain\r\n\r\n" + body + "\r\n";
}

FormLimits test_limits() {
    FormLimits l;
    l.tmp_dir = ::testing::TempDir();
    return l;
}

FormData decode(const std::string& method, const std::string& type, const std::string& body,
                bool strict = false, const FormLimits& limits = test_limits()) {
    std::istringstream in(body);
    return decode_form(method, type, static_cast<long long>(body.size()), &in, strict, limits);
}

bool exists(const std::string& path) { return ::access(path.c_str(), F_OK) == 0; }

std::string make_temp_dir() {
    std::string tmpl = ::testing::TempDir() + "wa-form-XXXXXX";
    if (!::mkdtemp(&tmpl[0])) return ::testing::TempDir();
    return tmpl;
}

std::size_t count_entries(const std::string& dir) {
    std::size_t n = 0;
    DIR* d = ::opendir(dir.c_str());
    if (!d) return 0;
    while (dirent* e = ::readdir(d)) {
        const std::string name = e->d_name;
        if (name != "." && name != "..") ++n;
    }
    ::closedir(d);
    return n;
}

} // namespace

// =============================================================================
// Method and content type gating
// =============================================================================
TEST(DecodeForm, GetIsAlwaysEmpty) {
    FormData f = decode("GET", "application/x-www-form-urlencoded", "a=1", true);
    EXPECT_TRUE(f.empty());
}

TEST(DecodeForm, NonWriteMethodsIgnoreBrokenType) {
    EXPECT_NO_THROW(decode("DELETE", "", "a=1", true));
}

TEST(DecodeForm, MissingContentTypeStrict) {
    EXPECT_THROW(decode("POST", "", "a=1", true), DecodeError);
}

TEST(DecodeForm, MissingContentTypeLenient) {
    EXPECT_TRUE(decode("POST", "", "a=1", false).empty());
}

TEST(DecodeForm, UnsupportedTypeStrict) {
    EXPECT_THROW(decode("POST", "application/json", "{}", true), UnsupportedContentTypeError);
}

TEST(DecodeForm, UnsupportedTypeLenient) {
    EXPECT_TRUE(decode("PUT", "application/json", "{}").empty());
}

TEST(DecodeForm, MultipartWithoutBoundaryStrict) {
    EXPECT_THROW(decode("POST", "multipart/form-data", "--x--\r\n", true), DecodeError);
}

TEST(DecodeForm, MultipartWithoutBoundaryLenient) {
    EXPECT_TRUE(decode("POST", "multipart/form-data", "--x--\r\n").empty());
}

// =============================================================================
// urlencoded
// =============================================================================
TEST(DecodeForm, UrlencodedScalarCollapse) {
    FormData f = decode("POST", "application/x-www-form-urlencoded", "a=1&b=2&b=3&c=");
    ASSERT_EQ(f.fields.size(), 3u);
    EXPECT_EQ(std::get<std::string>(f.fields.at("a")), "1");
    EXPECT_EQ(std::get<std::vector<std::string>>(f.fields.at("b")).size(), 2u);
    EXPECT_EQ(std::get<std::string>(f.fields.at("c")), "");
    EXPECT_TRUE(f.files.empty());
}

TEST(DecodeForm, UrlencodedHonoursContentLength) {
    std::istringstream in("a=1&b=2");
    FormData f = decode_form("PATCH", "application/x-www-form-urlencoded", 3, &in);
    EXPECT_EQ(f.fields.size(), 1u);
    EXPECT_TRUE(f.fields.contains("a"));
}

TEST(DecodeForm, UrlencodedReadsToEofWhenLengthUnknown) {
    std::istringstream in("a=1&b=2");
    FormData f = decode_form("POST", "application/x-www-form-urlencoded; charset=utf-8", -1, &in);
    EXPECT_EQ(f.fields.size(), 2u);
}

// =============================================================================
// multipart
// =============================================================================
TEST(DecodeForm, MultipartFieldsAndFiles) {
    std::string body = field_part("title", "hi") + file_part("doc", "a.txt", "payload") + "--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true);

    ASSERT_EQ(f.fields.size(), 1u);
    EXPECT_EQ(std::get<std::string>(f.fields.at("title")), "hi");

    ASSERT_EQ(f.files.size(), 1u);
    const FilePtr& doc = std::get<FilePtr>(f.files.at("doc"));
    ASSERT_TRUE(doc);
    EXPECT_EQ(doc->name(), "doc");
    EXPECT_EQ(doc->filename(), "a.txt");
    EXPECT_EQ(doc->content_type(), "text/plain");
    EXPECT_EQ(doc->value(), "payload");
    EXPECT_EQ(doc->size(), 7u);
}

TEST(DecodeForm, FieldCharsetTranscodedToUtf8) {
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"word\"\r\n"
                       "Content-Type: text/plain; charset=iso-8859-1\r\n\r\ncaf\xE9\r\n"
                       "--XyZ\r\nContent-Disposition: form-data; name=\"doc\"; filename=\"l1.txt\"\r\n"
                       "Content-Type: text/plain; charset=iso-8859-1\r\n\r\ncaf\xE9\r\n--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true);
    EXPECT_EQ(std::get<std::string>(f.fields.at("word")), "caf\xC3\xA9");
    // Files keep their bytes.
    EXPECT_EQ(std::get<FilePtr>(f.files.at("doc"))->value(), "caf\xE9");
}

TEST(DecodeForm, LowercaseMethodStillDecodes) {
    FormData f = decode("post", "application/x-www-form-urlencoded", "a=1", true);
    EXPECT_EQ(std::get<std::string>(f.fields.at("a")), "1");
}

TEST(DecodeForm, RepeatedFilesBecomeList) {
    std::string body = file_part("f", "1.txt", "one") + file_part("f", "2.txt", "two") + "--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true);
    const auto& list = std::get<std::vector<FilePtr>>(f.files.at("f"));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1]->value(), "two");
}

TEST(DecodeForm, SpooledPartIsFileWithoutFilename) {
    FormLimits l = test_limits();
    l.memfile_limit = 8;
    std::string body = field_part("big", std::string(100, 'q')) + "--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true, l);
    EXPECT_TRUE(f.fields.empty());
    const FilePtr& big = std::get<FilePtr>(f.files.at("big"));
    EXPECT_FALSE(big->is_buffered());
    EXPECT_EQ(big->filename(), "");
    EXPECT_EQ(big->value(), std::string(100, 'q'));
}

TEST(DecodeForm, FileValueIsRawBytes) {
    const std::string raw("\xFF\xFE\x00z", 4);
    std::string body = "--XyZ\r\nContent-Disposition: form-data; name=\"f\"; filename=\"b\"\r\n"
                       "Content-Type: text/plain; charset=utf-8\r\n\r\n" + raw + "\r\n--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true);
    EXPECT_EQ(std::get<FilePtr>(f.files.at("f"))->value(), raw);
}

TEST(DecodeForm, StrictErrorReleasesOpenedFiles) {
    std::string dir = make_temp_dir();
    FormLimits l = test_limits();
    l.tmp_dir = dir;
    l.memfile_limit = 8;
    // first part spools to disk, second part is broken
    std::string body = field_part("big", std::string(100, 'q')) +
                       "--XyZ\r\nno colon here\r\n\r\nv\r\n--XyZ--\r\n";

    EXPECT_THROW(decode("POST", kMultipartType, body, true, l), DecodeError);
    EXPECT_EQ(count_entries(dir), 0u);
    ::rmdir(dir.c_str());
}

TEST(DecodeForm, LenientErrorReleasesOpenedFiles) {
    std::string dir = make_temp_dir();
    FormLimits l = test_limits();
    l.tmp_dir = dir;
    l.memfile_limit = 8;
    std::string body = field_part("big", std::string(100, 'q')) + "--XyZ\r\nbroken";

    FormData f;
    EXPECT_NO_THROW(f = decode("POST", kMultipartType, body, false, l));
    EXPECT_TRUE(f.empty());
    EXPECT_EQ(count_entries(dir), 0u);
    ::rmdir(dir.c_str());
}

TEST(DecodeForm, ReleaseClosesUploads) {
    FormLimits l = test_limits();
    l.memfile_limit = 8;
    std::string body = file_part("f", "x", std::string(64, 'k')) + "--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true, l);
    FilePtr up = std::get<FilePtr>(f.files.at("f"));
    std::string path = up->spool_path();
    ASSERT_TRUE(exists(path));
    f.release();
    EXPECT_TRUE(up->closed());
    EXPECT_FALSE(exists(path));
}

TEST(DecodeForm, EnvironmentOverload) {
    std::string body = "x=1";
    std::istringstream in(body);
    Environment env;
    env.vars["REQUEST_METHOD"] = "POST";
    env.vars["CONTENT_TYPE"] = "application/x-www-form-urlencoded";
    env.vars["CONTENT_LENGTH"] = "3";
    env.input = &in;
    FormData f = decode_form(env, true, test_limits());
    EXPECT_EQ(std::get<std::string>(f.fields.at("x")), "1");
}

// =============================================================================
// merge_form
// =============================================================================
TEST(MergeForm, FileOverridesFieldOfSameName) {
    std::string body = field_part("a", "text") + file_part("a", "a.txt", "file") +
                       field_part("b", "2") + "--XyZ--\r\n";
    FormData f = decode("POST", kMultipartType, body, true);
    Storage s = merge_form(f);
    ASSERT_EQ(s.size(), 2u);
    EXPECT_NE(as_file(s.get("a")), nullptr);
    ASSERT_NE(as_text(s.get("b")), nullptr);
    EXPECT_EQ(*as_text(s.get("b")), "2");
}
