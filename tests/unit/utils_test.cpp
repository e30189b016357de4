#include <gtest/gtest.h>
#include "wa/internal/time.hpp"
#include "wa/internal/url.hpp"
#include "wa/internal/utils.hpp"
#include "wa/storage.hpp"
#include <string>

using namespace wa::internal;

// =============================================================================
// String helpers
// =============================================================================
TEST(Utils, TrimBothSides) {
    EXPECT_EQ(trim_copy("  a b \t\r\n"), "a b");
    EXPECT_EQ(trim_copy("   "), "");
}

TEST(Utils, CaseInsensitiveCompare) {
    EXPECT_TRUE(iequals("Content-Type", "content-type"));
    EXPECT_FALSE(iequals("Content-Type", "Content-Typ"));
    EXPECT_TRUE(istarts_with("Multipart/Form-Data", "multipart/"));
    EXPECT_FALSE(istarts_with("multi", "multipart/"));
}

TEST(Utils, RandomHexLength) {
    std::string a = random_hex(8);
    std::string b = random_hex(8);
    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

TEST(Utils, ParseSize) {
    std::size_t n = 0;
    EXPECT_TRUE(parse_size(" 42 ", n));
    EXPECT_EQ(n, 42u);
    EXPECT_FALSE(parse_size("", n));
    EXPECT_FALSE(parse_size("-1", n));
    EXPECT_FALSE(parse_size("12abc", n));
    EXPECT_FALSE(parse_size("99999999999999999999999999", n));
}

// =============================================================================
// Percent coding
// =============================================================================
TEST(Utils, UnquotePlusHandling) {
    EXPECT_EQ(url_unquote("a+b%20c", true), "a b c");
    EXPECT_EQ(url_unquote("a+b%20c", false), "a+b c");
}

TEST(Utils, UnquoteKeepsBrokenEscapes) {
    EXPECT_EQ(url_unquote("100%", false), "100%");
    EXPECT_EQ(url_unquote("%zz", false), "%zz");
}

TEST(Utils, QuoteKeepsUnreservedAndSlash) {
    EXPECT_EQ(url_quote("a b/c~d"), "a%20b/c~d");
    EXPECT_EQ(url_quote("x=y;z"), "x%3Dy%3Bz");
    EXPECT_EQ(url_quote("\xC3\xA9"), "%C3%A9");
}

// =============================================================================
// UTF-8 repair
// =============================================================================
TEST(Utils, ToTextKeepsValidUtf8) {
    EXPECT_EQ(to_text("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(Utils, ToTextReplacesInvalidBytes) {
    EXPECT_EQ(to_text("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_EQ(to_text("\xC3"), "\xEF\xBF\xBD");
}

TEST(Utils, ToUtf8FromLatin1) {
    EXPECT_EQ(to_utf8("caf\xE9", "ISO-8859-1"), "caf\xC3\xA9");
    EXPECT_EQ(to_utf8(std::string(5000, '\xE9'), "latin1").size(), 10000u);
}

TEST(Utils, ToUtf8PassThrough) {
    EXPECT_EQ(to_utf8("caf\xC3\xA9", "utf-8"), "caf\xC3\xA9");
    EXPECT_EQ(to_utf8("caf\xC3\xA9", "UTF8"), "caf\xC3\xA9");
    EXPECT_EQ(to_utf8("\xFF", "x-no-such-charset"), "\xFF");
}

TEST(Utils, ToUtf8ReplacesUndecodableBytes) {
    EXPECT_EQ(to_utf8("a\xFF" "b", "us-ascii"), "a\xEF\xBF\xBD" "b");
}

TEST(Utils, WriteMethodsAnyCase) {
    EXPECT_TRUE(is_write_method("POST"));
    EXPECT_TRUE(is_write_method("put"));
    EXPECT_TRUE(is_write_method("Patch"));
    EXPECT_FALSE(is_write_method("GET"));
    EXPECT_FALSE(is_write_method("delete"));
    EXPECT_FALSE(is_write_method(""));
}

// =============================================================================
// HTTP dates
// =============================================================================
TEST(HttpDate, Epoch) {
    EXPECT_EQ(http_date(0), "Thu, 01 Jan 1970 00:00:00 GMT");
}

TEST(HttpDate, KnownInstant) {
    EXPECT_EQ(http_date(1700000000), "Tue, 14 Nov 2023 22:13:20 GMT");
}

// =============================================================================
// URL join
// =============================================================================
TEST(UrlJoin, RelativeAgainstPath) {
    EXPECT_EQ(urljoin("/x", "y"), "/y");
    EXPECT_EQ(urljoin("/a/b", "c"), "/a/c");
    EXPECT_EQ(urljoin("/a/b/", "c"), "/a/b/c");
}

TEST(UrlJoin, DotSegments) {
    EXPECT_EQ(urljoin("/a/b/c", "../d"), "/a/d");
    EXPECT_EQ(urljoin("/a/b/c", "./d"), "/a/b/d");
    EXPECT_EQ(urljoin("/a/b", "../../../d"), "/d");
}

TEST(UrlJoin, AbsoluteReferencesPassThrough) {
    EXPECT_EQ(urljoin("/a/b", "http://other.example/z"), "http://other.example/z");
    EXPECT_EQ(urljoin("/a/b", "/root"), "/root");
}

TEST(UrlJoin, QueryOnlyKeepsPath) {
    EXPECT_EQ(urljoin("/a/b", "?q=1"), "/a/b?q=1");
    EXPECT_EQ(urljoin("/a/b?old=1", "#frag"), "/a/b?old=1#frag");
}

TEST(UrlJoin, EmptyInputs) {
    EXPECT_EQ(urljoin("", "y"), "y");
    EXPECT_EQ(urljoin("/a", ""), "/a");
}

TEST(UrlJoin, NetworkPathReference) {
    EXPECT_EQ(urljoin("http://h/a/b", "//other/c"), "http://other/c");
}

// =============================================================================
// OrderedMap
// =============================================================================
TEST(OrderedMap, OverwriteKeepsPosition) {
    wa::OrderedMap<int> m{{"a", 1}, {"b", 2}};
    m.set("a", 3);
    ASSERT_EQ(m.keys().size(), 2u);
    EXPECT_EQ(m.keys()[0], "a");
    EXPECT_EQ(m.at("a"), 3);
}

TEST(OrderedMap, MissingKeyIsNull) {
    wa::OrderedMap<int> m;
    EXPECT_EQ(m.get("nope"), nullptr);
    EXPECT_THROW(m.at("nope"), std::out_of_range);
}

TEST(OrderedMap, EraseReindexes) {
    wa::OrderedMap<int> m{{"a", 1}, {"b", 2}, {"c", 3}};
    EXPECT_TRUE(m.erase("a"));
    EXPECT_FALSE(m.erase("a"));
    ASSERT_NE(m.get("c"), nullptr);
    EXPECT_EQ(*m.get("c"), 3);
    EXPECT_EQ(m.size(), 2u);
}
