#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <limits>

// ── base64 ──────────────────────────────────────────────

TEST(Utils, Base64Encode) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("hello"), "aGVsbG8=");
}

TEST(Utils, Base64DecodeSkipsWhitespace) {
    EXPECT_EQ(base64_decode("aGVs\nbG8=\n"), "hello");
    EXPECT_EQ(base64_decode("Zm9v"), "foo");
}

TEST(Utils, Base64Binary) {
    std::string bytes;
    for (int i = 0; i < 256; ++i) bytes += static_cast<char>(i);
    EXPECT_EQ(base64_decode(base64_encode(bytes)), bytes);
}

// ── Lines and words ─────────────────────────────────────

TEST(Utils, SplitLinesStripsCarriageReturns) {
    auto lines = split_lines("one\r\ntwo\n\nthree");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "three");
}

TEST(Utils, SplitLinesTrailingNewline) {
    auto lines = split_lines("a\nb\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "b");
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Utils, SplitArgs) {
    auto args = split_args("  push   --dry-run\tproj ");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "push");
    EXPECT_EQ(args[1], "--dry-run");
    EXPECT_EQ(args[2], "proj");
    EXPECT_TRUE(split_args("   ").empty());
}

// ── Numbers ─────────────────────────────────────────────

TEST(Utils, ParseInt64) {
    int64_t v = -1;
    EXPECT_TRUE(parse_int64("0", v));
    EXPECT_EQ(v, 0);
    EXPECT_TRUE(parse_int64("1700000000", v));
    EXPECT_EQ(v, 1700000000);

    v = 7;
    EXPECT_FALSE(parse_int64("", v));
    EXPECT_FALSE(parse_int64("12a", v));
    EXPECT_FALSE(parse_int64("-3", v));
    EXPECT_FALSE(parse_int64(" 4", v));
    EXPECT_EQ(v, 7);
}

TEST(Utils, ParseInt64RejectsOverflow) {
    int64_t v = 7;
    EXPECT_TRUE(parse_int64("9223372036854775807", v));
    EXPECT_EQ(v, std::numeric_limits<int64_t>::max());

    v = 7;
    EXPECT_FALSE(parse_int64("9223372036854775808", v));
    EXPECT_FALSE(parse_int64("99999999999999999999999", v));
    EXPECT_EQ(v, 7);
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope"), 0);
    EXPECT_EQ(safe_stoi("", 9), 9);
}

TEST(Utils, Trim) {
    std::string s = " \t hello world \r\n";
    trim(s);
    EXPECT_EQ(s, "hello world");
    EXPECT_EQ(trimmed("   "), "");
    EXPECT_EQ(trimmed("x"), "x");
}
