// tests/test_utils.cpp
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include "utils.h"

using namespace TvBridge;

namespace {

const std::string REPLACEMENT = "\xEF\xBF\xBD";

Bytes bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

}  // namespace

TEST(DecodeUtf8Lossy, PassesValidTextThrough) {
    std::string text = "Fernseher \xC3\xA4\xE2\x82\xAC\xF0\x9F\x93\xBA ok";
    EXPECT_EQ(decode_utf8_lossy(bytes(text)), text);
}

TEST(DecodeUtf8Lossy, ReplacesInvalidBytes) {
    EXPECT_EQ(decode_utf8_lossy(bytes("a\xFF" "b")), "a" + REPLACEMENT + "b");
    EXPECT_EQ(decode_utf8_lossy(bytes("\x80")), REPLACEMENT);
}

TEST(DecodeUtf8Lossy, ReplacesTruncatedSequenceAtEnd) {
    EXPECT_EQ(decode_utf8_lossy(bytes("ok\xE2\x82")), "ok" + REPLACEMENT + REPLACEMENT);
}

TEST(DecodeUtf8Lossy, RejectsOverlongAndSurrogates) {
    EXPECT_EQ(decode_utf8_lossy(bytes("\xC0\xAF")), REPLACEMENT + REPLACEMENT);
    EXPECT_EQ(decode_utf8_lossy(bytes("\xED\xA0\x80")), REPLACEMENT + REPLACEMENT + REPLACEMENT);
}

TEST(DecodeUtf8Lossy, KeepsEmbeddedNul) {
    Bytes data = {'a', 0x00, 'b'};
    std::string out = decode_utf8_lossy(data);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[1], '\0');
}

TEST(SplitLines, StripsCarriageReturnsAndTrailingBlankLines) {
    auto lines = split_lines("one\r\ntwo\n\nthree\n\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "three");
}

TEST(SplitLines, EmptyInputHasNoLines) {
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Trim, RemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  \tvalue\r\n"), "value");
    EXPECT_EQ(trim(" \n "), "");
}

TEST(JoinArgs, SeparatesWithSpaces) {
    EXPECT_EQ(join_args({"-s", "serial", "shell", "ls"}), "-s serial shell ls");
    EXPECT_EQ(join_args({}), "");
}

TEST(ParseInt, AcceptsWholeNumbersOnly) {
    EXPECT_EQ(parse_int(" 2500 "), std::optional<int>(2500));
    EXPECT_EQ(parse_int("-5"), std::optional<int>(-5));
    EXPECT_FALSE(parse_int("25ms").has_value());
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("99999999999").has_value());
}

TEST(ParseBool, KnownWordsOnly) {
    EXPECT_EQ(parse_bool("yes"), std::optional<bool>(true));
    EXPECT_EQ(parse_bool("off"), std::optional<bool>(false));
    EXPECT_FALSE(parse_bool("maybe").has_value());
}
