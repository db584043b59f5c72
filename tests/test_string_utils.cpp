/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string helpers
 */

#include <gtest/gtest.h>

#include "utils/StringUtils.hpp"

namespace lockerfetch::test {

using utils::StringUtils;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(StringUtils::trim("  https://bunkr.sk/f/abc \r\n"), "https://bunkr.sk/f/abc");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
}

TEST(StringUtilsTest, SplitAndJoin) {
    auto parts = StringUtils::split("media-files.bunkr.ru", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "bunkr");
    EXPECT_EQ(StringUtils::join(parts, "."), "media-files.bunkr.ru");
}

TEST(StringUtilsTest, PrefixAndSuffix) {
    EXPECT_TRUE(StringUtils::startsWith("HTTP/1.1 200 OK", "HTTP/"));
    EXPECT_FALSE(StringUtils::startsWith("HT", "HTTP/"));
    EXPECT_TRUE(StringUtils::endsWith("cdn.cyberdrop.me", ".cyberdrop.me"));
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::formatBytes(512), "512 B");
    EXPECT_EQ(StringUtils::formatBytes(1536), "1.50 KB");
    EXPECT_EQ(StringUtils::formatBytes(5 * 1024 * 1024), "5.00 MB");
}

TEST(StringUtilsTest, FormatRateOfZeroIsZero) {
    EXPECT_EQ(StringUtils::formatRate(0.0), "0 B/s");
    EXPECT_EQ(StringUtils::formatRate(2048.0), "2.00 KB/s");
}

TEST(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::formatDuration(std::chrono::milliseconds(3723000)), "01:02:03");
}

TEST(StringUtilsTest, SanitizeFileNameReplacesIllegalCharacters) {
    EXPECT_EQ(StringUtils::sanitizeFileName("a<b>c:d\"e/f\\g|h?i*j'k.mp4"), "a-b-c-d-e-f-g-h-i-j-k.mp4");
    EXPECT_EQ(StringUtils::sanitizeFileName("clip\x01.mp4"), "clip-.mp4");
}

TEST(StringUtilsTest, SanitizeFileNameNeverReturnsEmpty) {
    EXPECT_EQ(StringUtils::sanitizeFileName(""), "unnamed");
    EXPECT_EQ(StringUtils::sanitizeFileName(".."), "unnamed");
}

TEST(StringUtilsTest, ParseNumbersWithDefaults) {
    EXPECT_EQ(StringUtils::parseLong(" 1048576 "), 1048576);
    EXPECT_EQ(StringUtils::parseLong("abc", -1), -1);
    EXPECT_EQ(StringUtils::parseLong("99999999999999999999999", -1), -1);
    EXPECT_DOUBLE_EQ(StringUtils::parseDouble("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(StringUtils::parseDouble("", 2.0), 2.0);
}

TEST(StringUtilsTest, Truncate) {
    EXPECT_EQ(StringUtils::truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::truncate("abc", 6), "abc");
}

} // namespace lockerfetch::test
