/**
 * @file test_url_utils.cpp
 * @brief Unit tests for URL helpers
 */

#include <gtest/gtest.h>

#include "utils/UrlUtils.hpp"

namespace lockerfetch::test {

using utils::UrlUtils;

TEST(UrlUtilsTest, EnsureSchemeAddsHttps) {
    EXPECT_EQ(UrlUtils::ensureScheme("bunkr.sk/f/abc"), "https://bunkr.sk/f/abc");
    EXPECT_EQ(UrlUtils::ensureScheme("//cyberdrop.me/f/x"), "https://cyberdrop.me/f/x");
    EXPECT_EQ(UrlUtils::ensureScheme("http://example.com"), "http://example.com");
}

TEST(UrlUtilsTest, HostIsLowercasedWithoutPortOrCredentials) {
    EXPECT_EQ(UrlUtils::host("https://user:pw@Media.Bunkr.RU:8443/file.mp4"), "media.bunkr.ru");
    EXPECT_EQ(UrlUtils::host("not a url"), "");
}

TEST(UrlUtilsTest, PathDropsQueryAndFragment) {
    EXPECT_EQ(UrlUtils::path("https://bunkr.sk/f/abc?x=1#top"), "/f/abc");
    EXPECT_EQ(UrlUtils::path("https://bunkr.sk"), "/");
    EXPECT_EQ(UrlUtils::origin("https://bunkr.sk/f/abc"), "https://bunkr.sk");
}

TEST(UrlUtilsTest, FileNameIsDecodedBasename) {
    EXPECT_EQ(UrlUtils::fileName("https://cdn.bunkr.ru/My%20Video.mp4?n=1"), "My Video.mp4");
    EXPECT_EQ(UrlUtils::fileName("https://cdn.bunkr.ru/"), "");
}

TEST(UrlUtilsTest, Validation) {
    EXPECT_TRUE(UrlUtils::isValidUrl("https://bunkr.sk/a/album"));
    EXPECT_TRUE(UrlUtils::isValidUrl("http://localhost:8080/f/x"));
    EXPECT_FALSE(UrlUtils::isValidUrl("ftp://bunkr.sk/a/album"));
    EXPECT_FALSE(UrlUtils::isValidUrl("https://"));
}

TEST(UrlUtilsTest, UnsafePaths) {
    EXPECT_TRUE(UrlUtils::hasUnsafePath("https://bunkr.sk/f/../../etc/passwd"));
    EXPECT_FALSE(UrlUtils::hasUnsafePath("https://bunkr.sk/f/abc"));
}

} // namespace lockerfetch::test
