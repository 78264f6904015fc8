#include "utils/StringUtils.hpp"

#include <gtest/gtest.h>

using trackdl::utils::StringUtils;

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::trim("  flac \n"), "flac");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
    EXPECT_EQ(StringUtils::toLower("DeBuG"), "debug");
}

TEST(StringUtilsTest, ReplaceAllHandlesRepeatsAndEmptyPattern) {
    EXPECT_EQ(StringUtils::replaceAll("{id}/{id}", "{id}", "7"), "7/7");
    EXPECT_EQ(StringUtils::replaceAll("aaa", "a", "aa"), "aaaaaa");
    EXPECT_EQ(StringUtils::replaceAll("abc", "", "x"), "abc");
}

TEST(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::formatBytes(512), "512 B");
    EXPECT_EQ(StringUtils::formatBytes(1536), "1.5 KB");
    EXPECT_EQ(StringUtils::formatBytes(10 * 1024 * 1024), "10.0 MB");
}

TEST(StringUtilsTest, SanitizeFileNameNeverEscapesDirectory) {
    EXPECT_EQ(StringUtils::sanitizeFileName("track-01_v2.flac"), "track-01_v2.flac");
    EXPECT_EQ(StringUtils::sanitizeFileName("a/b\\c:d"), "a_b_c_d");
    EXPECT_EQ(StringUtils::sanitizeFileName(""), "_");
    EXPECT_EQ(StringUtils::sanitizeFileName("."), "_");
    EXPECT_EQ(StringUtils::sanitizeFileName(".."), "_");
}
