#include <gtest/gtest.h>
#include "pairlink/core/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace pairlink::core::utils;
using namespace std::chrono_literals;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    EXPECT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");

    auto empty = StringUtils::split("", ',');
    EXPECT_EQ(empty.size(), 1);
    EXPECT_EQ(empty[0], "");
}

TEST_F(StringUtilsTest, SplitWhitespace) {
    auto result = StringUtils::split_whitespace("  progress\tin-1   42 ");
    ASSERT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "progress");
    EXPECT_EQ(result[1], "in-1");
    EXPECT_EQ(result[2], "42");

    EXPECT_TRUE(StringUtils::split_whitespace("   ").empty());
}

TEST_F(StringUtilsTest, Join) {
    std::vector<std::string> parts = {"a", "b", "c"};
    EXPECT_EQ(StringUtils::join(parts, ","), "a,b,c");

    std::vector<std::string> empty;
    EXPECT_EQ(StringUtils::join(empty, ","), "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
    EXPECT_EQ(StringUtils::trim("x"), "x");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("hello world", "world"));
    EXPECT_TRUE(StringUtils::starts_with("test", "test"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatRate) {
    EXPECT_EQ(StringUtils::format_rate(2048.0), "2.00 KB/s");
    EXPECT_EQ(StringUtils::format_rate(0.0), "0.00 B/s");
    EXPECT_EQ(StringUtils::format_rate(-5.0), "0.00 B/s");
}

TEST_F(StringUtilsTest, FormatRateSaturates) {
    auto max_bytes = StringUtils::format_bytes(std::numeric_limits<size_t>::max());

    EXPECT_EQ(StringUtils::format_rate(1e30), max_bytes + "/s");
    EXPECT_EQ(StringUtils::format_rate(std::numeric_limits<double>::infinity()), max_bytes + "/s");
    EXPECT_EQ(StringUtils::format_rate(std::numeric_limits<double>::quiet_NaN()), "0.00 B/s");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(250ms), "250ms");
    EXPECT_EQ(StringUtils::format_duration(12s), "12s");
    EXPECT_EQ(StringUtils::format_duration(125s), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(3h + 4min), "3h 4m");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));

    std::ofstream file(test_file);
    file << "test";
    file.close();

    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, ReadLines) {
    std::ofstream file(test_file, std::ios::binary);
    file << "first\r\nsecond\n\nfourth";
    file.close();

    auto lines = FileUtils::read_lines(test_file);
    ASSERT_TRUE(lines.has_value());
    ASSERT_EQ(lines->size(), 4);
    EXPECT_EQ((*lines)[0], "first");
    EXPECT_EQ((*lines)[1], "second");
    EXPECT_EQ((*lines)[2], "");
    EXPECT_EQ((*lines)[3], "fourth");
}

TEST_F(FileUtilsTest, ReadLinesMissingFile) {
    EXPECT_FALSE(FileUtils::read_lines("no_such_file.txt").has_value());
}

TEST_F(FileUtilsTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();

    EXPECT_EQ(FileUtils::expand_home("~/.pairlink.conf"), home / ".pairlink.conf");
    EXPECT_EQ(FileUtils::expand_home("/etc/pairlink.conf"), std::filesystem::path("/etc/pairlink.conf"));
}
