/**
 * @file test_format_tools.cpp
 * @brief Unit tests for the string and duration helpers in format_tools.
 */
#include "utils/format_tools.hpp"

#include <gtest/gtest.h>

using namespace mqttop::format_tools;
using namespace std::chrono_literals;

// ============================================================================
// Durations
// ============================================================================

TEST(FormatToolsTest, ParseDurationAcceptsGoStyleUnits)
{
    EXPECT_EQ(parse_duration("2s"), 2000ms);
    EXPECT_EQ(parse_duration("500ms"), 500ms);
    EXPECT_EQ(parse_duration("1m30s"), 90s);
    EXPECT_EQ(parse_duration("1h"), 3600s);
    EXPECT_EQ(parse_duration("1.5s"), 1500ms);
    EXPECT_EQ(parse_duration("0"), 0ms);
    EXPECT_EQ(parse_duration(" 10s "), 10s);
    EXPECT_EQ(parse_duration("2000us"), 2ms);
}

TEST(FormatToolsTest, ParseDurationRejectsMalformedInput)
{
    EXPECT_FALSE(parse_duration(""));
    EXPECT_FALSE(parse_duration("10"));
    EXPECT_FALSE(parse_duration("s"));
    EXPECT_FALSE(parse_duration("5 days"));
    EXPECT_FALSE(parse_duration("1.2.3s"));
    EXPECT_FALSE(parse_duration("-1s"));
}

TEST(FormatToolsTest, FormatDurationIsReadable)
{
    EXPECT_EQ(format_duration(0ms), "0s");
    EXPECT_EQ(format_duration(250ms), "250ms");
    EXPECT_EQ(format_duration(2s), "2s");
    EXPECT_EQ(format_duration(1500ms), "1.5s");
    EXPECT_EQ(format_duration(90s), "1m30s");
    EXPECT_EQ(format_duration(3661s), "1h1m1s");
}

// ============================================================================
// Strings
// ============================================================================

TEST(FormatToolsTest, ExtractValueFromString)
{
    EXPECT_EQ(extract_value_from_string("b", "a=1; b = two ;c=3"), "two");
    EXPECT_FALSE(extract_value_from_string("d", "a=1; b=2").has_value());

    const std::string os_release = "NAME=\"Debian GNU/Linux\"\nPRETTY_NAME=\"Debian 12\"\n";
    EXPECT_EQ(extract_value_from_string("PRETTY_NAME", os_release, '\n'), "\"Debian 12\"");
}

TEST(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(trim_whitespace("  abc \n\t"), "abc");
    EXPECT_EQ(trim_whitespace(""), "");
    EXPECT_EQ(trim_whitespace("   "), "");
}

TEST(FormatToolsTest, TitleCase)
{
    EXPECT_EQ(title_case("my-host box"), "My-Host Box");
    EXPECT_EQ(title_case("raspberrypi"), "Raspberrypi");
    EXPECT_EQ(title_case(""), "");
}

TEST(FormatToolsTest, FilenameOnlyIsConstexpr)
{
    static_assert(filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("plain.cpp"), "plain.cpp");
}
