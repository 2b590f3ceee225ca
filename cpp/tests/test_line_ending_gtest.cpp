// ==============================================================================
// test_line_ending_gtest.cpp - Тесты маркеров конца строки (GoogleTest)
// ==============================================================================

#include "wsformat/line_ending.hpp"

#include <gtest/gtest.h>
#include <string>

namespace wsformat::test {

// ==============================================================================
// Классификация байтов
// ==============================================================================

TEST(LineEndingTest, IsWhitespaceByte) {
    for (char byte : std::string(" \t\r\n\x0B\x0C")) {
        EXPECT_TRUE(is_whitespace_byte(byte)) << static_cast<int>(byte);
    }
    EXPECT_FALSE(is_whitespace_byte('a'));
    EXPECT_FALSE(is_whitespace_byte('\0'));
    EXPECT_FALSE(is_whitespace_byte('\xA0'));
}

TEST(LineEndingTest, ByteToEscape) {
    EXPECT_EQ(byte_to_escape('\r'), "\\r");
    EXPECT_EQ(byte_to_escape('\n'), "\\n");
    EXPECT_EQ(byte_to_escape('\t'), "\\t");
    EXPECT_EQ(byte_to_escape(VERTICAL_TAB), "\\v");
    EXPECT_EQ(byte_to_escape(FORM_FEED), "\\f");
    EXPECT_EQ(byte_to_escape(' '), " ");
    EXPECT_EQ(byte_to_escape('x'), "?");
}

TEST(LineEndingTest, BytesAndEscapes) {
    EXPECT_EQ(line_ending_bytes(LineEnding::Linux), "\n");
    EXPECT_EQ(line_ending_bytes(LineEnding::MacOs), "\r");
    EXPECT_EQ(line_ending_bytes(LineEnding::Windows), "\r\n");

    EXPECT_EQ(line_ending_to_escape(LineEnding::Linux), "\\n");
    EXPECT_EQ(line_ending_to_escape(LineEnding::MacOs), "\\r");
    EXPECT_EQ(line_ending_to_escape(LineEnding::Windows), "\\r\\n");
}

// ==============================================================================
// Самый частый маркер
// ==============================================================================

TEST(LineEndingTest, MostCommon_SingleMarkers) {
    EXPECT_EQ(find_most_common_line_ending(""), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("hello world"), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("\n"), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("\r"), LineEnding::MacOs);
    EXPECT_EQ(find_most_common_line_ending("\r\n"), LineEnding::Windows);
}

TEST(LineEndingTest, MostCommon_Majority) {
    EXPECT_EQ(find_most_common_line_ending("a\rb\nc\n"), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("a\rb\rc\r\n"), LineEnding::MacOs);
    EXPECT_EQ(find_most_common_line_ending("a\r\nb\r\nc\n"), LineEnding::Windows);
}

TEST(LineEndingTest, MostCommon_Ties) {
    // Linux > Windows > MacOs
    EXPECT_EQ(find_most_common_line_ending("\n\n\r\r\r\n\r\n"), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("\n\r\r\r\n\r\n"), LineEnding::Windows);
    EXPECT_EQ(find_most_common_line_ending("\n\r\r\r\n"), LineEnding::MacOs);
    EXPECT_EQ(find_most_common_line_ending("a\r\nb\nc\rd"), LineEnding::Linux);
    EXPECT_EQ(find_most_common_line_ending("a\r\nb\rc"), LineEnding::Windows);
}

TEST(LineEndingTest, Resolve_ExplicitModeIgnoresContent) {
    EXPECT_EQ(resolve_line_ending(LineEndingMode::Linux, "\r\n\r\n"), LineEnding::Linux);
    EXPECT_EQ(resolve_line_ending(LineEndingMode::MacOs, "\n"), LineEnding::MacOs);
    EXPECT_EQ(resolve_line_ending(LineEndingMode::Windows, ""), LineEnding::Windows);
    EXPECT_EQ(resolve_line_ending(LineEndingMode::Auto, "\r\r\n\r"), LineEnding::MacOs);
}

}  // namespace wsformat::test
