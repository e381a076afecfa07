#include <gtest/gtest.h>
#include <core/session_id.hpp>
#include <core/utils.hpp>

TEST(Utils, StripColorSequences) {
    EXPECT_EQ(strip_escape_sequences("\x1b[31mred\x1b[0m"), "red");
    EXPECT_EQ(strip_escape_sequences("\x1b[01;34mdir\x1b[0m/"), "dir/");
}

TEST(Utils, StripPrivateModeAndTwoByteEscapes) {
    EXPECT_EQ(strip_escape_sequences("\x1b[?2004hprompt"), "prompt");
    EXPECT_EQ(strip_escape_sequences("a\x1b" "Mb"), "ab");
}

TEST(Utils, IncompleteEscapeIsKept) {
    EXPECT_EQ(strip_escape_sequences("x\x1b"), "x\x1b");
    EXPECT_EQ(strip_escape_sequences("plain text"), "plain text");
}

TEST(Utils, SplitOn) {
    EXPECT_EQ(split_on("a && b&&c", "&&"), (std::vector<std::string>{"a ", " b", "c"}));
    EXPECT_EQ(split_on("abc", "&&"), (std::vector<std::string>{"abc"}));
    EXPECT_EQ(split_on("", "&&"), (std::vector<std::string>{""}));
}

TEST(Utils, SplitOnAny) {
    EXPECT_EQ(split_on_any("a; b && c", {"&&", ";"}),
              (std::vector<std::string>{"a", " b ", " c"}));
}

TEST(Utils, SplitLines) {
    EXPECT_EQ(split_lines("a\nb\n"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Utils, TrimHelpers) {
    EXPECT_EQ(trimmed("  x y \r\n"), "x y");
    EXPECT_EQ(rtrimmed("  x  \n"), "  x");
    EXPECT_EQ(first_token("  tail -f log"), "tail");
    EXPECT_EQ(first_token("   "), "");
    EXPECT_EQ(to_lower("HtOp"), "htop");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("abc", 7), 7);
    EXPECT_EQ(safe_stoi("", -1), -1);
}

TEST(Utils, SessionIdsAreUnique) {
    auto a = generate_session_id();
    auto b = generate_session_id();
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 16u);
}
