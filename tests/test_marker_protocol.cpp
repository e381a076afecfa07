#include <gtest/gtest.h>
#include <session/marker_protocol.hpp>

TEST(MarkerProtocol, MarkersCarrySessionAndCallNumber) {
    auto m = MarkerSet::for_call("abc", 7);
    EXPECT_EQ(m.command_end, "__CMD_END_abc_7__");
    EXPECT_EQ(m.stderr_end, "__STDERR_END_abc_7__");
    EXPECT_EQ(m.exit_code, "__EXIT_abc_7__");
}

TEST(MarkerProtocol, MarkersDifferPerCall) {
    auto a = MarkerSet::for_call("abc", 1);
    auto b = MarkerSet::for_call("abc", 2);
    auto c = MarkerSet::for_call("xyz", 1);
    EXPECT_NE(a.command_end, b.command_end);
    EXPECT_NE(a.command_end, c.command_end);
}

TEST(MarkerProtocol, BuildSingleLineCommand) {
    auto m = MarkerSet::for_call("s", 1);
    EXPECT_EQ(build_local_command("echo hi", m),
              "echo hi; echo '__EXIT_s_1__ '$?; echo '__CMD_END_s_1__'; "
              "printf '__STDERR_END_s_1__' > /dev/stderr\n");
}

TEST(MarkerProtocol, BuildTrimsTrailingWhitespace) {
    auto m = MarkerSet::for_call("s", 1);
    EXPECT_EQ(build_local_command("ls -la  \n", m).substr(0, 8), "ls -la; ");
}

TEST(MarkerProtocol, EmptyCommandBecomesTrue) {
    auto m = MarkerSet::for_call("s", 2);
    EXPECT_EQ(build_local_command("   ", m).substr(0, 6), "true; ");
    EXPECT_EQ(effective_command(""), "true");
    EXPECT_EQ(effective_command("pwd "), "pwd");
}

TEST(MarkerProtocol, MultiLineCommandGetsMarkersOnNewLine) {
    auto m = MarkerSet::for_call("s", 3);
    std::string built = build_local_command("cat <<EOF\nline\nEOF", m);
    EXPECT_EQ(built.substr(0, 24), "cat <<EOF\nline\nEOF\necho ");
}

TEST(MarkerProtocol, ExtractExitCode) {
    auto m = MarkerSet::for_call("s", 1);
    auto r = extract_exit_code("hello\n__EXIT_s_1__ 0\n", m, "s");
    EXPECT_TRUE(r.found);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.output, "hello\n");
}

TEST(MarkerProtocol, ExtractNonZeroMultiDigit) {
    auto m = MarkerSet::for_call("s", 4);
    auto r = extract_exit_code("__EXIT_s_4__ 127\n", m, "s");
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_EQ(r.output, "");
}

TEST(MarkerProtocol, ExitLineIsRemovedWhole) {
    auto m = MarkerSet::for_call("s", 1);
    auto r = extract_exit_code("first\npartial__EXIT_s_1__ 3\nafter\n", m, "s");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.output, "first\nafter\n");
}

TEST(MarkerProtocol, MissingExitMarkerDefaultsToOne) {
    auto m = MarkerSet::for_call("s", 1);
    auto r = extract_exit_code("just output\n", m, "s");
    EXPECT_FALSE(r.found);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.output, "just output\n");
}

TEST(MarkerProtocol, UnparsableStatusIsOne) {
    auto m = MarkerSet::for_call("s", 1);
    auto r = extract_exit_code("__EXIT_s_1__ abc\n", m, "s");
    EXPECT_TRUE(r.found);
    EXPECT_EQ(r.exit_code, 1);
}

TEST(MarkerProtocol, StaleOutputOfEarlierCallIsDropped) {
    auto m = MarkerSet::for_call("s", 2);
    auto r = extract_exit_code("old\n__EXIT_s_1__ 0\n__CMD_END_s_1__\nnew\n__EXIT_s_2__ 0\n", m, "s");
    EXPECT_EQ(r.output, "new\n");
    EXPECT_EQ(r.exit_code, 0);
}

TEST(MarkerProtocol, StrayExitLineIsTruncated) {
    auto m = MarkerSet::for_call("s", 2);
    auto r = extract_exit_code("x\n__EXIT_s_1__ 0\n__EXIT_s_2__ 5\n", m, "s");
    EXPECT_EQ(r.output, "x\n");
    EXPECT_EQ(r.exit_code, 5);
}

TEST(MarkerProtocol, OtherSessionsMarkersAreUntouched) {
    auto m = MarkerSet::for_call("s", 1);
    auto r = extract_exit_code("__CMD_END_t_9__\nhi\n__EXIT_s_1__ 0\n", m, "s");
    EXPECT_EQ(r.output, "__CMD_END_t_9__\nhi\n");
}

TEST(MarkerProtocol, StripStaleOutput) {
    EXPECT_EQ(strip_stale_output("abc", "__STDERR_END_s_"), "abc");
    EXPECT_EQ(strip_stale_output("late\n__STDERR_END_s_3__err", "__STDERR_END_s_"), "err");
    EXPECT_EQ(strip_stale_output("a__STDERR_END_s_1__b__STDERR_END_s_2__\r\nc", "__STDERR_END_s_"), "c");
    // Incomplete marker is not a boundary
    EXPECT_EQ(strip_stale_output("x__STDERR_END_s_y", "__STDERR_END_s_"), "x__STDERR_END_s_y");
}
