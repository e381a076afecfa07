#include <gtest/gtest.h>
#include <session/completion_detector.hpp>
#include "fakes.hpp"

using namespace std::chrono_literals;

static const std::vector<std::string> kFast = {"cd", "ls", "pwd"};
static const Clock::time_point kNoDeadline = Clock::time_point::max();

TEST(CompletionDetector, AllFastCommands) {
    EXPECT_TRUE(all_fast_commands({"cd /tmp", "ls -la"}, kFast));
    EXPECT_FALSE(all_fast_commands({"cd /tmp", "make"}, kFast));
    EXPECT_FALSE(all_fast_commands({"", "  "}, kFast));
    EXPECT_TRUE(all_fast_commands({"", "pwd"}, kFast));
}

TEST(ProcessTableDetector, RunningCommandIsNotExited) {
    FakeClock clock;
    ProcessTableDetector detector(
        [] { return std::vector<std::string>{"/bin/bash -l -m", "sleep 5"}; },
        kFast, clock, 300ms);
    EXPECT_FALSE(detector.has_exited("sleep 5", kNoDeadline));
}

TEST(ProcessTableDetector, ArgumentsMayFollowTheClause) {
    FakeClock clock;
    ProcessTableDetector detector(
        [] { return std::vector<std::string>{"python train.py --epochs 3"}; },
        kFast, clock, 300ms);
    EXPECT_FALSE(detector.has_exited("python train.py", kNoDeadline));
}

TEST(ProcessTableDetector, PrefixOfLongerArgumentIsNotAMatch) {
    FakeClock clock;
    ProcessTableDetector detector(
        [] { return std::vector<std::string>{"sleep 50"}; },
        kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("sleep 5", kNoDeadline));
}

TEST(ProcessTableDetector, AnyRunningClauseKeepsWaiting) {
    FakeClock clock;
    ProcessTableDetector detector(
        [] { return std::vector<std::string>{"  make all  "}; },
        kFast, clock, 300ms);
    EXPECT_FALSE(detector.has_exited("cd build && make all", kNoDeadline));
    EXPECT_TRUE(detector.has_exited("cd build && make test", kNoDeadline));
}

TEST(ProcessTableDetector, FastCommandsSkipTheProcessTable) {
    FakeClock clock;
    int listings = 0;
    ProcessTableDetector detector(
        [&listings] {
            listings++;
            return std::vector<std::string>{"cd /tmp"};
        },
        kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("cd /tmp && ls", kNoDeadline));
    EXPECT_EQ(listings, 0);
    EXPECT_EQ(clock.elapsed(), 300ms);
}

TEST(ProcessTableDetector, EmptyCommandHasExited) {
    FakeClock clock;
    ProcessTableDetector detector([] { return std::vector<std::string>{""}; }, kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("", kNoDeadline));
}

TEST(RemoteProcessDetector, MatchesLineEndingWithClause) {
    FakeClock clock;
    RemoteProcessDetector detector(
        [] { return std::string("COMMAND\n-bash\n/usr/bin/python train.py\n"); },
        kFast, clock, 300ms);
    EXPECT_FALSE(detector.has_exited("python train.py", kNoDeadline));
}

TEST(RemoteProcessDetector, ExitedWhenNoLineEndsWithClause) {
    FakeClock clock;
    RemoteProcessDetector detector(
        [] { return std::string("COMMAND\npython train.py --epochs 3\n"); },
        kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("python train.py", kNoDeadline));
}

TEST(RemoteProcessDetector, SingleWordClausesCountAsFast) {
    FakeClock clock;
    int listings = 0;
    RemoteProcessDetector detector(
        [&listings] {
            listings++;
            return std::string("make\n");
        },
        kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("make", kNoDeadline));
    EXPECT_TRUE(detector.has_exited("ls -la", kNoDeadline));
    EXPECT_EQ(listings, 0);
    EXPECT_EQ(clock.elapsed(), 600ms);
}

TEST(ProcessTableDetector, FastDelayStopsAtTheDeadline) {
    FakeClock clock;
    ProcessTableDetector detector([] { return std::vector<std::string>{}; }, kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("pwd", clock.now() + 120ms));
    EXPECT_EQ(clock.elapsed(), 120ms);
    EXPECT_TRUE(detector.has_exited("pwd", clock.now() - 1ms));
    EXPECT_EQ(clock.elapsed(), 120ms);
}

TEST(RemoteProcessDetector, FastDelayStopsAtTheDeadline) {
    FakeClock clock;
    RemoteProcessDetector detector([] { return std::string(); }, kFast, clock, 300ms);
    EXPECT_TRUE(detector.has_exited("ls", clock.now() + 50ms));
    EXPECT_EQ(clock.elapsed(), 50ms);
}
