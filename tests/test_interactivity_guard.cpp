#include <gtest/gtest.h>
#include <session/interactivity_guard.hpp>

TEST(InteractivityGuard, FollowModeTailIsInteractive) {
    InteractivityGuard guard;
    EXPECT_TRUE(guard.is_interactive("tail -f /var/log/syslog"));
}

TEST(InteractivityGuard, PlainTailIsNot) {
    InteractivityGuard guard;
    EXPECT_FALSE(guard.is_interactive("tail -n 5 /var/log/syslog"));
}

TEST(InteractivityGuard, MatchesAnyAndClause) {
    InteractivityGuard guard;
    EXPECT_TRUE(guard.is_interactive("cd /etc && vim hosts"));
}

TEST(InteractivityGuard, MatchesAnySemicolonClause) {
    InteractivityGuard guard;
    EXPECT_TRUE(guard.is_interactive("echo start; top"));
}

TEST(InteractivityGuard, CaseAndWhitespaceInsensitive) {
    InteractivityGuard guard;
    EXPECT_TRUE(guard.is_interactive("   TOP  "));
    EXPECT_TRUE(guard.is_interactive("Watch -n 1 ls"));
}

TEST(InteractivityGuard, FirstTokenMustMatchExactly) {
    InteractivityGuard guard;
    // Prefix of a longer program name
    EXPECT_FALSE(guard.is_interactive("vimdiff a b"));
    EXPECT_FALSE(guard.is_interactive("lesson"));
    // Catalog word as an argument
    EXPECT_FALSE(guard.is_interactive("echo less"));
    EXPECT_FALSE(guard.is_interactive("grep top file.txt"));
}

TEST(InteractivityGuard, EmptyCommand) {
    InteractivityGuard guard;
    EXPECT_FALSE(guard.is_interactive(""));
    EXPECT_FALSE(guard.is_interactive(" ; && "));
}

TEST(InteractivityGuard, CustomCatalog) {
    InteractivityGuard guard({"  Python ", "git rebase -i"});
    EXPECT_TRUE(guard.is_interactive("python"));
    EXPECT_FALSE(guard.is_interactive("python3 script.py"));
    EXPECT_TRUE(guard.is_interactive("git rebase -i HEAD~3"));
    EXPECT_FALSE(guard.is_interactive("git rebase main"));
    EXPECT_FALSE(guard.is_interactive("vim"));
    ASSERT_EQ(guard.catalog().size(), 2u);
    EXPECT_EQ(guard.catalog()[0], "python");
}
