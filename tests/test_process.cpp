#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include "../include/Process.hpp"
#include "TmpDir.hpp"

using namespace prefixrun;

TEST(PosixLauncher, ReturnsExitStatus) {
    PosixLauncher launcher;
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "exit 0"}, ""), 0);
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "exit 3"}, ""), 3);
}

TEST(PosixLauncher, NonZeroExitIsNotAFailureByDefault) {
    PosixLauncher launcher;
    EXPECT_NO_THROW((void) launcher.spawn_and_wait({"sh", "-c", "exit 1"}, ""));
}

TEST(PosixLauncher, StrictModeRaisesOnNonZeroExit) {
    PosixLauncher launcher(true);
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "exit 0"}, ""), 0);
    try {
        (void) launcher.spawn_and_wait({"sh", "-c", "exit 4"}, "");
        FAIL() << "expected InvocationFailure";
    } catch (const InvocationFailure &e) {
        ASSERT_TRUE(e.status().has_value());
        EXPECT_EQ(*e.status(), 4);
    }
}

TEST(PosixLauncher, SignalReportedAs128Plus) {
    PosixLauncher launcher;
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "kill -9 $$"}, ""), 128 + 9);
}

TEST(PosixLauncher, MissingInterpreterIsInvocationFailure) {
    PosixLauncher launcher;
    EXPECT_THROW((void) launcher.spawn_and_wait({"prefixrun-no-such-interpreter", "x"}, ""), InvocationFailure);
}

TEST(PosixLauncher, ChildExit127IsStillAnExitStatus) {
    // a real 127 from the child must not look like a failed exec
    PosixLauncher launcher;
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "exit 127"}, ""), 127);
}

TEST(PosixLauncher, EmptyCommandThrows) {
    PosixLauncher launcher;
    EXPECT_THROW((void) launcher.spawn_and_wait({}, ""), InvocationFailure);
}

TEST(PosixLauncher, RunsInRequestedDirectory) {
    const test_support::TmpDir dir;
    PosixLauncher launcher;
    EXPECT_EQ(launcher.spawn_and_wait({"sh", "-c", "pwd > where.txt"}, dir.str()), 0);
    std::ifstream in(dir.path / "where.txt");
    std::string where;
    std::getline(in, where);
    EXPECT_EQ(std::filesystem::canonical(where).string(), std::filesystem::canonical(dir.path).string());
}

TEST(PosixLauncher, BadDirectoryIsInvocationFailure) {
    PosixLauncher launcher;
    EXPECT_THROW((void) launcher.spawn_and_wait({"sh", "-c", "true"}, "/nonexistent/prefixrun"), InvocationFailure);
}

TEST(Process, JoinCommand) {
    EXPECT_EQ(join_command({"hive", "-f", "/tmp/2-build.hql"}), "hive -f /tmp/2-build.hql");
    EXPECT_EQ(join_command({"bash", "my file.sh"}), "bash 'my file.sh'");
}
