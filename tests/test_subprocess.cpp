#include <gtest/gtest.h>

#include <csignal>
#include <thread>
#include "subprocess.hpp"

using namespace std::chrono_literals;

TEST(ChildProcess, CapturesStderrAndExitCode) {
    SpawnOptions options;
    options.captureStderr = true;
    auto child = ChildProcess::spawn({"/bin/sh", "-c", "echo out; echo 'adb: error: failed' >&2; exit 3"}, options);
    ASSERT_TRUE(child.has_value()) << child.error();

    FdLineSource source(child->takeStderr());
    std::string line;
    ASSERT_TRUE(source.nextLine(line));
    EXPECT_EQ(line, "adb: error: failed");
    EXPECT_FALSE(source.nextLine(line));

    EXPECT_EQ(child->wait(), 3);
    EXPECT_FALSE(child->isRunning());
    EXPECT_EQ(child->exitCode(), 3);
}

TEST(ChildProcess, ReportsExecFailure) {
    auto child = ChildProcess::spawn({"/nonexistent/device-archiver-adb"});
    ASSERT_FALSE(child.has_value());
    EXPECT_NE(child.error().find("Failed to execute"), std::string::npos);
}

TEST(ChildProcess, RejectsEmptyCommand) {
    auto child = ChildProcess::spawn({});
    EXPECT_FALSE(child.has_value());
}

TEST(ChildProcess, TerminateStopsLongRunningChild) {
    auto child = ChildProcess::spawn({"sleep", "30"});
    ASSERT_TRUE(child.has_value()) << child.error();
    EXPECT_TRUE(child->isRunning());

    auto begin = std::chrono::steady_clock::now();
    child->terminate(1s);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_FALSE(child->isRunning());
    EXPECT_EQ(child->exitCode(), 128 + SIGTERM);
}

TEST(ChildProcess, TerminateEscalatesToKill) {
    auto child = ChildProcess::spawn({"/bin/sh", "-c", "trap '' TERM; while :; do sleep 1; done"});
    ASSERT_TRUE(child.has_value()) << child.error();
    std::this_thread::sleep_for(200ms);

    child->terminate(300ms);
    EXPECT_FALSE(child->isRunning());
    EXPECT_EQ(child->exitCode(), 128 + SIGKILL);
}

TEST(ChildProcess, WaitForTimesOut) {
    auto child = ChildProcess::spawn({"sleep", "5"});
    ASSERT_TRUE(child.has_value()) << child.error();
    EXPECT_FALSE(child->waitFor(50ms));
    child->terminate(1s);
}

TEST(RunCommand, CollectsStdout) {
    auto result = runCommand({"/bin/sh", "-c", "printf 'List of devices attached\\nabc\\tdevice\\n'"}, 5s);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->output, "List of devices attached\nabc\tdevice\n");
}

TEST(RunCommand, ReportsNonZeroExit) {
    auto result = runCommand({"/bin/sh", "-c", "exit 7"}, 5s);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->exitCode, 7);
}

TEST(RunCommand, TimesOut) {
    auto begin = std::chrono::steady_clock::now();
    auto result = runCommand({"sleep", "10"}, 200ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("timed out"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}
