// =============================================================================
// Unit tests for process_runner.hpp
// =============================================================================
#include <gtest/gtest.h>
#include <string>
#include "process_runner.hpp"
#include "fakes/fake_process_runner.hpp"

using namespace marionette;
using marionette::fakes::FakeProcessRunner;

// ---------------------------------------------------------------------------
// buildCommandLine
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, PlainArgumentsAreNotQuoted) {
    EXPECT_EQ(buildCommandLine({"MuMuManager.exe", "info", "-v", "all"}),
              "MuMuManager.exe info -v all");
}

TEST(ProcessRunnerTest, ArgumentsWithSpacesAreQuoted) {
    EXPECT_EQ(buildCommandLine({"C:\\Program Files\\adb.exe", "shell", "input tap 1 2"}),
              "\"C:\\Program Files\\adb.exe\" shell \"input tap 1 2\"");
}

TEST(ProcessRunnerTest, EmbeddedQuotesAreEscaped) {
    EXPECT_EQ(buildCommandLine({"x", "say \"hi\""}), "x \"say \\\"hi\\\"\"");
}

TEST(ProcessRunnerTest, TrailingBackslashesDoubledBeforeClosingQuote) {
    EXPECT_EQ(buildCommandLine({"C:\\dir with space\\"}), "\"C:\\dir with space\\\\\"");
}

TEST(ProcessRunnerTest, EmptyArgumentIsQuoted) {
    EXPECT_EQ(buildCommandLine({"a", ""}), "a \"\"");
}

// ---------------------------------------------------------------------------
// describeCommand
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, DescribeStripsDirectoryAndPayload) {
    std::vector<std::string> argv = {"C:\\MuMu\\shell\\MuMuManager.exe", "adb", "-v", "2",
                                     "-c", "shell input text secret"};
    EXPECT_EQ(describeCommand(argv), "MuMuManager.exe adb -v 2 -c ...");
}

TEST(ProcessRunnerTest, DescribeShortCommand) {
    EXPECT_EQ(describeCommand({"/usr/bin/adb", "devices"}), "adb devices");
    EXPECT_EQ(describeCommand({}), "(empty)");
}

// ---------------------------------------------------------------------------
// runChecked
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, RunCheckedTurnsNonZeroExitIntoError) {
    FakeProcessRunner runner;
    runner.on("fail", 3, "boom");

    auto r = runChecked(runner, {"tool", "fail"}, 1000);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProcessError::Kind::NonZeroExit);
    EXPECT_EQ(r.error().code, 3);
}

TEST(ProcessRunnerTest, RunCheckedPassesSuccessThrough) {
    FakeProcessRunner runner;
    runner.on("ok", 0, "done");

    auto r = runChecked(runner, {"tool", "ok"}, 1000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().output, "done");
    EXPECT_EQ(runner.timeouts.back(), 1000);
}

TEST(ProcessRunnerTest, RunCheckedPassesSpawnErrorsThrough) {
    FakeProcessRunner runner;
    runner.fail("tool", ProcessError::Kind::Timeout, "timed out");

    auto r = runChecked(runner, {"tool"}, 50);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProcessError::Kind::Timeout);
}

// ---------------------------------------------------------------------------
// HiddenProcessRunner
// ---------------------------------------------------------------------------
TEST(ProcessRunnerTest, EmptyExecutableIsNotFound) {
    HiddenProcessRunner runner;
    auto r = runner.run({""}, 1000);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProcessError::Kind::NotFound);
}

TEST(ProcessRunnerTest, MissingExecutableIsNotFound) {
    HiddenProcessRunner runner;
    auto r = runner.run({"__marionette_no_such_binary__"}, 2000);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProcessError::Kind::NotFound);
}

#ifndef _WIN32
TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    HiddenProcessRunner runner;
    auto r = runner.run({"sh", "-c", "echo hello; exit 4"}, 5000);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().output, "hello");
    EXPECT_EQ(r.value().exit_code, 4);
}

TEST(ProcessRunnerTest, KillsOnTimeout) {
    HiddenProcessRunner runner;
    auto r = runner.run({"sleep", "5"}, 200);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ProcessError::Kind::Timeout);
}

TEST(ProcessRunnerTest, OutputWrittenRightBeforeExitIsKept) {
    HiddenProcessRunner runner;
    auto r = runner.run({"sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done"},
                        10000);
    ASSERT_TRUE(r.is_ok());
    const std::string& out = r.value().output;
    EXPECT_EQ(out.rfind("line0\n", 0), 0u);
    ASSERT_GE(out.size(), 8u);
    EXPECT_EQ(out.substr(out.size() - 8), "line1999");
}
#else
TEST(ProcessRunnerTest, OutputWrittenRightBeforeExitIsKept) {
    HiddenProcessRunner runner;
    auto r = runner.run({"cmd", "/c", "for /L %i in (1,1,2000) do @echo line%i"}, 10000);
    ASSERT_TRUE(r.is_ok());
    const std::string& out = r.value().output;
    ASSERT_GE(out.size(), 8u);
    EXPECT_EQ(out.substr(out.size() - 8), "line2000");
}
#endif

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
