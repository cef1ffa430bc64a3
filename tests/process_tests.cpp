/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <process.h>
#include <util.h>

#include <cerrno>
#include <csignal>

using Pep::CommandResult;
using Pep::PosixCommandRunner;
using Pep::PosixProcessLauncher;

namespace {
constexpr std::chrono::milliseconds SHORT_TIMEOUT(5000);
} // anonymous namespace

// ============================================================================
// CommandResult
// ============================================================================

TEST(CommandResult, Succeeded)
{
    EXPECT_TRUE(CommandResult(CommandResult::EXITED, 0, {}).Succeeded());
    EXPECT_FALSE(CommandResult(CommandResult::EXITED, 1, {}).Succeeded());
    EXPECT_FALSE(CommandResult(CommandResult::NOT_FOUND, 0, {}).Succeeded());
    EXPECT_FALSE(CommandResult(CommandResult::TIMED_OUT, 0, {}).Succeeded());
    EXPECT_FALSE(CommandResult().Succeeded());
}

TEST(CommandResult, StatusToString)
{
    EXPECT_EQ(CommandResult::StatusToString(CommandResult::EXITED), "EXITED");
    EXPECT_EQ(CommandResult::StatusToString(CommandResult::NOT_FOUND), "NOT_FOUND");
    EXPECT_EQ(CommandResult::StatusToString(CommandResult::SPAWN_FAILED), "SPAWN_FAILED");
    EXPECT_EQ(CommandResult::StatusToString(CommandResult::TIMED_OUT), "TIMED_OUT");
    EXPECT_EQ(CommandResult::StatusToString(CommandResult::SIGNALED), "SIGNALED");
}

TEST(CommandResult, ToString)
{
    EXPECT_EQ(CommandResult(CommandResult::EXITED, 2, {}).ToString(), "exited with code 2");
    EXPECT_EQ(CommandResult(CommandResult::NOT_FOUND, 2, {}).ToString(), "executable not found");
    EXPECT_EQ(CommandResult(CommandResult::SIGNALED, 9, {}).ToString(), "terminated by signal 9");
}

TEST(FormatCommandLine, JoinsWithSpaces)
{
    EXPECT_EQ(Pep::FormatCommandLine({"xset", "s", "off", "-dpms"}), "xset s off -dpms");
    EXPECT_EQ(Pep::FormatCommandLine({}), "");
}

// ============================================================================
// PosixCommandRunner
// ============================================================================

TEST(PosixCommandRunner, CapturesStdout)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "echo hello; echo world"}, SHORT_TIMEOUT);

    EXPECT_EQ(result.m_status, CommandResult::EXITED);
    EXPECT_EQ(result.m_exit_code, 0);
    EXPECT_EQ(result.m_output, "hello\nworld\n");
    EXPECT_TRUE(result.Succeeded());
}

TEST(PosixCommandRunner, StderrIsDiscarded)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "echo oops >&2"}, SHORT_TIMEOUT);

    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.m_output, "");
}

TEST(PosixCommandRunner, ReportsExitCode)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "exit 3"}, SHORT_TIMEOUT);

    EXPECT_EQ(result.m_status, CommandResult::EXITED);
    EXPECT_EQ(result.m_exit_code, 3);
    EXPECT_FALSE(result.Succeeded());
}

TEST(PosixCommandRunner, MissingExecutable)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"pep-test-no-such-executable"}, SHORT_TIMEOUT);

    EXPECT_EQ(result.m_status, CommandResult::NOT_FOUND);
    EXPECT_EQ(result.m_exit_code, ENOENT);
}

TEST(PosixCommandRunner, EmptyCommandLine)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({}, SHORT_TIMEOUT);

    EXPECT_EQ(result.m_status, CommandResult::SPAWN_FAILED);
}

TEST(PosixCommandRunner, TimeoutKillsCommand)
{
    PosixCommandRunner runner;

    auto start = std::chrono::steady_clock::now();
    CommandResult result = runner.Run({"sleep", "10"}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.m_status, CommandResult::TIMED_OUT);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(PosixCommandRunner, TimeoutKeepsPartialOutput)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "echo started; sleep 10"}, std::chrono::milliseconds(500));

    EXPECT_EQ(result.m_status, CommandResult::TIMED_OUT);
    EXPECT_EQ(result.m_output, "started\n");
}

TEST(PosixCommandRunner, ReportsSignal)
{
    PosixCommandRunner runner;

    CommandResult result = runner.Run({"sh", "-c", "kill -TERM $$"}, SHORT_TIMEOUT);

    EXPECT_EQ(result.m_status, CommandResult::SIGNALED);
    EXPECT_EQ(result.m_exit_code, SIGTERM);
}

// ============================================================================
// PosixProcessLauncher
// ============================================================================

TEST(PosixProcessLauncher, SpawnAndTerminate)
{
    PosixProcessLauncher launcher;

    std::unique_ptr<Pep::ChildProcess> child = launcher.Spawn({"sleep", "30"});

    ASSERT_NE(child, nullptr);
    EXPECT_GT(child->Pid(), 0);
    EXPECT_TRUE(child->IsRunning());

    child->Terminate();

    EXPECT_TRUE(child->WaitFor(std::chrono::milliseconds(2000)));
    EXPECT_FALSE(child->IsRunning());
}

TEST(PosixProcessLauncher, TerminateReachesGrandchild)
{
    PosixProcessLauncher launcher;

    // The shell does not exec the last command because of the trailing "; true", so sleep is a grandchild.
    std::unique_ptr<Pep::ChildProcess> child = launcher.Spawn({"sh", "-c", "sleep 30; true"});

    ASSERT_TRUE(child->IsRunning());

    child->Terminate();

    EXPECT_TRUE(child->WaitFor(std::chrono::milliseconds(2000)));
}

TEST(PosixProcessLauncher, KillAndWait)
{
    PosixProcessLauncher launcher;

    std::unique_ptr<Pep::ChildProcess> child = launcher.Spawn({"sleep", "30"});

    child->Kill();
    child->Wait();

    EXPECT_FALSE(child->IsRunning());

    // Signals to a reaped child are ignored.
    child->Terminate();
    child->Kill();
}

TEST(PosixProcessLauncher, WaitForTimesOut)
{
    PosixProcessLauncher launcher;

    std::unique_ptr<Pep::ChildProcess> child = launcher.Spawn({"sleep", "30"});

    EXPECT_FALSE(child->WaitFor(std::chrono::milliseconds(50)));
    EXPECT_TRUE(child->IsRunning());

    // The handle kills and reaps the child on destruction.
}

TEST(PosixProcessLauncher, ExitedChildIsNotRunning)
{
    PosixProcessLauncher launcher;

    std::unique_ptr<Pep::ChildProcess> child = launcher.Spawn({"true"});

    EXPECT_TRUE(child->WaitFor(std::chrono::milliseconds(2000)));
    EXPECT_FALSE(child->IsRunning());
}

TEST(PosixProcessLauncher, MissingExecutableThrows)
{
    PosixProcessLauncher launcher;

    try {
        launcher.Spawn({"pep-test-no-such-executable"});
        FAIL() << "Expected ProcessException";
    } catch (const ProcessException& e) {
        EXPECT_EQ(e.error_number(), ENOENT);
    }
}

TEST(PosixProcessLauncher, EmptyCommandLineThrows)
{
    PosixProcessLauncher launcher;

    EXPECT_THROW(launcher.Spawn({}), ProcessException);
}
