/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <gtest/gtest.h>
#include <inhibitor.h>

#include "fakes.h"

#include <cerrno>
#include <string>
#include <vector>

using Pep::CommandResult;
using Pep::GuardDBusEngaged;
using Pep::GuardFallbackEngaged;
using Pep::InhibitorCoordinator;

class InhibitorCoordinatorTest : public ::testing::Test
{
protected:
    FakeProcessLauncher m_launcher;
    FakeScreenSaverBus m_bus;
    FakeCommandRunner m_runner;
};

// ============================================================================
// Enable / Disable
// ============================================================================

TEST_F(InhibitorCoordinatorTest, EnableWithDBus)
{
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    EXPECT_TRUE(coordinator.Enable());

    EXPECT_TRUE(coordinator.IsActive());
    EXPECT_TRUE(coordinator.IsScreenGuarded());
    EXPECT_TRUE(std::holds_alternative<GuardDBusEngaged>(coordinator.GetScreenGuard().GetState()));
    EXPECT_TRUE(m_runner.m_calls.empty());
}

TEST_F(InhibitorCoordinatorTest, EnableIsIdempotent)
{
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    EXPECT_FALSE(coordinator.Enable());

    EXPECT_EQ(m_launcher.m_spawned.size(), 1u);
    EXPECT_EQ(m_bus.m_inhibit_calls, 1);
    EXPECT_TRUE(coordinator.IsActive());
}

TEST_F(InhibitorCoordinatorTest, EnableFailsWithoutLock)
{
    m_launcher.m_fail_errno = ENOENT;
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    EXPECT_FALSE(coordinator.Enable());

    EXPECT_FALSE(coordinator.IsActive());
    // The screen guard is only engaged once the lock is held.
    EXPECT_EQ(m_bus.m_inhibit_calls, 0);
    EXPECT_FALSE(coordinator.IsScreenGuarded());
}

TEST_F(InhibitorCoordinatorTest, DisableWhenInactive)
{
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    EXPECT_FALSE(coordinator.Disable());
    EXPECT_TRUE(m_bus.m_uninhibit_cookies.empty());
}

TEST_F(InhibitorCoordinatorTest, DisableReleasesEverything)
{
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    auto record = m_launcher.m_last;

    EXPECT_TRUE(coordinator.Disable());

    EXPECT_FALSE(coordinator.IsActive());
    EXPECT_FALSE(coordinator.IsScreenGuarded());
    ASSERT_EQ(m_bus.m_uninhibit_cookies.size(), 1u);
    EXPECT_EQ(m_bus.m_uninhibit_cookies[0], 7u);
    EXPECT_EQ(record->m_terminate_calls, 1);
    EXPECT_FALSE(coordinator.GetProcessLock().HasHandle());
}

TEST_F(InhibitorCoordinatorTest, DisableReleasesScreenGuardBeforeLock)
{
    std::vector<std::string> events;
    m_launcher.m_event_log = &events;
    m_bus.m_event_log = &events;
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    ASSERT_TRUE(coordinator.Disable());

    const std::vector<std::string> expected = {"Spawn", "Inhibit", "UnInhibit(7)", "Terminate", "WaitFor(2000ms)"};
    EXPECT_EQ(events, expected);
}

TEST_F(InhibitorCoordinatorTest, ToggleCycle)
{
    m_bus.m_cookie = 7;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    ASSERT_TRUE(coordinator.Disable());
    ASSERT_TRUE(coordinator.Enable());

    EXPECT_TRUE(coordinator.IsActive());
    EXPECT_EQ(m_launcher.m_spawned.size(), 2u);
    EXPECT_EQ(m_bus.m_inhibit_calls, 2);
}

// ============================================================================
// Fallback and degraded screen guard
// ============================================================================

TEST_F(InhibitorCoordinatorTest, XsetFallbackRoundTrip)
{
    m_runner.SetResponse("xset q", CommandResult(CommandResult::EXITED, 0, XSET_Q_OUTPUT));
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    EXPECT_TRUE(std::holds_alternative<GuardFallbackEngaged>(coordinator.GetScreenGuard().GetState()));
    EXPECT_EQ(m_runner.CountCalls("xset s off -dpms"), 1);

    ASSERT_TRUE(coordinator.Disable());
    EXPECT_EQ(m_runner.CountCalls("xset dpms 600 600 600"), 1);
    EXPECT_EQ(m_runner.CountCalls("xset s 600"), 1);
    EXPECT_FALSE(coordinator.IsScreenGuarded());
}

TEST_F(InhibitorCoordinatorTest, ActiveWithoutScreenGuard)
{
    m_runner.m_all_missing = true;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    EXPECT_TRUE(coordinator.Enable());

    // Keep-awake reflects the process lock only.
    EXPECT_TRUE(coordinator.IsActive());
    EXPECT_FALSE(coordinator.IsScreenGuarded());

    EXPECT_TRUE(coordinator.Disable());
    EXPECT_FALSE(coordinator.IsActive());
}

// ============================================================================
// Cleanup
// ============================================================================

TEST_F(InhibitorCoordinatorTest, CleanupWhenActive)
{
    m_bus.m_cookie = 3;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    auto record = m_launcher.m_last;

    coordinator.Cleanup();

    EXPECT_FALSE(coordinator.IsActive());
    EXPECT_FALSE(coordinator.IsScreenGuarded());
    EXPECT_EQ(record->m_terminate_calls, 1);
    // The guard is released once only, not again by Disable().
    EXPECT_EQ(m_bus.m_uninhibit_cookies.size(), 1u);
}

TEST_F(InhibitorCoordinatorTest, CleanupWhenInactive)
{
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    coordinator.Cleanup();

    EXPECT_FALSE(coordinator.IsActive());
    EXPECT_TRUE(m_bus.m_uninhibit_cookies.empty());
    EXPECT_TRUE(m_runner.m_calls.empty());
}

TEST_F(InhibitorCoordinatorTest, CleanupAfterExternalKill)
{
    m_runner.SetResponse("xset q", CommandResult(CommandResult::EXITED, 0, XSET_Q_OUTPUT));
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    auto record = m_launcher.m_last;

    // systemd-inhibit killed from outside pep.
    record->m_running = false;

    EXPECT_FALSE(coordinator.IsActive());
    EXPECT_TRUE(coordinator.IsScreenGuarded());

    coordinator.Cleanup();

    // The stranded xset override is restored and the dead handle dropped.
    EXPECT_FALSE(coordinator.IsScreenGuarded());
    EXPECT_EQ(m_runner.CountCalls("xset dpms 600 600 600"), 1);
    EXPECT_EQ(record->m_terminate_calls, 0);
    EXPECT_FALSE(coordinator.GetProcessLock().HasHandle());

    // Keep-awake can be turned on again.
    EXPECT_TRUE(coordinator.Enable());
    EXPECT_EQ(m_launcher.m_spawned.size(), 2u);
}

TEST_F(InhibitorCoordinatorTest, EnableAfterExternalKillWithoutCleanup)
{
    m_bus.m_cookie = 5;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());
    m_launcher.m_last->m_running = false;

    // The dead handle is still held, so the lock refuses to start a second one until it is reaped.
    EXPECT_FALSE(coordinator.Enable());

    coordinator.Cleanup();

    EXPECT_TRUE(coordinator.Enable());
    EXPECT_TRUE(coordinator.IsActive());
}

TEST_F(InhibitorCoordinatorTest, CleanupTwiceIsHarmless)
{
    m_bus.m_cookie = 3;
    InhibitorCoordinator coordinator(m_launcher, m_bus, m_runner);

    ASSERT_TRUE(coordinator.Enable());

    coordinator.Cleanup();
    coordinator.Cleanup();

    EXPECT_EQ(m_bus.m_uninhibit_cookies.size(), 1u);
    EXPECT_EQ(m_launcher.m_last->m_terminate_calls, 1);
}
