/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <inhibitor.h>
#include <util.h>

namespace Pep {

InhibitorCoordinator::InhibitorCoordinator(ProcessLauncher& launcher, ScreenSaverBus& bus, CommandRunner& runner)
    : m_process_lock(launcher)
    , m_screen_guard(bus, runner)
{}

bool InhibitorCoordinator::Enable()
{
    if (m_process_lock.IsActive()) {
        log("WARNING: %s: Inhibitor already running.",
            __func__);
        return false;
    }

    if (!m_process_lock.Start()) {
        return false;
    }

    // Best effort. Keep-awake is on as soon as the lock is held.
    m_screen_guard.Engage();

    return true;
}

bool InhibitorCoordinator::Disable()
{
    if (!m_process_lock.IsActive()) {
        log("WARNING: %s: Inhibitor not running.",
            __func__);
        return false;
    }

    m_screen_guard.Disengage();
    m_process_lock.Stop();

    return true;
}

bool InhibitorCoordinator::IsActive()
{
    return m_process_lock.IsActive();
}

bool InhibitorCoordinator::IsScreenGuarded() const
{
    return m_screen_guard.IsEngaged();
}

void InhibitorCoordinator::Cleanup()
{
    m_screen_guard.Disengage();

    if (m_process_lock.IsActive()) {
        Disable();
    } else {
        m_process_lock.ReapIfExited();
    }
}

const ProcessLock& InhibitorCoordinator::GetProcessLock() const
{
    return m_process_lock;
}

const ScreenBlankGuard& InhibitorCoordinator::GetScreenGuard() const
{
    return m_screen_guard;
}

} // namespace Pep
