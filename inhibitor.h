/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef INHIBITOR_H
#define INHIBITOR_H

#include <process_lock.h>
#include <screen_guard.h>

namespace Pep {

//!
//! \brief The InhibitorCoordinator class is the keep-awake switch. It combines the sleep/idle ProcessLock, which is
//! authoritative for whether keep-awake is on, with the best effort ScreenBlankGuard.
//!
//! It is driven from a single thread (the pep main loop). The idempotency checks below are state based and are not
//! safe against concurrent callers.
//!
class InhibitorCoordinator
{
public:
    InhibitorCoordinator(ProcessLauncher& launcher, ScreenSaverBus& bus, CommandRunner& runner);

    InhibitorCoordinator(const InhibitorCoordinator&) = delete;
    InhibitorCoordinator& operator=(const InhibitorCoordinator&) = delete;

    //!
    //! \brief Turns keep-awake on. The screen guard is only engaged once the process lock is held, and its outcome
    //! does not affect the return value.
    //! \return true if the process lock was started. false if already active or the lock could not be started.
    //!
    bool Enable();

    //!
    //! \brief Turns keep-awake off: releases the screen guard, then stops the process lock.
    //! \return false if keep-awake was not active.
    //!
    bool Disable();

    //!
    //! \brief Whether keep-awake is on. This reflects the process lock only; a screen guard that failed to engage
    //! does not make this false.
    //!
    bool IsActive();

    //!
    //! \brief Whether the screen guard is currently engaged.
    //!
    bool IsScreenGuarded() const;

    //!
    //! \brief Shutdown and recovery path. Always releases the screen guard (it may be stranded if the lock process
    //! was killed externally), then disables if still active, otherwise drops a dead lock handle.
    //!
    void Cleanup();

    const ProcessLock& GetProcessLock() const;

    const ScreenBlankGuard& GetScreenGuard() const;

private:
    ProcessLock m_process_lock;
    ScreenBlankGuard m_screen_guard;
};

} // namespace Pep

#endif // INHIBITOR_H
