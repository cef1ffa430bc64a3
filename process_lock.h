/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PROCESS_LOCK_H
#define PROCESS_LOCK_H

#include <process.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace Pep {

//!
//! \brief Reason string shown by systemd-inhibit --list and passed to the screensaver service.
//!
extern const std::string INHIBIT_REASON;

//!
//! \brief Application name used as --who for systemd-inhibit and as the application for the screensaver service.
//!
extern const std::string APPLICATION_NAME;

//!
//! \brief The ProcessLock class holds the system sleep/idle inhibitor. The lock is a systemd-inhibit process in block
//! mode running "sleep infinity", so the lock is held for exactly as long as that process lives. The handle is present
//! if and only if a spawn succeeded and no Stop() (or ReapIfExited()) has completed since.
//!
class ProcessLock
{
public:
    //!
    //! \brief Time allowed for the inhibitor process to exit after SIGTERM before it is killed.
    //!
    static constexpr std::chrono::milliseconds TERMINATE_TIMEOUT {2000};

    explicit ProcessLock(ProcessLauncher& launcher);

    ProcessLock(const ProcessLock&) = delete;
    ProcessLock& operator=(const ProcessLock&) = delete;

    //!
    //! \brief Starts the inhibitor process.
    //! \return true if the process was started. false if a handle is already held, systemd-inhibit is not installed,
    //! or the spawn failed for another reason.
    //!
    bool Start();

    //!
    //! \brief Stops the inhibitor process: SIGTERM, then SIGKILL if it has not exited within TERMINATE_TIMEOUT.
    //! \return false if no handle is held, true otherwise.
    //!
    bool Stop();

    //!
    //! \brief Non-blocking check whether the inhibitor process is held and still running.
    //!
    bool IsActive();

    //!
    //! \brief Stops the inhibitor process if it is active. Safe to call unconditionally at shutdown.
    //!
    void Cleanup();

    //!
    //! \brief Drops the handle of an inhibitor process that exited on its own (for example killed externally).
    //! \return true if a dead handle was released.
    //!
    bool ReapIfExited();

    //!
    //! \brief True if a handle is held, whether or not the process is still alive.
    //!
    bool HasHandle() const;

    //!
    //! \brief Pid of the held process, -1 if none.
    //!
    pid_t Pid() const;

    //!
    //! \brief The command line used for the inhibitor process.
    //!
    static std::vector<std::string> InhibitCommand();

private:
    ProcessLauncher& m_launcher;

    std::unique_ptr<ChildProcess> m_process;
};

} // namespace Pep

#endif // PROCESS_LOCK_H
