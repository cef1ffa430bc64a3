/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <process_lock.h>
#include <util.h>

#include <cerrno>

namespace Pep {

const std::string INHIBIT_REASON = "User requested keep-awake";

const std::string APPLICATION_NAME = "pep";

constexpr std::chrono::milliseconds ProcessLock::TERMINATE_TIMEOUT;

ProcessLock::ProcessLock(ProcessLauncher& launcher)
    : m_launcher(launcher)
{}

std::vector<std::string> ProcessLock::InhibitCommand()
{
    return {"systemd-inhibit",
            "--what=idle:sleep",
            "--who=" + APPLICATION_NAME,
            "--why=" + INHIBIT_REASON,
            "--mode=block",
            "sleep",
            "infinity"};
}

bool ProcessLock::Start()
{
    if (m_process) {
        log("WARNING: %s: Inhibitor already running (pid %i).",
            __func__,
            m_process->Pid());
        return false;
    }

    try {
        m_process = m_launcher.Spawn(InhibitCommand());
    } catch (const ProcessException& e) {
        if (e.error_number() == ENOENT) {
            error_log("%s: systemd-inhibit not found. Is systemd installed?",
                      __func__);
        } else {
            error_log("%s: Failed to start inhibitor: %s",
                      __func__,
                      e.what());
        }

        return false;
    }

    log("INFO: %s: Inhibitor enabled (pid %i).",
        __func__,
        m_process->Pid());

    return true;
}

bool ProcessLock::Stop()
{
    if (!m_process) {
        return false;
    }

    m_process->Terminate();

    if (!m_process->WaitFor(TERMINATE_TIMEOUT)) {
        log("WARNING: %s: Inhibitor (pid %i) did not respond to SIGTERM, forcing kill.",
            __func__,
            m_process->Pid());

        m_process->Kill();
        m_process->Wait();
    }

    m_process.reset();

    log("INFO: %s: Inhibitor disabled.",
        __func__);

    return true;
}

bool ProcessLock::IsActive()
{
    return m_process && m_process->IsRunning();
}

void ProcessLock::Cleanup()
{
    if (IsActive()) {
        Stop();
    }
}

bool ProcessLock::ReapIfExited()
{
    if (!m_process || m_process->IsRunning()) {
        return false;
    }

    log("WARNING: %s: Inhibitor process (pid %i) exited on its own, releasing handle.",
        __func__,
        m_process->Pid());

    m_process.reset();

    return true;
}

bool ProcessLock::HasHandle() const
{
    return m_process != nullptr;
}

pid_t ProcessLock::Pid() const
{
    return m_process ? m_process->Pid() : -1;
}

} // namespace Pep
