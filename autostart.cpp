/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <autostart.h>
#include <util.h>

namespace Pep {

constexpr std::chrono::milliseconds AutostartUnit::COMMAND_TIMEOUT;

AutostartUnit::AutostartUnit(CommandRunner& runner, std::string unit_name)
    : m_runner(runner)
    , m_unit_name(std::move(unit_name))
{}

bool AutostartUnit::SetEnabled(bool enabled)
{
    std::vector<std::string> argv = {"systemctl", "--user", enabled ? "enable" : "disable", m_unit_name};

    CommandResult result = m_runner.Run(argv, COMMAND_TIMEOUT);

    if (result.m_status == CommandResult::NOT_FOUND) {
        error_log("%s: systemctl not found. Is systemd installed?",
                  __func__);
        return false;
    }

    if (!result.Succeeded()) {
        error_log("%s: Failed to toggle autostart: \"%s\" %s",
                  __func__,
                  FormatCommandLine(argv),
                  result.ToString());
        return false;
    }

    log("INFO: %s: Autostart %s.",
        __func__,
        enabled ? "enabled" : "disabled");

    return true;
}

std::optional<bool> AutostartUnit::IsEnabled()
{
    CommandResult result = m_runner.Run({"systemctl", "--user", "is-enabled", m_unit_name}, COMMAND_TIMEOUT);

    // is-enabled exits nonzero for a disabled or unknown unit.
    if (result.m_status != CommandResult::EXITED) {
        debug_log("INFO: %s: Cannot query autostart state of %s: %s",
                  __func__,
                  m_unit_name,
                  result.ToString());
        return std::nullopt;
    }

    return result.m_exit_code == 0;
}

} // namespace Pep
