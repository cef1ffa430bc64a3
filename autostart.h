/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef AUTOSTART_H
#define AUTOSTART_H

#include <process.h>

#include <chrono>
#include <optional>
#include <string>

namespace Pep {

//!
//! \brief The AutostartUnit class enables or disables the pep systemd user unit.
//!
class AutostartUnit
{
public:
    static constexpr std::chrono::milliseconds COMMAND_TIMEOUT {10000};

    AutostartUnit(CommandRunner& runner, std::string unit_name = "pep.service");

    //!
    //! \brief Runs systemctl --user enable|disable on the unit.
    //! \return true if systemctl succeeded.
    //!
    bool SetEnabled(bool enabled);

    //!
    //! \brief Runs systemctl --user is-enabled on the unit.
    //! \return whether the unit is enabled, or std::nullopt if systemctl could not be run or did not finish.
    //!
    std::optional<bool> IsEnabled();

private:
    CommandRunner& m_runner;
    std::string m_unit_name;
};

} // namespace Pep

#endif // AUTOSTART_H
