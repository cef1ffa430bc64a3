/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SCREEN_GUARD_H
#define SCREEN_GUARD_H

#include <dbus_screensaver.h>
#include <process.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Pep {

//!
//! \brief The DpmsBaseline struct holds the display power management and screensaver timeouts (seconds) in effect
//! before the xset fallback overrode them.
//!
struct DpmsBaseline
{
    int m_standby = 0;
    int m_suspend = 0;
    int m_off = 0;
    int m_screensaver_timeout = 0;

    bool operator==(const DpmsBaseline& other) const;

    std::string ToString() const;
};

//!
//! \brief Parses the output of "xset q" for the DPMS Standby/Suspend/Off triple and the screensaver timeout.
//! \param output stdout of xset q
//! \return the baseline if at least one of the two settings was found (the other fields are 0), std::nullopt if
//! neither was found.
//!
std::optional<DpmsBaseline> ParseXsetQuery(const std::string& output);

//! \brief Screen blanking is not prevented.
struct GuardInactive
{
};

//! \brief Screen blanking is prevented by an org.freedesktop.ScreenSaver inhibit identified by m_cookie.
struct GuardDBusEngaged
{
    uint32_t m_cookie = 0;
};

//! \brief Screen blanking is prevented by xset. m_baseline is what to restore, if it could be captured.
struct GuardFallbackEngaged
{
    std::optional<DpmsBaseline> m_baseline;
};

typedef std::variant<GuardInactive, GuardDBusEngaged, GuardFallbackEngaged> ScreenGuardState;

//!
//! \brief The ScreenBlankGuard class prevents the screen from blanking. Engage() tries the strategies in order,
//! stopping at the first one that succeeds:
//!
//! DBUS: org.freedesktop.ScreenSaver.Inhibit on the session bus.
//! XSET: capture the current settings with "xset q", then "xset s off -dpms". Disengage() puts the captured settings
//!       back, or re-enables the defaults if they could not be captured.
//!
//! A failed Engage() leaves the guard inactive and is not reported beyond the log: screen blanking is then simply
//! not prevented. Disengage() always returns the guard to inactive.
//!
class ScreenBlankGuard
{
public:
    enum Strategy {
        DBUS,
        XSET
    };

    //!
    //! \brief Timeout applied to each xset invocation.
    //!
    static constexpr std::chrono::milliseconds COMMAND_TIMEOUT {5000};

    ScreenBlankGuard(ScreenSaverBus& bus,
                     CommandRunner& runner,
                     std::vector<Strategy> strategy_order = {DBUS, XSET});

    ScreenBlankGuard(const ScreenBlankGuard&) = delete;
    ScreenBlankGuard& operator=(const ScreenBlankGuard&) = delete;

    //!
    //! \brief Prevents screen blanking with the first strategy that works. No-op if already engaged.
    //! \return true if the guard is engaged afterwards.
    //!
    bool Engage();

    //!
    //! \brief Releases whatever Engage() did and returns to inactive. No-op if inactive. Failures are logged only.
    //!
    void Disengage();

    bool IsEngaged() const;

    const ScreenGuardState& GetState() const;

    static std::string StrategyToString(const Strategy& strategy);

    //!
    //! \brief Returns a short representation of the state for logs and the state file, e.g. "dbus:7",
    //! "xset:600/600/600/600", "xset:defaults" or "inactive".
    //!
    std::string StateToString() const;

private:
    ScreenSaverBus& m_bus;
    CommandRunner& m_runner;
    std::vector<Strategy> m_strategy_order;

    ScreenGuardState m_state;

    std::optional<ScreenGuardState> TryEngage(const Strategy& strategy);
    std::optional<ScreenGuardState> TryEngageDBus();
    std::optional<ScreenGuardState> TryEngageXset();

    void ReleaseDBus(const GuardDBusEngaged& engaged);
    void ReleaseXset(const GuardFallbackEngaged& engaged);

    //!
    //! \brief Runs an xset command line, logging a warning on failure.
    //! \return true if it exited 0.
    //!
    bool RunXset(const std::vector<std::string>& argv);
};

} // namespace Pep

#endif // SCREEN_GUARD_H
