/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <screen_guard.h>
#include <process_lock.h>
#include <util.h>

#include <regex>

namespace Pep {

// DpmsBaseline

bool DpmsBaseline::operator==(const DpmsBaseline& other) const
{
    return m_standby == other.m_standby
           && m_suspend == other.m_suspend
           && m_off == other.m_off
           && m_screensaver_timeout == other.m_screensaver_timeout;
}

std::string DpmsBaseline::ToString() const
{
    return tfm::format("%i/%i/%i/%i", m_standby, m_suspend, m_off, m_screensaver_timeout);
}

std::optional<DpmsBaseline> ParseXsetQuery(const std::string& output)
{
    // "  Standby: 600    Suspend: 600    Off: 600"
    static const std::regex dpms_regex("Standby:\\s+(\\d+)\\s+Suspend:\\s+(\\d+)\\s+Off:\\s+(\\d+)");
    // "  timeout:  600    cycle:  600"
    static const std::regex screensaver_regex("timeout:\\s+(\\d+)\\s+cycle:");

    DpmsBaseline baseline;
    bool dpms_found = false;
    bool screensaver_found = false;

    std::smatch match;

    if (std::regex_search(output, match, dpms_regex)) {
        try {
            baseline.m_standby = ParseStringToInt(match[1].str());
            baseline.m_suspend = ParseStringToInt(match[2].str());
            baseline.m_off = ParseStringToInt(match[3].str());
            dpms_found = true;
        } catch (const std::out_of_range&) {
            baseline.m_standby = baseline.m_suspend = baseline.m_off = 0;
        }
    }

    if (std::regex_search(output, match, screensaver_regex)) {
        try {
            baseline.m_screensaver_timeout = ParseStringToInt(match[1].str());
            screensaver_found = true;
        } catch (const std::out_of_range&) {
            baseline.m_screensaver_timeout = 0;
        }
    }

    if (!dpms_found && !screensaver_found) {
        return std::nullopt;
    }

    return baseline;
}

// ScreenBlankGuard

constexpr std::chrono::milliseconds ScreenBlankGuard::COMMAND_TIMEOUT;

ScreenBlankGuard::ScreenBlankGuard(ScreenSaverBus& bus,
                                   CommandRunner& runner,
                                   std::vector<Strategy> strategy_order)
    : m_bus(bus)
    , m_runner(runner)
    , m_strategy_order(std::move(strategy_order))
    , m_state(GuardInactive {})
{}

bool ScreenBlankGuard::Engage()
{
    if (IsEngaged()) {
        debug_log("INFO: %s: Screen blanking already inhibited (%s).",
                  __func__,
                  StateToString());
        return true;
    }

    for (const auto& strategy : m_strategy_order) {
        std::optional<ScreenGuardState> engaged = TryEngage(strategy);

        if (engaged) {
            m_state = *engaged;
            return true;
        }

        debug_log("INFO: %s: Screen blanking strategy %s did not engage.",
                  __func__,
                  StrategyToString(strategy));
    }

    log("WARNING: %s: Screen blanking prevention unavailable.",
        __func__);

    return false;
}

std::optional<ScreenGuardState> ScreenBlankGuard::TryEngage(const Strategy& strategy)
{
    switch (strategy) {
    case DBUS:
        return TryEngageDBus();
    case XSET:
        return TryEngageXset();
    }

    return std::nullopt;
}

std::optional<ScreenGuardState> ScreenBlankGuard::TryEngageDBus()
{
    std::optional<uint32_t> cookie = m_bus.Inhibit(APPLICATION_NAME, INHIBIT_REASON);

    if (!cookie) {
        debug_log("INFO: %s: D-Bus ScreenSaver inhibit failed, trying next strategy.",
                  __func__);
        return std::nullopt;
    }

    log("INFO: %s: Screen blanking inhibited via D-Bus (cookie: %u).",
        __func__,
        *cookie);

    return GuardDBusEngaged {*cookie};
}

std::optional<ScreenGuardState> ScreenBlankGuard::TryEngageXset()
{
    GuardFallbackEngaged engaged;

    CommandResult query = m_runner.Run({"xset", "q"}, COMMAND_TIMEOUT);

    switch (query.m_status) {
    case CommandResult::NOT_FOUND:
        log("WARNING: %s: xset not found, screen blanking prevention unavailable.",
            __func__);
        return std::nullopt;
    case CommandResult::EXITED:
        if (query.m_exit_code == 0) {
            engaged.m_baseline = ParseXsetQuery(query.m_output);

            if (engaged.m_baseline) {
                debug_log("INFO: %s: Saved original DPMS settings: %s",
                          __func__,
                          engaged.m_baseline->ToString());
            } else {
                debug_log("INFO: %s: No DPMS or screensaver settings found in xset q output, defaults will be "
                          "restored.",
                          __func__);
            }
        } else {
            debug_log("INFO: %s: xset q %s, defaults will be restored.",
                      __func__,
                      query.ToString());
        }
        break;
    case CommandResult::SPAWN_FAILED:
    case CommandResult::TIMED_OUT:
    case CommandResult::SIGNALED:
        log("WARNING: %s: xset fallback failed: xset q %s",
            __func__,
            query.ToString());
        return std::nullopt;
    }

    if (!RunXset({"xset", "s", "off", "-dpms"})) {
        return std::nullopt;
    }

    log("INFO: %s: Screen blanking inhibited via xset fallback.",
        __func__);

    return engaged;
}

void ScreenBlankGuard::Disengage()
{
    if (const auto* dbus_engaged = std::get_if<GuardDBusEngaged>(&m_state)) {
        ReleaseDBus(*dbus_engaged);
    } else if (const auto* fallback_engaged = std::get_if<GuardFallbackEngaged>(&m_state)) {
        ReleaseXset(*fallback_engaged);
    } else {
        return;
    }

    m_state = GuardInactive {};
}

void ScreenBlankGuard::ReleaseDBus(const GuardDBusEngaged& engaged)
{
    if (m_bus.UnInhibit(engaged.m_cookie)) {
        log("INFO: %s: Screen blanking D-Bus inhibit released (cookie: %u).",
            __func__,
            engaged.m_cookie);
    } else {
        log("WARNING: %s: Failed to release D-Bus inhibit (cookie: %u).",
            __func__,
            engaged.m_cookie);
    }
}

void ScreenBlankGuard::ReleaseXset(const GuardFallbackEngaged& engaged)
{
    if (engaged.m_baseline) {
        const DpmsBaseline& baseline = *engaged.m_baseline;

        // Both are attempted so that a failure of one does not leave the other setting overridden.
        bool dpms_restored = RunXset({"xset", "dpms",
                                      ToString(baseline.m_standby),
                                      ToString(baseline.m_suspend),
                                      ToString(baseline.m_off)});
        bool screensaver_restored = RunXset({"xset", "s", ToString(baseline.m_screensaver_timeout)});

        if (dpms_restored && screensaver_restored) {
            log("INFO: %s: Restored original DPMS settings: %s",
                __func__,
                baseline.ToString());
        }
    } else if (RunXset({"xset", "+dpms", "s", "on"})) {
        log("INFO: %s: Re-enabled DPMS with defaults.",
            __func__);
    }
}

bool ScreenBlankGuard::RunXset(const std::vector<std::string>& argv)
{
    CommandResult result = m_runner.Run(argv, COMMAND_TIMEOUT);

    if (!result.Succeeded()) {
        log("WARNING: %s: \"%s\" %s",
            __func__,
            FormatCommandLine(argv),
            result.ToString());
        return false;
    }

    return true;
}

bool ScreenBlankGuard::IsEngaged() const
{
    return !std::holds_alternative<GuardInactive>(m_state);
}

const ScreenGuardState& ScreenBlankGuard::GetState() const
{
    return m_state;
}

std::string ScreenBlankGuard::StrategyToString(const Strategy& strategy)
{
    std::string out;

    switch (strategy) {
    case DBUS:
        out = "DBUS";
        break;
    case XSET:
        out = "XSET";
        break;
    }

    return out;
}

std::string ScreenBlankGuard::StateToString() const
{
    if (const auto* dbus_engaged = std::get_if<GuardDBusEngaged>(&m_state)) {
        return "dbus:" + ToString(dbus_engaged->m_cookie);
    }

    if (const auto* fallback_engaged = std::get_if<GuardFallbackEngaged>(&m_state)) {
        return "xset:" + (fallback_engaged->m_baseline ? fallback_engaged->m_baseline->ToString()
                                                        : std::string("defaults"));
    }

    return "inactive";
}

} // namespace Pep
