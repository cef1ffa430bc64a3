/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <pep.h>
#include <release.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>

//! Global config for pep
PepConfig g_config;

//! Global flag for signal handling
std::atomic<bool> g_shutdown_requested = false;

//!
//! \brief Main loop poll interval for the control pipe.
//!
constexpr std::chrono::milliseconds CONTROL_POLL_INTERVAL(250);

//!
//! \brief Signal handler. Only sets the flag; all cleanup is done by the main loop.
//!
void HandleSignal(int signum)
{
    (void) signum;
    g_shutdown_requested.store(true);
}

//!
//! \brief Main function for pep. Usage: pep [config file]. Without an argument the config is read from
//! $XDG_CONFIG_HOME/pep/pep.conf (or ~/.config/pep/pep.conf); a missing file means defaults.
//! \return exit code, 0 for normal, non-zero otherwise.
//!
int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");
    bool under_journal = (journal_stream != nullptr && strlen(journal_stream) > 0);

    // The journal adds its own timestamps.
    g_log_timestamps.store(!under_journal);

    // --- Configuration Loading ---
    if (argc > 2) {
        error_log("%s: Usage: %s [config file]",
                  __func__,
                  argv[0]);
        return 1;
    }

    fs::path config_file_path = (argc == 2) ? fs::path(argv[1]) : GetDefaultConfigFilePath();

    if (fs::exists(config_file_path) && fs::is_regular_file(config_file_path)) {
        log("INFO: %s: Using config from %s",
            __func__,
            config_file_path);
    } else {
        log("INFO: %s: No config file at \"%s\". Using defaults.",
            __func__,
            config_file_path.string());
    }

    try {
        g_config.ReadAndUpdateConfig(config_file_path);
    } catch (const std::exception& e) {
        error_log("%s: Failed to read/process config: %s",
                  __func__,
                  e.what());
        return 1;
    }

    try {
        g_debug = std::get<bool>(g_config.GetArg("debug"));

        if (!under_journal) {
            g_log_timestamps.store(std::get<bool>(g_config.GetArg("log_timestamps")));
        }

        log("INFO: %s: Config loaded: enabled_by_default=%s, autostart=%s",
            __func__,
            std::get<bool>(g_config.GetArg("enabled_by_default")) ? "true" : "false",
            std::get<bool>(g_config.GetArg("autostart")) ? "true" : "false");
    } catch (const std::bad_variant_access& e) {
        error_log("%s: Configuration value missing or has wrong type: %s. Using defaults where possible.",
                  __func__,
                  e.what());
    }

    // --- Signal Handling Setup ---
    struct sigaction action;
    memset(&action, 0, sizeof(struct sigaction));
    action.sa_handler = HandleSignal;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    if (sigaction(SIGINT, &action, nullptr) == -1 || sigaction(SIGTERM, &action, nullptr) == -1) {
        error_log("%s: Failed to set signal handlers: %s",
                  __func__,
                  strerror(errno));
        return 1;
    }

    std::optional<fs::path> xdg_runtime_dir = GetXdgRuntimeDir();

    if (!xdg_runtime_dir) {
        error_log("%s: XDG_RUNTIME_DIR is not set, cannot create the control pipe.",
                  __func__);
        return 1;
    }

    Pep::ControlPipe control_pipe(xdg_runtime_dir.value() / Pep::CONTROL_PIPE_NAME);

    if (!control_pipe.Open()) {
        error_log("%s: Failed to create control pipe. Exiting.",
                  __func__);
        return 1;
    }

    log("INFO: %s: pep keep-awake daemon, %s, started, pid %i",
        __func__,
        g_version,
        getpid());

    Pep::PosixProcessLauncher launcher;
    Pep::PosixCommandRunner runner;
    Pep::GDBusScreenSaverBus screensaver_bus;

    Pep::InhibitorCoordinator coordinator(launcher, screensaver_bus, runner);
    Pep::AutostartUnit autostart(runner);

    Pep::PepDaemon pep_daemon(coordinator,
                              autostart,
                              g_config,
                              config_file_path,
                              xdg_runtime_dir.value() / Pep::STATE_FILE_NAME);

    pep_daemon.Start();

    // --- Main Loop ---
    while (!g_shutdown_requested.load() && !pep_daemon.IsShutdownRequested()) {
        for (const auto& line : control_pipe.ReadLines(CONTROL_POLL_INTERVAL)) {
            pep_daemon.HandleLine(line);

            if (pep_daemon.IsShutdownRequested()) {
                break;
            }
        }

        pep_daemon.CheckLiveness();
        pep_daemon.UpdateStateFile();
    }

    log("INFO: %s: Shutdown requested. Cleaning up...",
        __func__);

    pep_daemon.Shutdown();

    log("pep shutdown complete.");

    return 0;
}
