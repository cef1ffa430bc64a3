/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PEP_H
#define PEP_H

#include <autostart.h>
#include <inhibitor.h>
#include <util.h>

#include <chrono>
#include <string>
#include <vector>

//!
//! \brief The PepConfig class. This specializes the Config class and implements the virtual method ProcessArgs()
//! for pep.
//!
class PepConfig : public Config
{
    //!
    //! \brief The is the ProcessArgs() implementation for pep. Parameters and defaults:
    //! debug = false, enabled_by_default = true, autostart = true, log_timestamps = true.
    //!
    void ProcessArgs() override;
};

namespace Pep {

//!
//! \brief Name of the control pipe in $XDG_RUNTIME_DIR.
//!
extern const std::string CONTROL_PIPE_NAME;

//!
//! \brief Name of the state file in $XDG_RUNTIME_DIR.
//!
extern const std::string STATE_FILE_NAME;

//!
//! \brief The ControlPipe class is the read end of the named pipe through which pepctl sends ControlMessages. pep
//! also holds a write descriptor on its own pipe so that the read end never sees end-of-file when a pepctl instance
//! closes it.
//!
class ControlPipe
{
public:
    explicit ControlPipe(fs::path path);

    //! \brief Closes the pipe and removes it from the file system if Open() created it.
    ~ControlPipe();

    ControlPipe(const ControlPipe&) = delete;
    ControlPipe& operator=(const ControlPipe&) = delete;

    //!
    //! \brief Creates the named pipe (mode 0600) if it does not exist, and opens it.
    //! \return true on success. Failures are logged.
    //!
    bool Open();

    //!
    //! \brief Waits up to timeout for data and returns the complete lines received. A trailing partial line is kept
    //! for the next call.
    //!
    std::vector<std::string> ReadLines(std::chrono::milliseconds timeout);

    const fs::path& Path() const;

private:
    fs::path m_path;
    int m_read_fd;
    int m_write_fd;
    std::string m_partial_line;

    void Close();
};

//!
//! \brief The PepDaemon class holds the pep main loop state and dispatches control commands to the coordinator and
//! the autostart unit. Successful toggles are persisted to the config file.
//!
class PepDaemon
{
public:
    PepDaemon(InhibitorCoordinator& coordinator,
              AutostartUnit& autostart,
              Config& config,
              fs::path config_file_path,
              fs::path state_file_path);

    //!
    //! \brief Applies the startup state: enables keep-awake if enabled_by_default is set, and takes the autostart
    //! value from the systemd unit when systemctl can report it.
    //!
    void Start();

    //!
    //! \brief Dispatches one control message. Invalid messages are logged and ignored.
    //!
    void HandleMessage(const ControlMessage& message);

    //!
    //! \brief Parses and dispatches one line received on the control pipe.
    //!
    void HandleLine(const std::string& line);

    //!
    //! \brief Detects a lock process that died while held (killed externally) and runs the coordinator cleanup, so
    //! that the screen guard is released and keep-awake can be enabled again.
    //! \return true if a dead lock was cleaned up.
    //!
    bool CheckLiveness();

    //!
    //! \brief Rewrites the state file if the state changed since the last write.
    //!
    void UpdateStateFile();

    //!
    //! \brief Single line describing the state: "<active|inactive> <screen guard> <pid>".
    //!
    std::string StateLine();

    //!
    //! \brief Releases everything, saves the config and removes the state file.
    //!
    void Shutdown();

    bool IsShutdownRequested() const;

private:
    InhibitorCoordinator& m_coordinator;
    AutostartUnit& m_autostart;
    Config& m_config;
    fs::path m_config_file_path;
    fs::path m_state_file_path;
    std::string m_last_state_line;
    bool m_shutdown_requested;

    void SetKeepAwake(bool enabled);
    void SetAutostart(bool enabled);
    void ReconcileAutostart();
    void SaveConfig();
};

} // namespace Pep

#endif // PEP_H
