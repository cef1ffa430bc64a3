/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <pep.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

// PepConfig class

void PepConfig::ProcessArgs()
{
    ProcessBoolArg("debug", "false");

    ProcessBoolArg("enabled_by_default", "true");

    ProcessBoolArg("autostart", "true");

    ProcessBoolArg("log_timestamps", "true");
}

namespace Pep {

const std::string CONTROL_PIPE_NAME = "pep_control_pipe";

const std::string STATE_FILE_NAME = "pep_state";

// ControlPipe class

ControlPipe::ControlPipe(fs::path path)
    : m_path(std::move(path))
    , m_read_fd(-1)
    , m_write_fd(-1)
{}

ControlPipe::~ControlPipe()
{
    Close();
}

void ControlPipe::Close()
{
    if (m_read_fd == -1) {
        return;
    }

    close(m_read_fd);
    m_read_fd = -1;

    if (m_write_fd != -1) {
        close(m_write_fd);
        m_write_fd = -1;
    }

    std::error_code ec;
    fs::remove(m_path, ec);

    if (ec) {
        error_log("%s: Could not remove control pipe %s: %s",
                  __func__,
                  m_path,
                  ec.message());
    }
}

bool ControlPipe::Open()
{
    if (m_read_fd != -1) {
        return true;
    }

    if (mkfifo(m_path.c_str(), 0600) == -1 && errno != EEXIST) {
        error_log("%s: Error creating named pipe %s: %s",
                  __func__,
                  m_path,
                  strerror(errno));
        return false;
    }

    std::error_code ec;

    if (!fs::is_fifo(m_path, ec) || ec) {
        error_log("%s: Path %s exists and is not a named pipe (FIFO).",
                  __func__,
                  m_path);
        return false;
    }

    // The mode above combined with the umask does not always result in the right permissions, so override them.
    fs::permissions(m_path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);

    if (ec) {
        error_log("%s: Error setting permissions (0600) on named pipe %s: %s",
                  __func__,
                  m_path,
                  ec.message());
        return false;
    }

    m_read_fd = open(m_path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);

    if (m_read_fd == -1) {
        error_log("%s: Error opening named pipe %s for reading: %s",
                  __func__,
                  m_path,
                  strerror(errno));
        return false;
    }

    m_write_fd = open(m_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);

    if (m_write_fd == -1) {
        log("WARNING: %s: Could not hold named pipe %s open for writing: %s",
            __func__,
            m_path,
            strerror(errno));
    }

    debug_log("INFO: %s: Listening on control pipe %s",
              __func__,
              m_path);

    return true;
}

std::vector<std::string> ControlPipe::ReadLines(std::chrono::milliseconds timeout)
{
    std::vector<std::string> lines;

    if (m_read_fd == -1) {
        return lines;
    }

    struct pollfd fds[1];
    fds[0].fd = m_read_fd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;

    int ret = poll(fds, 1, static_cast<int>(timeout.count()));

    if (ret < 0) {
        if (errno != EINTR) {
            error_log("%s: Error in poll() for pipe read: %s",
                      __func__,
                      strerror(errno));
        }
        return lines;
    }

    if (ret == 0 || !(fds[0].revents & POLLIN)) {
        return lines;
    }

    char buffer[256];
    ssize_t bytes_read = 0;

    while ((bytes_read = read(m_read_fd, buffer, sizeof(buffer))) > 0) {
        m_partial_line.append(buffer, static_cast<size_t>(bytes_read));
    }

    if (bytes_read < 0 && errno != EAGAIN && errno != EINTR) {
        error_log("%s: Error reading from named pipe: %s",
                  __func__,
                  strerror(errno));
    }

    std::string::size_type newline = 0;

    while ((newline = m_partial_line.find('\n')) != std::string::npos) {
        std::string line = TrimString(m_partial_line.substr(0, newline));
        m_partial_line.erase(0, newline + 1);

        if (!line.empty()) {
            lines.push_back(line);
        }
    }

    return lines;
}

const fs::path& ControlPipe::Path() const
{
    return m_path;
}

// PepDaemon class

PepDaemon::PepDaemon(InhibitorCoordinator& coordinator,
                     AutostartUnit& autostart,
                     Config& config,
                     fs::path config_file_path,
                     fs::path state_file_path)
    : m_coordinator(coordinator)
    , m_autostart(autostart)
    , m_config(config)
    , m_config_file_path(std::move(config_file_path))
    , m_state_file_path(std::move(state_file_path))
    , m_shutdown_requested(false)
{}

void PepDaemon::Start()
{
    bool enabled_by_default = true;

    try {
        enabled_by_default = std::get<bool>(m_config.GetArg("enabled_by_default"));
    } catch (const std::bad_variant_access& e) {
        error_log("%s: enabled_by_default missing or has wrong type: %s. Using default.",
                  __func__,
                  e.what());
    }

    if (enabled_by_default) {
        if (m_coordinator.Enable()) {
            log("INFO: %s: Keep-awake enabled on startup.",
                __func__);
        } else {
            log("WARNING: %s: Failed to enable keep-awake on startup.",
                __func__);
        }
    }

    ReconcileAutostart();

    UpdateStateFile();
}

void PepDaemon::ReconcileAutostart()
{
    std::optional<bool> unit_enabled = m_autostart.IsEnabled();

    if (!unit_enabled) {
        return;
    }

    bool configured = true;

    try {
        configured = std::get<bool>(m_config.GetArg("autostart"));
    } catch (const std::bad_variant_access& e) {
        error_log("%s: autostart missing or has wrong type: %s. Using default.",
                  __func__,
                  e.what());
    }

    if (configured == *unit_enabled) {
        return;
    }

    log("INFO: %s: Autostart unit is %s, updating config to match.",
        __func__,
        *unit_enabled ? "enabled" : "disabled");

    m_config.SetArg("autostart", *unit_enabled);
    SaveConfig();
}

void PepDaemon::HandleLine(const std::string& line)
{
    std::optional<ControlMessage> message = ControlMessage::Parse(line);

    if (!message) {
        error_log("%s: Malformed control message received: %s",
                  __func__,
                  line);
        return;
    }

    HandleMessage(*message);
}

void PepDaemon::HandleMessage(const ControlMessage& message)
{
    if (!message.IsValid()) {
        error_log("%s: Invalid control message received: %s",
                  __func__,
                  message.ToString());
        return;
    }

    debug_log("INFO: %s: Control command %s",
              __func__,
              message.CommandToString());

    switch (message.m_command) {
    case ControlMessage::ENABLE:
        SetKeepAwake(true);
        break;
    case ControlMessage::DISABLE:
        SetKeepAwake(false);
        break;
    case ControlMessage::TOGGLE:
        SetKeepAwake(!m_coordinator.IsActive());
        break;
    case ControlMessage::AUTOSTART_ON:
        SetAutostart(true);
        break;
    case ControlMessage::AUTOSTART_OFF:
        SetAutostart(false);
        break;
    case ControlMessage::QUIT:
        log("INFO: %s: Quit requested.",
            __func__);
        m_shutdown_requested = true;
        break;
    case ControlMessage::UNKNOWN:
        break;
    }

    UpdateStateFile();
}

void PepDaemon::SetKeepAwake(bool enabled)
{
    bool changed = enabled ? m_coordinator.Enable() : m_coordinator.Disable();

    if (!changed) {
        return;
    }

    m_config.SetArg("enabled_by_default", enabled);
    SaveConfig();

    log("INFO: %s: State changed: enabled=%s",
        __func__,
        enabled ? "true" : "false");
}

void PepDaemon::SetAutostart(bool enabled)
{
    m_config.SetArg("autostart", enabled);
    SaveConfig();

    if (!m_autostart.SetEnabled(enabled)) {
        m_config.SetArg("autostart", !enabled);
        SaveConfig();
    }
}

void PepDaemon::SaveConfig()
{
    if (!m_config.WriteConfig(m_config_file_path)) {
        log("WARNING: %s: Config not saved, the change will not survive a restart.",
            __func__);
    }
}

bool PepDaemon::CheckLiveness()
{
    if (!m_coordinator.GetProcessLock().HasHandle() || m_coordinator.IsActive()) {
        return false;
    }

    log("WARNING: %s: Inhibitor process exited unexpectedly. Releasing screen guard.",
        __func__);

    m_coordinator.Cleanup();
    UpdateStateFile();

    return true;
}

std::string PepDaemon::StateLine()
{
    return tfm::format("%s %s %i",
                       m_coordinator.IsActive() ? "active" : "inactive",
                       m_coordinator.GetScreenGuard().StateToString(),
                       m_coordinator.GetProcessLock().Pid());
}

void PepDaemon::UpdateStateFile()
{
    if (m_state_file_path.empty()) {
        return;
    }

    std::string state_line = StateLine();

    if (state_line == m_last_state_line) {
        return;
    }

    try {
        WriteFileAtomic(m_state_file_path, state_line + "\n");
        m_last_state_line = state_line;
    } catch (const FileSystemException& e) {
        error_log("%s: Failed to write state file: %s",
                  __func__,
                  e.what());
    }
}

void PepDaemon::Shutdown()
{
    m_coordinator.Cleanup();

    SaveConfig();

    if (!m_state_file_path.empty()) {
        std::error_code ec;
        fs::remove(m_state_file_path, ec);
    }
}

bool PepDaemon::IsShutdownRequested() const
{
    return m_shutdown_requested;
}

} // namespace Pep
