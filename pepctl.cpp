/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <string>
#include <cstring>   // For strerror
#include <fstream>
#include <iostream>  // Keep for final std::cout output

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

#include "pep.h"
#include "release.h"

static void Usage(const char* program)
{
    error_log("%s: Usage: %s <enable|disable|toggle|autostart-on|autostart-off|quit|status>",
              __func__, program);
}

//!
//! \brief Prints the state file written by the pep daemon.
//!
static int PrintStatus(const fs::path& state_file_path)
{
    std::ifstream state_file(state_file_path);

    if (!state_file.is_open()) {
        error_log("%s: Could not read %s. Is pep running?", __func__, state_file_path);
        return 1;
    }

    std::string line;
    if (!std::getline(state_file, line)) {
        error_log("%s: State file %s is empty.", __func__, state_file_path);
        return 1;
    }

    std::vector<std::string> fields = StringSplit(TrimString(line), " ");

    if (fields.size() != 3) {
        error_log("%s: Unexpected state file content: %s", __func__, line);
        return 1;
    }

    std::cout << "keep-awake: " << fields[0] << std::endl;
    std::cout << "screen guard: " << fields[1] << std::endl;
    std::cout << "inhibitor pid: " << fields[2] << std::endl;

    return 0;
}

//!
//! \brief Writes one control message to the pep control pipe. The pipe is opened non-blocking so that a missing
//! reader is reported instead of hanging.
//!
static int SendCommand(const fs::path& pipe_path, ControlMessage::Command command)
{
    ControlMessage message(GetUnixEpochTime(), command);
    std::string message_str = message.ToString() + "\n";

    std::error_code ec;
    if (!fs::exists(pipe_path, ec) || ec) {
        error_log("%s: Pipe '%s' does not exist or cannot be accessed. Is pep running?",
                  __func__, pipe_path);
        return 1;
    }

    int fd = open(pipe_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);

    if (fd == -1) {
        if (errno == ENXIO) {
            error_log("%s: No pep instance is listening on '%s'.", __func__, pipe_path);
        } else {
            error_log("%s: Failed to open pipe '%s' for writing: %s", __func__, pipe_path, strerror(errno));
        }
        return 1;
    }

    ssize_t written = write(fd, message_str.c_str(), message_str.size());
    int write_errno = errno;
    close(fd);

    if (written != static_cast<ssize_t>(message_str.size())) {
        error_log("%s: Failed to write message to pipe '%s': %s", __func__, pipe_path,
                  written < 0 ? strerror(write_errno) : "short write");
        return 1;
    }

    return 0;
}

int main(int argc, char* argv[]) {
    g_log_timestamps.store(false);

    if (argc != 2) {
        Usage(argc > 0 ? argv[0] : "pepctl");
        return 1;
    }

    std::string command_arg = argv[1];

    if (command_arg == "--version") {
        std::cout << "pepctl " << g_version << std::endl;
        return 0;
    }

    std::optional<fs::path> xdg_runtime_dir = GetXdgRuntimeDir();

    if (!xdg_runtime_dir) {
        error_log("%s: XDG_RUNTIME_DIR is not set.", __func__);
        return 1;
    }

    if (ToLower(command_arg) == "status") {
        return PrintStatus(xdg_runtime_dir.value() / Pep::STATE_FILE_NAME);
    }

    ControlMessage::Command command = ControlMessage::CommandStringToEnum(command_arg);

    if (command == ControlMessage::UNKNOWN) {
        Usage(argv[0]);
        return 1;
    }

    return SendCommand(xdg_runtime_dir.value() / Pep::CONTROL_PIPE_NAME, command);
}
