/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <process.h>
#include <util.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace Pep {

namespace {
//!
//! \brief Polling interval used while waiting on a child with a timeout.
//!
constexpr std::chrono::milliseconds WAIT_POLL_INTERVAL(10);

//!
//! \brief RAII wrapper around the posix_spawn file actions and attributes shared by the launcher and the runner.
//! The child is put in its own process group so that signals reach everything it starts, and the signals pep
//! handles are reset to their default disposition.
//!
class SpawnSetup
{
public:
    SpawnSetup()
    {
        posix_spawn_file_actions_init(&m_actions);
        posix_spawnattr_init(&m_attr);

        sigset_t default_signals;
        sigemptyset(&default_signals);
        sigaddset(&default_signals, SIGINT);
        sigaddset(&default_signals, SIGTERM);
        sigaddset(&default_signals, SIGPIPE);
        posix_spawnattr_setsigdefault(&m_attr, &default_signals);

        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        posix_spawnattr_setsigmask(&m_attr, &empty_mask);

        posix_spawnattr_setpgroup(&m_attr, 0);
        posix_spawnattr_setflags(&m_attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    }

    ~SpawnSetup()
    {
        posix_spawn_file_actions_destroy(&m_actions);
        posix_spawnattr_destroy(&m_attr);
    }

    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;

    void DevNull(int fd, int flags)
    {
        posix_spawn_file_actions_addopen(&m_actions, fd, "/dev/null", flags, 0);
    }

    void Dup(int from_fd, int to_fd)
    {
        posix_spawn_file_actions_adddup2(&m_actions, from_fd, to_fd);
    }

    //!
    //! \brief Starts the child.
    //! \return 0 or the error number reported by posix_spawnp.
    //!
    int Spawn(pid_t& pid, const std::vector<std::string>& argv)
    {
        std::vector<char*> c_argv;

        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }

        c_argv.push_back(nullptr);

        return posix_spawnp(&pid, c_argv[0], &m_actions, &m_attr, c_argv.data(), environ);
    }

private:
    posix_spawn_file_actions_t m_actions;
    posix_spawnattr_t m_attr;
};
} // anonymous namespace

std::string FormatCommandLine(const std::vector<std::string>& argv)
{
    std::string out;

    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += " ";
        }

        out += arg;
    }

    return out;
}

// Class CommandResult

CommandResult::CommandResult()
    : m_status(SPAWN_FAILED)
    , m_exit_code(-1)
{}

CommandResult::CommandResult(Status status, int exit_code, std::string output)
    : m_status(status)
    , m_exit_code(exit_code)
    , m_output(std::move(output))
{}

bool CommandResult::Succeeded() const
{
    return m_status == EXITED && m_exit_code == 0;
}

std::string CommandResult::StatusToString(const Status& status)
{
    std::string out;

    switch (status) {
    case EXITED:
        out = "EXITED";
        break;
    case NOT_FOUND:
        out = "NOT_FOUND";
        break;
    case SPAWN_FAILED:
        out = "SPAWN_FAILED";
        break;
    case TIMED_OUT:
        out = "TIMED_OUT";
        break;
    case SIGNALED:
        out = "SIGNALED";
        break;
    }

    return out;
}

std::string CommandResult::ToString() const
{
    switch (m_status) {
    case EXITED:
        return "exited with code " + ::ToString(m_exit_code);
    case NOT_FOUND:
        return "executable not found";
    case SPAWN_FAILED:
        return "could not be started (errno " + ::ToString(m_exit_code) + ")";
    case TIMED_OUT:
        return "timed out and was killed";
    case SIGNALED:
        return "terminated by signal " + ::ToString(m_exit_code);
    }

    return StatusToString(m_status);
}

// Class PosixChildProcess

PosixChildProcess::PosixChildProcess(pid_t pid)
    : m_pid(pid)
    , m_reaped(false)
    , m_wait_status(0)
{}

PosixChildProcess::~PosixChildProcess()
{
    if (IsRunning()) {
        debug_log("INFO: %s: Child process %i still running at handle destruction, killing it.",
                  __func__,
                  m_pid);
        Kill();
        Wait();
    }
}

pid_t PosixChildProcess::Pid() const
{
    return m_pid;
}

bool PosixChildProcess::IsRunning()
{
    if (m_reaped) {
        return false;
    }

    int status = 0;
    pid_t ret = waitpid(m_pid, &status, WNOHANG);

    if (ret == m_pid) {
        m_reaped = true;
        m_wait_status = status;
        return false;
    }

    if (ret == -1) {
        if (errno == ECHILD) {
            // Somebody else reaped it. It is gone either way.
            m_reaped = true;
            return false;
        }

        if (errno != EINTR) {
            error_log("%s: waitpid failed for pid %i: %s",
                      __func__,
                      m_pid,
                      strerror(errno));
        }
    }

    return true;
}

void PosixChildProcess::SendSignal(int signal_number)
{
    if (m_reaped) {
        return;
    }

    // The child leads its own process group, see SpawnSetup.
    if (kill(-m_pid, signal_number) == -1) {
        if (errno == ESRCH) {
            if (kill(m_pid, signal_number) == -1 && errno != ESRCH) {
                error_log("%s: Failed to send signal %i to pid %i: %s",
                          __func__,
                          signal_number,
                          m_pid,
                          strerror(errno));
            }
        } else {
            error_log("%s: Failed to send signal %i to process group %i: %s",
                      __func__,
                      signal_number,
                      m_pid,
                      strerror(errno));
        }
    }
}

void PosixChildProcess::Terminate()
{
    SendSignal(SIGTERM);
}

void PosixChildProcess::Kill()
{
    SendSignal(SIGKILL);
}

bool PosixChildProcess::WaitFor(std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (IsRunning()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }

        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }

    return true;
}

void PosixChildProcess::Wait()
{
    if (m_reaped) {
        return;
    }

    int status = 0;
    pid_t ret = -1;

    do {
        ret = waitpid(m_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1 && errno != ECHILD) {
        error_log("%s: waitpid failed for pid %i: %s",
                  __func__,
                  m_pid,
                  strerror(errno));
    }

    m_reaped = true;
    m_wait_status = (ret == m_pid) ? status : 0;
}

int PosixChildProcess::WaitStatus() const
{
    return m_wait_status;
}

// Class PosixProcessLauncher

std::unique_ptr<ChildProcess> PosixProcessLauncher::Spawn(const std::vector<std::string>& argv)
{
    if (argv.empty()) {
        throw ProcessException("Spawn called with an empty command line.", EINVAL);
    }

    SpawnSetup setup;
    setup.DevNull(STDIN_FILENO, O_RDONLY);
    setup.DevNull(STDOUT_FILENO, O_WRONLY);
    setup.DevNull(STDERR_FILENO, O_WRONLY);

    pid_t pid = -1;
    int rc = setup.Spawn(pid, argv);

    if (rc != 0) {
        throw ProcessException("Failed to start " + argv[0] + ": " + strerror(rc), rc);
    }

    debug_log("INFO: %s: Started \"%s\" with pid %i",
              __func__,
              FormatCommandLine(argv),
              pid);

    return std::make_unique<PosixChildProcess>(pid);
}

// Class PosixCommandRunner

CommandResult PosixCommandRunner::Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout)
{
    if (argv.empty()) {
        return CommandResult(CommandResult::SPAWN_FAILED, EINVAL, {});
    }

    int pipe_fd[2];

    if (pipe2(pipe_fd, O_CLOEXEC) == -1) {
        int error_number = errno;
        error_log("%s: Failed to create output pipe for \"%s\": %s",
                  __func__,
                  FormatCommandLine(argv),
                  strerror(error_number));
        return CommandResult(CommandResult::SPAWN_FAILED, error_number, {});
    }

    pid_t pid = -1;
    int rc = 0;

    {
        SpawnSetup setup;
        setup.DevNull(STDIN_FILENO, O_RDONLY);
        setup.Dup(pipe_fd[1], STDOUT_FILENO);
        setup.DevNull(STDERR_FILENO, O_WRONLY);

        rc = setup.Spawn(pid, argv);
    }

    close(pipe_fd[1]);

    if (rc != 0) {
        close(pipe_fd[0]);

        debug_log("INFO: %s: Could not start \"%s\": %s",
                  __func__,
                  FormatCommandLine(argv),
                  strerror(rc));

        return CommandResult(rc == ENOENT ? CommandResult::NOT_FOUND : CommandResult::SPAWN_FAILED, rc, {});
    }

    PosixChildProcess child(pid);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string output;
    char buffer[4096];
    bool timed_out = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());

        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        struct pollfd fds[1];
        fds[0].fd = pipe_fd[0];
        fds[0].events = POLLIN;
        fds[0].revents = 0;

        int ret = poll(fds, 1, static_cast<int>(remaining.count()));

        if (ret == 0) {
            timed_out = true;
            break;
        }

        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }

            error_log("%s: Error in poll() for output of \"%s\": %s",
                      __func__,
                      FormatCommandLine(argv),
                      strerror(errno));
            break;
        }

        ssize_t bytes_read = read(pipe_fd[0], buffer, sizeof(buffer));

        if (bytes_read > 0) {
            output.append(buffer, static_cast<size_t>(bytes_read));
        } else if (bytes_read == 0) {
            break;
        } else if (errno != EINTR && errno != EAGAIN) {
            error_log("%s: Error reading output of \"%s\": %s",
                      __func__,
                      FormatCommandLine(argv),
                      strerror(errno));
            break;
        }
    }

    close(pipe_fd[0]);

    if (!timed_out) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());

        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        timed_out = !child.WaitFor(remaining);
    }

    if (timed_out) {
        child.Kill();
        child.Wait();

        debug_log("INFO: %s: \"%s\" did not finish within %lld ms and was killed.",
                  __func__,
                  FormatCommandLine(argv),
                  (long long) timeout.count());

        return CommandResult(CommandResult::TIMED_OUT, -1, output);
    }

    int status = child.WaitStatus();

    if (WIFSIGNALED(status)) {
        return CommandResult(CommandResult::SIGNALED, WTERMSIG(status), output);
    }

    return CommandResult(CommandResult::EXITED, WEXITSTATUS(status), output);
}

} // namespace Pep
