/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef PROCESS_H
#define PROCESS_H

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace Pep {

//!
//! \brief The ChildProcess class is the handle to a long running child process started by a ProcessLauncher. The
//! handle owns the process: whoever holds it is responsible for terminating and reaping it.
//!
class ChildProcess
{
public:
    virtual ~ChildProcess() {}

    //! \brief Process id of the child.
    virtual pid_t Pid() const = 0;

    //!
    //! \brief Non-blocking liveness check. Reaps the child if it has exited.
    //! \return true if the child has not exited.
    //!
    virtual bool IsRunning() = 0;

    //! \brief Sends SIGTERM.
    virtual void Terminate() = 0;

    //! \brief Sends SIGKILL.
    virtual void Kill() = 0;

    //!
    //! \brief Waits up to timeout for the child to exit.
    //! \return true if the child exited within the timeout.
    //!
    virtual bool WaitFor(std::chrono::milliseconds timeout) = 0;

    //! \brief Waits for the child to exit, without a timeout.
    virtual void Wait() = 0;
};

//!
//! \brief The ProcessLauncher class starts long running child processes with stdio discarded.
//!
class ProcessLauncher
{
public:
    virtual ~ProcessLauncher() {}

    //!
    //! \brief Starts argv[0] (looked up on PATH) with the given arguments.
    //! \param argv
    //! \return owned handle to the running process.
    //! \throws ProcessException with the errno of the failure. ENOENT means the executable is not installed.
    //!
    virtual std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv) = 0;
};

//!
//! \brief The CommandResult class holds the outcome of a short lived command run by a CommandRunner.
//!
class CommandResult
{
public:
    enum Status {
        EXITED,
        NOT_FOUND,
        SPAWN_FAILED,
        TIMED_OUT,
        SIGNALED
    };

    CommandResult();

    CommandResult(Status status, int exit_code, std::string output);

    //! \brief True if the command ran to completion with exit code 0.
    bool Succeeded() const;

    static std::string StatusToString(const Status& status);

    //! \brief Human readable description for log messages, e.g. "exited with code 1".
    std::string ToString() const;

    Status m_status;
    int m_exit_code;

    //! \brief Captured stdout. stderr is discarded.
    std::string m_output;
};

//!
//! \brief The CommandRunner class runs a short lived command to completion, bounded by a timeout, and captures its
//! standard output. A command still running at the timeout is killed.
//!
class CommandRunner
{
public:
    virtual ~CommandRunner() {}

    virtual CommandResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) = 0;
};

//!
//! \brief Joins argv with spaces for log messages.
//!
std::string FormatCommandLine(const std::vector<std::string>& argv);

//!
//! \brief posix_spawn based ChildProcess.
//!
class PosixChildProcess : public ChildProcess
{
public:
    explicit PosixChildProcess(pid_t pid);

    //! \brief Kills and reaps the child if it is still running.
    ~PosixChildProcess();

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    pid_t Pid() const override;
    bool IsRunning() override;
    void Terminate() override;
    void Kill() override;
    bool WaitFor(std::chrono::milliseconds timeout) override;
    void Wait() override;

    //! \brief Raw waitpid status. Only meaningful once the child has been reaped.
    int WaitStatus() const;

private:
    pid_t m_pid;

    //! \brief Set once waitpid has collected the exit status.
    bool m_reaped;

    int m_wait_status;

    void SendSignal(int signal_number);
};

//!
//! \brief posix_spawnp based ProcessLauncher. stdin, stdout and stderr of the child are connected to /dev/null.
//!
class PosixProcessLauncher : public ProcessLauncher
{
public:
    std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv) override;
};

//!
//! \brief posix_spawnp based CommandRunner. stdout is read through a pipe with poll() until the child closes it or
//! the deadline passes.
//!
class PosixCommandRunner : public CommandRunner
{
public:
    CommandResult Run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) override;
};

} // namespace Pep

#endif // PROCESS_H
