#pragma once

#include <edge_agent/core/result.hpp>

#include <map>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace edge_agent {

// ---------------------------------------------------------------------------
// ProcessSpec — what to launch. `env` entries are added to (or override) the
// parent environment. The command is resolved through PATH.
// ---------------------------------------------------------------------------
struct ProcessSpec {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

// ---------------------------------------------------------------------------
// ChildProcess — RAII owner of a spawned process and its three pipes.
//
// The parent holds the write end of the child's stdin and the read ends of
// its stdout and stderr. Destruction kills the child (SIGKILL), closes every
// descriptor and reaps the process.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    /// fork + execvp. An exec failure in the child is reported back through a
    /// close-on-exec status pipe, so a missing binary is a Spawn error here
    /// rather than an immediate EOF later.
    [[nodiscard]] static Result<std::unique_ptr<ChildProcess>, Error> Spawn(
        const ProcessSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] int StdinFd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int StdoutFd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int StderrFd() const noexcept { return stderr_fd_; }

    /// Close the child's stdin so it sees EOF.
    void CloseStdin();

    /// Write all bytes to the child's stdin. EPIPE yields BrokenPipe.
    [[nodiscard]] Result<void, Error> WriteAll(const std::string& data);

    /// Block until the child exits and return its exit status (128+signal
    /// when it was killed by a signal).
    [[nodiscard]] Result<int, Error> Wait();

    /// Send SIGKILL (no-op if already reaped).
    void Kill();

    /// Ignore SIGPIPE process-wide once so that writes to a dead child fail
    /// with EPIPE instead of terminating us.
    static void IgnoreSigpipe();

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd,
                 std::string command);

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;
    std::string command_;
    bool reaped_ = false;
    int exit_status_ = 0;
};

} // namespace edge_agent
