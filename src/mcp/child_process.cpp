#include <edge_agent/mcp/child_process.hpp>

#include <edge_agent/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace edge_agent {

namespace {

Error MakeSpawnError(const std::string& command, const std::string& message) {
    return Error{"Spawn", command, message, std::nullopt, ErrorCategory::Spawn};
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Pipe pair with FD_CLOEXEC on both ends so descriptors do not leak into
// other children spawned later.
bool MakePipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Merge parent environment with the overrides into "KEY=VALUE" strings.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> result;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            result.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        result.push_back(key + "=" + value);
    }
    return result;
}

} // anonymous namespace

void ChildProcess::IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(
    const ProcessSpec& spec) {
    using R = Result<std::unique_ptr<ChildProcess>, Error>;

    if (spec.command.empty()) {
        return R::Err(MakeSpawnError(spec.command, "Empty command"));
    }
    IgnoreSigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (!MakePipe(in_pipe) || !MakePipe(out_pipe) || !MakePipe(err_pipe) ||
        !MakePipe(status_pipe)) {
        const int err = errno;
        close_all();
        return R::Err(MakeSpawnError(spec.command, "pipe() failed: " + ErrnoText(err)));
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = BuildEnvironment(spec.env);
    std::vector<char*> envp;
    for (auto& e : env_storage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        close_all();
        return R::Err(MakeSpawnError(spec.command, "fork() failed: " + ErrnoText(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        std::signal(SIGPIPE, SIG_DFL);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        const int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent.
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (n > 0) {
        // exec failed; reap the child and report.
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        return R::Err(MakeSpawnError(
            spec.command, "Failed to start '" + spec.command + "': " + ErrnoText(child_errno)));
    }

    LogDebug("process", "Spawned '" + spec.command + "' pid " + std::to_string(pid));
    return R::Ok(std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, in_pipe[1], out_pipe[0], err_pipe[0], spec.command)));
}

ChildProcess::ChildProcess(pid_t pid, int stdin_fd, int stdout_fd,
                           int stderr_fd, std::string command)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd), command_(std::move(command)) {}

ChildProcess::~ChildProcess() {
    Kill();
    CloseFd(stdin_fd_);
    if (!reaped_) {
        int status = 0;
        ::waitpid(pid_, &status, 0);
        reaped_ = true;
    }
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

void ChildProcess::CloseStdin() {
    CloseFd(stdin_fd_);
}

Result<void, Error> ChildProcess::WriteAll(const std::string& data) {
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(Error{
            "Write", command_, "stdin already closed", std::nullopt,
            ErrorCategory::BrokenPipe});
    }
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(stdin_fd_, data.data() + written,
                                  data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            return Result<void, Error>::Err(Error{
                "Write", command_, "Write to child failed: " + ErrnoText(err),
                std::nullopt,
                err == EPIPE ? ErrorCategory::BrokenPipe : ErrorCategory::Internal});
        }
        written += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

Result<int, Error> ChildProcess::Wait() {
    if (reaped_) {
        return Result<int, Error>::Ok(exit_status_);
    }
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        return Result<int, Error>::Err(Error{
            "Wait", command_, "waitpid failed: " + ErrnoText(errno), std::nullopt,
            ErrorCategory::Internal});
    }
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = 128 + WTERMSIG(status);
    }
    return Result<int, Error>::Ok(exit_status_);
}

void ChildProcess::Kill() {
    if (!reaped_ && pid_ > 0) {
        ::kill(pid_, SIGKILL);
    }
}

} // namespace edge_agent
