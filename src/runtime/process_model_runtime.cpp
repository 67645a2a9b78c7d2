#include <edge_agent/runtime/process_model_runtime.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>

#include <cerrno>
#include <cstring>
#include <optional>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "runtime";
constexpr std::string_view kPromptPlaceholder = "{prompt}";

Error MakeModelError(const std::string& target, const std::string& message,
                     std::optional<std::string> detail = std::nullopt) {
    return Error{"Run", target, message, std::move(detail), ErrorCategory::Model};
}

// Replace every "{prompt}" in `args`; returns true if any was found.
bool SubstitutePrompt(std::vector<std::string>& args, const std::string& prompt) {
    bool substituted = false;
    for (auto& arg : args) {
        size_t pos = 0;
        while ((pos = arg.find(kPromptPlaceholder, pos)) != std::string::npos) {
            arg.replace(pos, kPromptPlaceholder.size(), prompt);
            pos += prompt.size();
            substituted = true;
        }
    }
    return substituted;
}

void LogStderrLines(std::string& pending, const std::string& command, bool flush) {
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
        auto line = TrimRight(std::string_view(pending).substr(0, nl));
        if (!line.empty()) {
            LogDebug(kComponent, command + ": " + std::string(line));
        }
        pending.erase(0, nl + 1);
    }
    if (flush && !Trim(pending).empty()) {
        LogDebug(kComponent, command + ": " + std::string(TrimRight(pending)));
        pending.clear();
    }
}

} // anonymous namespace

ProcessModelRuntime::ProcessModelRuntime(ProcessSpec spec)
    : spec_(std::move(spec)) {}

Result<std::string, Error> ProcessModelRuntime::Run(const std::string& prompt,
                                                    const TokenCallback& on_token) {
    using R = Result<std::string, Error>;

    ProcessSpec spec = spec_;
    const bool via_args = SubstitutePrompt(spec.args, prompt);

    auto spawned = ChildProcess::Spawn(spec);
    if (spawned.IsErr()) {
        auto err = std::move(spawned).Error();
        return R::Err(MakeModelError(spec_.command,
                                     "Failed to start model command: " + err.message,
                                     err.detail));
    }
    auto proc = std::move(spawned).Value();

    // Feed stdin from a separate thread so a child that writes before it has
    // consumed the whole prompt cannot deadlock us.
    std::optional<Error> write_error;
    std::thread writer([&]() {
        if (!via_args) {
            auto written = proc->WriteAll(prompt);
            if (written.IsErr()) {
                write_error = std::move(written).Error();
            }
        }
        proc->CloseStdin();
    });

    std::string output;
    std::string stderr_pending;
    std::string stderr_tail;
    bool stdout_open = true;
    bool stderr_open = true;
    std::optional<Error> read_error;
    char buf[4096];

    while ((stdout_open || stderr_open) && !read_error) {
        pollfd fds[2] = {
            {stdout_open ? proc->StdoutFd() : -1, POLLIN, 0},
            {stderr_open ? proc->StderrFd() : -1, POLLIN, 0},
        };
        const int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            read_error = MakeModelError(spec_.command,
                                        std::string("poll failed: ") + std::strerror(errno));
            break;
        }
        if (stdout_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            const ssize_t n = ::read(proc->StdoutFd(), buf, sizeof(buf));
            if (n > 0) {
                std::string_view chunk(buf, static_cast<size_t>(n));
                output.append(chunk);
                if (on_token) {
                    on_token(chunk);
                }
            } else if (n == 0 || errno != EINTR) {
                stdout_open = false;
            }
        }
        if (stderr_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            const ssize_t n = ::read(proc->StderrFd(), buf, sizeof(buf));
            if (n > 0) {
                stderr_pending.append(buf, static_cast<size_t>(n));
                stderr_tail.append(buf, static_cast<size_t>(n));
                if (stderr_tail.size() > 1024) {
                    stderr_tail.erase(0, stderr_tail.size() - 1024);
                }
                LogStderrLines(stderr_pending, spec_.command, false);
            } else if (n == 0 || errno != EINTR) {
                stderr_open = false;
            }
        }
    }
    LogStderrLines(stderr_pending, spec_.command, true);

    if (read_error) {
        proc->Kill();
    }
    writer.join();
    auto status = proc->Wait();

    if (read_error) {
        return R::Err(std::move(*read_error));
    }
    if (status.IsErr()) {
        return R::Err(MakeModelError(spec_.command, status.Error().message));
    }
    if (status.Value() != 0) {
        std::optional<std::string> detail;
        if (!Trim(stderr_tail).empty()) {
            detail = std::string(Trim(stderr_tail));
        }
        return R::Err(MakeModelError(
            spec_.command,
            "Model command exited with status " + std::to_string(status.Value()),
            std::move(detail)));
    }
    if (write_error) {
        LogWarn(kComponent, "Model command did not read the whole prompt: " +
                                write_error->message);
    }
    LogDebug(kComponent, "Generated " + std::to_string(output.size()) + " bytes");
    return R::Ok(std::move(output));
}

} // namespace edge_agent
