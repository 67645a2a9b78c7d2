#include <edge_agent/mcp/stdio_transport.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "transport";
constexpr int kStderrPollMs = 100;

std::string ParamsText(const std::optional<nlohmann::json>& params) {
    return params.has_value() ? params->dump() : "{}";
}

std::string JsonScalarText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // anonymous namespace

void LogServerNotification(const std::string& server_name,
                           const JsonRpcNotification& notification) {
    const std::string component = "mcp:" + server_name;
    const auto params = notification.params.value_or(nlohmann::json::object());

    if (notification.method == "notifications/progress") {
        std::string text = "progress";
        if (params.contains("progress")) {
            text += " " + JsonScalarText(params["progress"]);
            if (params.contains("total")) {
                text += "/" + JsonScalarText(params["total"]);
            }
        }
        if (params.contains("message")) {
            text += " " + JsonScalarText(params["message"]);
        }
        LogInfo(component, text);
        return;
    }

    if (notification.method == "notifications/message") {
        const std::string level =
            params.contains("level") && params["level"].is_string()
                ? params["level"].get<std::string>()
                : std::string("info");
        std::string text = params.contains("data") ? JsonScalarText(params["data"]) : "";
        if (params.contains("logger")) {
            text = "[" + JsonScalarText(params["logger"]) + "] " + text;
        }
        if (level == "error" || level == "critical" || level == "alert" ||
            level == "emergency") {
            LogError(component, text);
        } else if (level == "warning") {
            LogWarn(component, text);
        } else if (level == "debug") {
            LogDebug(component, text);
        } else {
            LogInfo(component, text);
        }
        return;
    }

    LogInfo(component, "notification " + notification.method + " " +
                           ParamsText(notification.params));
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<std::unique_ptr<StdioTransport>, Error> StdioTransport::Spawn(
    const ServerLaunchSpec& spec) {
    auto process = ChildProcess::Spawn(spec.process);
    if (process.IsErr()) {
        auto error = std::move(process).Error();
        error.target = spec.name;
        return Result<std::unique_ptr<StdioTransport>, Error>::Err(std::move(error));
    }
    LogInfo(kComponent, "Started MCP server '" + spec.name + "' (" +
                            spec.process.command + ")");
    return Result<std::unique_ptr<StdioTransport>, Error>::Ok(
        std::unique_ptr<StdioTransport>(new StdioTransport(
            spec.name, std::move(process).Value(), spec.timeout)));
}

StdioTransport::StdioTransport(std::string name,
                               std::unique_ptr<ChildProcess> process,
                               std::chrono::milliseconds default_timeout)
    : name_(std::move(name)),
      process_(std::move(process)),
      default_timeout_(default_timeout) {
    notification_handler_ = [server = name_](const JsonRpcNotification& n) {
        LogServerNotification(server, n);
    };
    stderr_thread_ = std::thread([this]() { DrainStderr(); });
}

StdioTransport::~StdioTransport() {
    stop_stderr_ = true;
    process_->Kill();
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }
    process_.reset();
    LogDebug(kComponent, "Stopped MCP server '" + name_ + "'");
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    notification_handler_ = std::move(handler);
}

Error StdioTransport::ClosedError(const std::string& operation) const {
    return Error{operation, name_,
                 "MCP server closed stdout before sending response",
                 std::nullopt, ErrorCategory::ServerClosed};
}

// ---------------------------------------------------------------------------
// Request / Notify
// ---------------------------------------------------------------------------
Result<JsonRpcResponse, Error> StdioTransport::Request(
    const std::string& method,
    const nlohmann::json& params,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<JsonRpcResponse, Error>;
    std::lock_guard<std::mutex> lock(request_mutex_);

    if (closed_) {
        return R::Err(ClosedError(method));
    }

    const int64_t id = next_id_++;
    const auto line = EncodeMessage(JsonRpcRequest{id, method, params}) + "\n";
    const bool trace = GlobalLogger().Enabled(LogLevel::Debug);
    if (trace) {
        LogDebug(kComponent, name_ + " -> " + std::string(Trim(line)));
    }

    auto written = process_->WriteAll(line);
    if (written.IsErr()) {
        auto error = std::move(written).Error();
        error.operation = method;
        error.target = name_;
        return R::Err(std::move(error));
    }

    const auto deadline =
        std::chrono::steady_clock::now() + timeout.value_or(default_timeout_);

    while (true) {
        auto next = ReadLine(deadline, method);
        if (next.IsErr()) {
            return R::Err(std::move(next).Error());
        }
        const auto raw = std::move(next).Value();
        if (trace) {
            LogDebug(kComponent, name_ + " <- " + raw);
        }

        auto decoded = DecodeMessage(raw);
        if (decoded.IsErr()) {
            auto error = std::move(decoded).Error();
            error.operation = method;
            error.target = name_;
            return R::Err(std::move(error));
        }
        auto message = std::move(decoded).Value();

        if (auto* notification = std::get_if<JsonRpcNotification>(&message)) {
            if (notification_handler_) {
                notification_handler_(*notification);
            }
            continue;
        }
        if (auto* server_request = std::get_if<JsonRpcRequest>(&message)) {
            LogWarn(kComponent, "Ignoring unsupported request '" +
                                    server_request->method + "' from " + name_);
            continue;
        }

        auto& response = std::get<JsonRpcResponse>(message);
        if (!IdMatches(response.id, id)) {
            LogInfo(kComponent, "Discarding response with unexpected id " +
                                    response.id.dump() + " (waiting for " +
                                    std::to_string(id) + ") from " + name_);
            continue;
        }
        if (response.error.has_value()) {
            const auto& rpc = *response.error;
            return R::Err(Error::FromJsonRpc(
                method, name_, rpc.code, rpc.message,
                rpc.data.has_value() ? rpc.data->dump() : ""));
        }
        return R::Ok(std::move(response));
    }
}

Result<void, Error> StdioTransport::Notify(const std::string& method,
                                           const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(request_mutex_);
    if (closed_) {
        return Result<void, Error>::Err(ClosedError(method));
    }
    const auto line = EncodeMessage(JsonRpcNotification{method, params}) + "\n";
    auto written = process_->WriteAll(line);
    if (written.IsErr()) {
        auto error = std::move(written).Error();
        error.operation = method;
        error.target = name_;
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Line reading
// ---------------------------------------------------------------------------
Result<std::string, Error> StdioTransport::ReadLine(
    std::chrono::steady_clock::time_point deadline,
    const std::string& method) {
    using R = Result<std::string, Error>;

    while (true) {
        auto newline = stdout_buffer_.find('\n');
        while (newline != std::string::npos) {
            std::string line = stdout_buffer_.substr(0, newline);
            stdout_buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!Trim(line).empty()) {
                return R::Ok(std::move(line));
            }
            newline = stdout_buffer_.find('\n');
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return R::Err(Error{method, name_,
                                "Timed out waiting for response",
                                std::nullopt, ErrorCategory::Timeout});
        }

        pollfd pfd{process_->StdoutFd(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return R::Err(Error{method, name_,
                                std::string("poll failed: ") + std::strerror(errno),
                                std::nullopt, ErrorCategory::Internal});
        }
        if (ready == 0) {
            continue;  // deadline re-checked above
        }

        char chunk[4096];
        const ssize_t n = ::read(process_->StdoutFd(), chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            closed_ = true;
            return R::Err(ClosedError(method));
        }
        if (n == 0) {
            closed_ = true;
            LogWarn(kComponent, "MCP server '" + name_ + "' closed stdout");
            return R::Err(ClosedError(method));
        }
        stdout_buffer_.append(chunk, static_cast<size_t>(n));
    }
}

// ---------------------------------------------------------------------------
// Stderr drain
// ---------------------------------------------------------------------------
void StdioTransport::DrainStderr() {
    const std::string component = "mcp:" + name_;
    std::string pending;
    char chunk[4096];

    auto flush_lines = [&]() {
        auto newline = pending.find('\n');
        while (newline != std::string::npos) {
            auto line = TrimRight(std::string_view(pending).substr(0, newline));
            if (!line.empty()) {
                LogInfo(component, line);
            }
            pending.erase(0, newline + 1);
            newline = pending.find('\n');
        }
    };

    while (!stop_stderr_) {
        pollfd pfd{process_->StderrFd(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kStderrPollMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }
        const ssize_t n = ::read(process_->StderrFd(), chunk, sizeof(chunk));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) {
                continue;
            }
            break;
        }
        pending.append(chunk, static_cast<size_t>(n));
        flush_lines();
    }

    if (!Trim(pending).empty()) {
        LogInfo(component, TrimRight(pending));
    }
}

} // namespace edge_agent
