#pragma once

#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/child_process.hpp>
#include <edge_agent/mcp/i_transport.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace edge_agent {

constexpr std::chrono::milliseconds kDefaultRequestTimeout{30000};

// ---------------------------------------------------------------------------
// ServerLaunchSpec — one configured MCP server.
// ---------------------------------------------------------------------------
struct ServerLaunchSpec {
    std::string name;
    ProcessSpec process;
    std::chrono::milliseconds timeout = kDefaultRequestTimeout;
};

using NotificationHandler = std::function<void(const JsonRpcNotification&)>;

/// Default handling for server notifications: progress and log messages are
/// rendered readably, anything else is logged verbatim.
void LogServerNotification(const std::string& server_name,
                           const JsonRpcNotification& notification);

// ---------------------------------------------------------------------------
// StdioTransport — JSON-RPC over a child process's stdin/stdout.
//
// One message per line. Request ids start at 1 and increase monotonically.
// A mutex serializes each request's write and the read of its reply, so
// concurrent callers on one transport take turns. A background thread drains
// stderr into the logger under component "mcp:<server>"; stderr is never
// parsed as protocol.
//
// While waiting for a reply:
//   - notifications go to the notification handler;
//   - responses with another id (e.g. a late reply to a timed-out request)
//     are logged and discarded;
//   - server-to-client requests are logged as unsupported and discarded;
//   - an undecodable line fails this request with MalformedMessage but the
//     transport stays usable.
// Stdout EOF fails the request with ServerClosed and every later call fails
// fast with the same category. A timeout does not close the transport.
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    [[nodiscard]] static Result<std::unique_ptr<StdioTransport>, Error> Spawn(
        const ServerLaunchSpec& spec);

    ~StdioTransport() override;

    [[nodiscard]] Result<JsonRpcResponse, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    [[nodiscard]] Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) override;

    void SetNotificationHandler(NotificationHandler handler);

    [[nodiscard]] bool IsClosed() const noexcept { return closed_.load(); }
    [[nodiscard]] const std::string& ServerName() const noexcept { return name_; }

private:
    StdioTransport(std::string name, std::unique_ptr<ChildProcess> process,
                   std::chrono::milliseconds default_timeout);

    // Next complete line from stdout, waiting no later than `deadline`.
    Result<std::string, Error> ReadLine(
        std::chrono::steady_clock::time_point deadline,
        const std::string& method);

    Error ClosedError(const std::string& operation) const;

    void DrainStderr();

    std::string name_;
    std::unique_ptr<ChildProcess> process_;
    std::chrono::milliseconds default_timeout_;

    std::mutex request_mutex_;
    int64_t next_id_ = 1;
    std::string stdout_buffer_;
    NotificationHandler notification_handler_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> stop_stderr_{false};
    std::thread stderr_thread_;
};

} // namespace edge_agent
