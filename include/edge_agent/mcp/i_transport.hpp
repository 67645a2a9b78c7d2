#pragma once

#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/json_rpc.hpp>

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace edge_agent {

// ---------------------------------------------------------------------------
// ITransport — request/response channel to one MCP server.
//
// McpSession depends on this interface rather than on a concrete process
// pipe, so sessions can be tested offline with MockTransport.
//
// Methods return Result<T, Error> — never throw on expected failures.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    /// Send a request and block until the response with the same id arrives
    /// or the timeout expires. A JSON-RPC error member is returned as a
    /// Protocol error. `timeout` overrides the transport default.
    [[nodiscard]] virtual Result<JsonRpcResponse, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    /// Fire-and-forget notification (no id, no reply).
    [[nodiscard]] virtual Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) = 0;

protected:
    ITransport() = default;
};

} // namespace edge_agent
