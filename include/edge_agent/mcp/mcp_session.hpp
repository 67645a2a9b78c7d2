#pragma once

#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/i_transport.hpp>
#include <edge_agent/mcp/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace edge_agent {

// ---------------------------------------------------------------------------
// McpSession — the MCP client side of one server connection.
//
// Owns its transport (and through it the child process), so the process
// lives exactly as long as the session.
//
// Initialize() performs the handshake once:
//   initialize -> record capabilities and serverInfo
//   notifications/initialized
//   tools/list (only if the server advertises the tools capability)
// A protocol version different from ours is logged as a warning, never
// treated as a failure.
// ---------------------------------------------------------------------------
class McpSession {
public:
    McpSession(std::string server_name, std::unique_ptr<ITransport> transport);

    [[nodiscard]] Result<ServerCapabilities, Error> Initialize();

    /// Replace the cached catalog with a fresh tools/list.
    [[nodiscard]] Result<void, Error> RefreshTools();

    [[nodiscard]] Result<CallResult, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments);

    [[nodiscard]] const std::string& ServerName() const noexcept { return server_name_; }
    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_.has_value(); }
    [[nodiscard]] const std::vector<McpTool>& Tools() const noexcept { return tools_; }
    [[nodiscard]] bool HasTool(const std::string& name) const;

    /// Only meaningful after a successful Initialize().
    [[nodiscard]] const std::optional<InitializeResult>& Handshake() const noexcept {
        return initialized_;
    }

private:
    std::string server_name_;
    std::unique_ptr<ITransport> transport_;
    std::optional<InitializeResult> initialized_;
    std::vector<McpTool> tools_;
};

/// The params object sent with "initialize".
[[nodiscard]] nlohmann::json BuildInitializeParams();

} // namespace edge_agent
