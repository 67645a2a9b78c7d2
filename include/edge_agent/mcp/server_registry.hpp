#pragma once

#include <edge_agent/mcp/mcp_session.hpp>
#include <edge_agent/mcp/stdio_transport.hpp>
#include <edge_agent/mcp/types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace edge_agent {

// A tool together with the name of the server that owns it.
using OwnedTool = std::pair<std::string, McpTool>;

// One (server, tool) pair of the full catalog. shadowed_by names the server
// that wins the tool name when this entry loses a collision.
struct CatalogEntry {
    std::string server;
    McpTool tool;
    std::optional<std::string> shadowed_by;
};

// ---------------------------------------------------------------------------
// IToolRegistry — what the orchestrator needs from the set of servers.
// CallTool never fails: every failure becomes ToolResult{success = false}.
// ---------------------------------------------------------------------------
class IToolRegistry {
public:
    virtual ~IToolRegistry() = default;

    IToolRegistry(const IToolRegistry&) = delete;
    IToolRegistry& operator=(const IToolRegistry&) = delete;
    IToolRegistry(IToolRegistry&&) = delete;
    IToolRegistry& operator=(IToolRegistry&&) = delete;

    [[nodiscard]] virtual std::vector<OwnedTool> ListAllTools() const = 0;

    [[nodiscard]] virtual ToolResult CallTool(const std::string& name,
                                              const nlohmann::json& arguments) = 0;

protected:
    IToolRegistry() = default;
};

// ---------------------------------------------------------------------------
// ServerRegistry — owns the sessions of all connected servers.
//
// Sessions are kept in registration order. When two servers expose the same
// tool name the first registered one wins; the collision is logged once when
// the second server is added.
// ---------------------------------------------------------------------------
class ServerRegistry : public IToolRegistry {
public:
    ServerRegistry() = default;

    /// Register an initialized session.
    void Add(std::unique_ptr<McpSession> session);

    /// Spawn, handshake and register every configured server. A server that
    /// fails to start or initialize is logged and skipped. Returns the number
    /// of servers connected.
    size_t ConnectAll(const std::vector<ServerLaunchSpec>& servers);

    /// Callable tools only: a shadowed name is listed once, under its owner.
    [[nodiscard]] std::vector<OwnedTool> ListAllTools() const override;

    /// Every (server, tool) pair in registration order, shadowed ones marked.
    [[nodiscard]] std::vector<CatalogEntry> ListCatalog() const;

    [[nodiscard]] std::optional<std::string> FindServerForTool(
        const std::string& name) const;

    [[nodiscard]] ToolResult CallTool(const std::string& name,
                                      const nlohmann::json& arguments) override;

    [[nodiscard]] size_t ServerCount() const noexcept { return sessions_.size(); }
    [[nodiscard]] bool HasServers() const noexcept { return !sessions_.empty(); }

private:
    McpSession* FindSessionForTool(const std::string& name) const;

    std::vector<std::unique_ptr<McpSession>> sessions_;
};

} // namespace edge_agent
