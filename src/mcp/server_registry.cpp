#include <edge_agent/mcp/server_registry.hpp>

#include <edge_agent/core/log.hpp>

#include <set>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "registry";

} // anonymous namespace

void ServerRegistry::Add(std::unique_ptr<McpSession> session) {
    for (const auto& tool : session->Tools()) {
        if (auto owner = FindServerForTool(tool.name)) {
            LogWarn(kComponent, "Tool '" + tool.name + "' from '" +
                                    session->ServerName() +
                                    "' is shadowed by server '" + *owner + "'");
        }
    }
    sessions_.push_back(std::move(session));
}

size_t ServerRegistry::ConnectAll(const std::vector<ServerLaunchSpec>& servers) {
    size_t connected = 0;
    for (const auto& spec : servers) {
        LogInfo(kComponent, "Connecting to MCP server '" + spec.name + "'");
        auto transport = StdioTransport::Spawn(spec);
        if (transport.IsErr()) {
            LogError(kComponent, "Failed to connect to MCP server '" + spec.name +
                                     "': " + transport.Error().ToString());
            continue;
        }
        auto session = std::make_unique<McpSession>(
            spec.name, std::move(transport).Value());
        auto initialized = session->Initialize();
        if (initialized.IsErr()) {
            LogError(kComponent, "Failed to initialize MCP server '" + spec.name +
                                     "': " + initialized.Error().ToString());
            continue;
        }
        Add(std::move(session));
        ++connected;
    }
    return connected;
}

std::vector<OwnedTool> ServerRegistry::ListAllTools() const {
    std::vector<OwnedTool> all;
    std::set<std::string> seen;
    for (const auto& session : sessions_) {
        for (const auto& tool : session->Tools()) {
            if (seen.insert(tool.name).second) {
                all.emplace_back(session->ServerName(), tool);
            }
        }
    }
    return all;
}

std::vector<CatalogEntry> ServerRegistry::ListCatalog() const {
    std::vector<CatalogEntry> catalog;
    for (const auto& session : sessions_) {
        for (const auto& tool : session->Tools()) {
            CatalogEntry entry{session->ServerName(), tool, std::nullopt};
            auto owner = FindServerForTool(tool.name);
            if (owner && *owner != entry.server) {
                entry.shadowed_by = *owner;
            }
            catalog.push_back(std::move(entry));
        }
    }
    return catalog;
}

McpSession* ServerRegistry::FindSessionForTool(const std::string& name) const {
    for (const auto& session : sessions_) {
        if (session->HasTool(name)) {
            return session.get();
        }
    }
    return nullptr;
}

std::optional<std::string> ServerRegistry::FindServerForTool(
    const std::string& name) const {
    if (auto* session = FindSessionForTool(name)) {
        return session->ServerName();
    }
    return std::nullopt;
}

ToolResult ServerRegistry::CallTool(const std::string& name,
                                    const nlohmann::json& arguments) {
    auto* session = FindSessionForTool(name);
    if (session == nullptr) {
        return ToolResult{name, false,
                          "Error: Tool '" + name + "' not found on any connected server"};
    }

    LogInfo(kComponent, "Calling tool '" + name + "' on server '" +
                            session->ServerName() + "'");
    auto result = session->CallTool(name, arguments);
    if (result.IsErr()) {
        LogWarn(kComponent, "Tool '" + name + "' failed: " + result.Error().ToString());
        return ToolResult{name, false, "Error: " + result.Error().message};
    }
    auto call = std::move(result).Value();
    return ToolResult{name, call.success, std::move(call.text)};
}

} // namespace edge_agent
