#include <edge_agent/mcp/mcp_session.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/version.hpp>

#include <algorithm>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "session";

} // anonymous namespace

nlohmann::json BuildInitializeParams() {
    return {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", {
            {"roots", {{"listChanged", false}}},
        }},
        {"clientInfo", {
            {"name", "edge-agent"},
            {"version", kVersion},
        }},
    };
}

McpSession::McpSession(std::string server_name,
                       std::unique_ptr<ITransport> transport)
    : server_name_(std::move(server_name)), transport_(std::move(transport)) {}

Result<ServerCapabilities, Error> McpSession::Initialize() {
    using R = Result<ServerCapabilities, Error>;
    if (initialized_.has_value()) {
        return R::Ok(initialized_->capabilities);
    }

    auto response = transport_->Request("initialize", BuildInitializeParams());
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    auto parsed = ParseInitializeResult(
        response.Value().result.value_or(nlohmann::json::object()));
    if (parsed.IsErr()) {
        auto error = std::move(parsed).Error();
        error.target = server_name_;
        return R::Err(std::move(error));
    }
    auto handshake = std::move(parsed).Value();

    if (handshake.protocol_version != kMcpProtocolVersion) {
        LogWarn(kComponent, "Server '" + server_name_ + "' speaks protocol " +
                                (handshake.protocol_version.empty()
                                     ? std::string("<none>")
                                     : handshake.protocol_version) +
                                ", client requested " + kMcpProtocolVersion);
    }
    LogInfo(kComponent, "Connected to '" + server_name_ + "' (" +
                            handshake.server_info.name + " " +
                            handshake.server_info.version + ")");

    auto notified = transport_->Notify("notifications/initialized",
                                       nlohmann::json::object());
    if (notified.IsErr()) {
        return R::Err(std::move(notified).Error());
    }

    const bool has_tools = handshake.capabilities.tools;
    initialized_ = std::move(handshake);

    if (has_tools) {
        auto refreshed = RefreshTools();
        if (refreshed.IsErr()) {
            return R::Err(std::move(refreshed).Error());
        }
    } else {
        LogInfo(kComponent, "Server '" + server_name_ + "' offers no tools");
    }
    return R::Ok(initialized_->capabilities);
}

Result<void, Error> McpSession::RefreshTools() {
    auto response = transport_->Request("tools/list", nlohmann::json::object());
    if (response.IsErr()) {
        return Result<void, Error>::Err(std::move(response).Error());
    }
    const auto result = response.Value().result.value_or(nlohmann::json::object());
    if (!result.contains("tools") || !result["tools"].is_array()) {
        return Result<void, Error>::Err(Error{
            "tools/list", server_name_, "Response has no 'tools' array",
            std::nullopt, ErrorCategory::Protocol});
    }

    std::vector<McpTool> tools;
    for (const auto& entry : result["tools"]) {
        auto tool = ParseTool(entry);
        if (tool.IsErr()) {
            LogWarn(kComponent, "Skipping tool from '" + server_name_ +
                                    "': " + tool.Error().message);
            continue;
        }
        tools.push_back(std::move(tool).Value());
    }

    if (result.contains("nextCursor") && !result["nextCursor"].is_null()) {
        LogWarn(kComponent, "Server '" + server_name_ +
                                "' paginates tools/list; only the first page is used");
    }

    tools_ = std::move(tools);
    LogInfo(kComponent, "Server '" + server_name_ + "' provides " +
                            std::to_string(tools_.size()) + " tool(s)");
    return Result<void, Error>::Ok();
}

Result<CallResult, Error> McpSession::CallTool(const std::string& name,
                                               const nlohmann::json& arguments) {
    using R = Result<CallResult, Error>;
    if (!initialized_.has_value()) {
        return R::Err(Error{"tools/call", server_name_,
                            "Session is not initialized", std::nullopt,
                            ErrorCategory::Protocol});
    }
    auto response = transport_->Request(
        "tools/call", {{"name", name}, {"arguments", arguments}});
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }
    auto parsed = ParseCallResult(response.Value().result.value_or(nlohmann::json::object()));
    if (parsed.IsErr()) {
        auto error = std::move(parsed).Error();
        error.target = server_name_;
        return R::Err(std::move(error));
    }
    return parsed;
}

bool McpSession::HasTool(const std::string& name) const {
    return std::any_of(tools_.begin(), tools_.end(),
                       [&](const McpTool& t) { return t.name == name; });
}

} // namespace edge_agent
