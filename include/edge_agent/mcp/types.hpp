#pragma once

#include <edge_agent/core/result.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace edge_agent {

// MCP protocol revision this client speaks.
constexpr const char* kMcpProtocolVersion = "2025-06-18";

// ---------------------------------------------------------------------------
// Tool catalog
// ---------------------------------------------------------------------------
struct ToolInputSchema {
    std::string type = "object";
    nlohmann::json properties = nlohmann::json::object();
    std::vector<std::string> required;
};

struct McpTool {
    std::string name;
    std::optional<std::string> description;
    ToolInputSchema input_schema;
};

// ---------------------------------------------------------------------------
// Handshake
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::string name;
    std::string version;
};

struct ServerCapabilities {
    bool tools = false;
    bool tools_list_changed = false;
    bool logging = false;
    bool prompts = false;
    bool resources = false;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    ServerInfo server_info;
    std::optional<std::string> instructions;
};

// ---------------------------------------------------------------------------
// Tool call content — closed tagged union with a placeholder for unknown
// block types.
// ---------------------------------------------------------------------------
struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data;
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
};

struct UnknownContent {
    std::string type;
};

using ToolContent =
    std::variant<TextContent, ImageContent, ResourceContent, UnknownContent>;

/// Normalized outcome of tools/call: concatenated text (each block followed
/// by a newline) and success derived from isError (absent means success).
struct CallResult {
    std::string text;
    bool success = true;
};

// ---------------------------------------------------------------------------
// Agent-facing call and result types
// ---------------------------------------------------------------------------
struct ToolCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();

    bool operator==(const ToolCall& other) const {
        return name == other.name && arguments == other.arguments;
    }
};

struct ToolResult {
    std::string name;
    bool success = false;
    std::string output;
};

// -- Parsing ----------------------------------------------------------------

[[nodiscard]] Result<McpTool, Error> ParseTool(const nlohmann::json& j);
[[nodiscard]] nlohmann::json ToolToJson(const McpTool& tool);
[[nodiscard]] Result<InitializeResult, Error> ParseInitializeResult(
    const nlohmann::json& j);
[[nodiscard]] ToolContent ParseContent(const nlohmann::json& j);
[[nodiscard]] std::string ContentToText(const ToolContent& content);
[[nodiscard]] Result<CallResult, Error> ParseCallResult(const nlohmann::json& j);

} // namespace edge_agent
