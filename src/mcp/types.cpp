#include <edge_agent/mcp/types.hpp>

namespace edge_agent {

namespace {

Error MakeShapeError(const std::string& operation, const std::string& message) {
    return Error{operation, "", message, std::nullopt, ErrorCategory::Protocol};
}

std::optional<std::string> OptionalString(const nlohmann::json& j,
                                          const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string StringOr(const nlohmann::json& j, const char* key,
                     const std::string& fallback = "") {
    return OptionalString(j, key).value_or(fallback);
}

bool BoolOr(const nlohmann::json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

// One overload per content variant.
std::string Render(const TextContent& c) { return c.text; }
std::string Render(const ImageContent& c) { return "[Image: " + c.mime_type + "]"; }
std::string Render(const ResourceContent& c) { return "[Resource: " + c.uri + "]"; }
std::string Render(const UnknownContent& c) {
    return "[Unsupported content: " + c.type + "]";
}

} // anonymous namespace

Result<McpTool, Error> ParseTool(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        return Result<McpTool, Error>::Err(
            MakeShapeError("ParseTool", "Tool entry without a string 'name'"));
    }
    McpTool tool;
    tool.name = j["name"].get<std::string>();
    tool.description = OptionalString(j, "description");

    if (j.contains("inputSchema") && j["inputSchema"].is_object()) {
        const auto& schema = j["inputSchema"];
        tool.input_schema.type = StringOr(schema, "type", "object");
        if (schema.contains("properties") && schema["properties"].is_object()) {
            tool.input_schema.properties = schema["properties"];
        }
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& r : schema["required"]) {
                if (r.is_string()) {
                    tool.input_schema.required.push_back(r.get<std::string>());
                }
            }
        }
    }
    return Result<McpTool, Error>::Ok(std::move(tool));
}

nlohmann::json ToolToJson(const McpTool& tool) {
    nlohmann::json j = {
        {"name", tool.name},
        {"inputSchema", {
            {"type", tool.input_schema.type},
            {"properties", tool.input_schema.properties},
            {"required", tool.input_schema.required},
        }},
    };
    if (tool.description.has_value()) {
        j["description"] = *tool.description;
    }
    return j;
}

Result<InitializeResult, Error> ParseInitializeResult(const nlohmann::json& j) {
    using R = Result<InitializeResult, Error>;
    if (!j.is_object()) {
        return R::Err(MakeShapeError("initialize", "Result is not an object"));
    }
    InitializeResult result;
    result.protocol_version = StringOr(j, "protocolVersion");

    if (j.contains("capabilities") && j["capabilities"].is_object()) {
        const auto& caps = j["capabilities"];
        if (caps.contains("tools") && !caps["tools"].is_null()) {
            result.capabilities.tools = true;
            if (caps["tools"].is_object()) {
                result.capabilities.tools_list_changed =
                    BoolOr(caps["tools"], "listChanged", false);
            }
        }
        result.capabilities.logging = caps.contains("logging") && !caps["logging"].is_null();
        result.capabilities.prompts = caps.contains("prompts") && !caps["prompts"].is_null();
        result.capabilities.resources =
            caps.contains("resources") && !caps["resources"].is_null();
    }

    if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
        result.server_info.name = StringOr(j["serverInfo"], "name");
        result.server_info.version = StringOr(j["serverInfo"], "version");
    }
    result.instructions = OptionalString(j, "instructions");
    return R::Ok(std::move(result));
}

ToolContent ParseContent(const nlohmann::json& j) {
    const std::string type = j.is_object() ? StringOr(j, "type") : "";
    if (type == "text") {
        return TextContent{StringOr(j, "text")};
    }
    if (type == "image") {
        return ImageContent{StringOr(j, "data"), StringOr(j, "mimeType")};
    }
    if (type == "resource" && j.contains("resource") && j["resource"].is_object()) {
        const auto& r = j["resource"];
        return ResourceContent{StringOr(r, "uri"), OptionalString(r, "mimeType"),
                               OptionalString(r, "text")};
    }
    return UnknownContent{type.empty() ? "unknown" : type};
}

std::string ContentToText(const ToolContent& content) {
    return std::visit([](const auto& c) { return Render(c); }, content);
}

Result<CallResult, Error> ParseCallResult(const nlohmann::json& j) {
    using R = Result<CallResult, Error>;
    if (!j.is_object()) {
        return R::Err(MakeShapeError("tools/call", "Result is not an object"));
    }
    CallResult result;
    if (j.contains("content") && j["content"].is_array()) {
        for (const auto& block : j["content"]) {
            result.text += ContentToText(ParseContent(block));
            result.text += '\n';
        }
    }
    result.success = !BoolOr(j, "isError", false);
    return R::Ok(std::move(result));
}

} // namespace edge_agent
