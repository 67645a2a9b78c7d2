#include <edge_agent/mcp/tool_samples.hpp>

#include <edge_agent/core/text.hpp>

#include <algorithm>
#include <set>

namespace edge_agent {

nlohmann::json SampleValueForSchema(const nlohmann::json& schema) {
    if (!schema.is_object()) {
        return "value";
    }
    if (schema.contains("default")) {
        return schema["default"];
    }
    if (schema.contains("enum") && schema["enum"].is_array() &&
        !schema["enum"].empty()) {
        return schema["enum"].front();
    }

    const std::string type =
        schema.contains("type") && schema["type"].is_string()
            ? schema["type"].get<std::string>()
            : "";
    if (type == "string") {
        return "example";
    }
    if (type == "integer" || type == "number") {
        return 0;
    }
    if (type == "boolean") {
        return true;
    }
    if (type == "array") {
        if (schema.contains("items")) {
            return nlohmann::json::array({SampleValueForSchema(schema["items"])});
        }
        return nlohmann::json::array();
    }
    if (type == "object") {
        return nlohmann::json::object();
    }
    return "value";
}

nlohmann::json BuildSampleArguments(const McpTool& tool) {
    const auto& properties = tool.input_schema.properties;
    const std::set<std::string> required(tool.input_schema.required.begin(),
                                         tool.input_schema.required.end());

    // nlohmann::json objects iterate in sorted key order.
    nlohmann::json args = nlohmann::json::object();
    if (properties.is_object()) {
        for (const auto& [key, schema] : properties.items()) {
            if (required.empty() || required.count(key) > 0) {
                args[key] = SampleValueForSchema(schema);
            }
        }
    }
    if (args.empty()) {
        args["example"] = "value";
    }
    return args;
}

std::string BuildToolSampleBlock(const McpTool& tool) {
    nlohmann::json call = {
        {"name", tool.name},
        {"arguments", BuildSampleArguments(tool)},
    };
    return "[TOOL_CALL]\n" + call.dump(2) + "\n[END_TOOL_CALL]\n";
}

std::string BuildToolInfo(const std::vector<McpTool>& tools) {
    if (tools.empty()) {
        return "";
    }
    std::string info = "## Available Tools\n\n";
    for (const auto& tool : tools) {
        info += "### " + tool.name + "\n";
        if (tool.description.has_value() && !tool.description->empty()) {
            info += *tool.description + "\n";
        }
        info += "\nSample:\n";
        info += BuildToolSampleBlock(tool);
        info += "\n";
    }
    info +=
        "To use a tool, output exactly one block per call in this format:\n\n"
        "[TOOL_CALL]\n"
        "{\n"
        "  \"name\": \"tool_name\",\n"
        "  \"arguments\": {\n"
        "    \"argument_name\": \"value\"\n"
        "  }\n"
        "}\n"
        "[END_TOOL_CALL]\n\n"
        "Each tool can be called at most once per turn. After tool results are "
        "returned, answer the user or call the write tool to save output.\n";
    return info;
}

std::vector<McpTool> BuiltinFileTools() {
    McpTool read_file;
    read_file.name = "read_file";
    read_file.description = "Read a local text file (max 1 MiB).";
    read_file.input_schema.properties = {
        {"path", {{"type", "string"}, {"description", "File path"}}},
    };
    read_file.input_schema.required = {"path"};

    McpTool write_file;
    write_file.name = "write_file";
    write_file.description =
        "Write text to a local file, creating parent directories. "
        "Existing files are only overwritten after confirmation.";
    write_file.input_schema.properties = {
        {"path", {{"type", "string"}, {"description", "File path"}}},
        {"content", {{"type", "string"}, {"description", "Full file content"}}},
    };
    write_file.input_schema.required = {"path", "content"};

    return {read_file, write_file};
}

std::optional<std::string> SelectWriteToolName(const std::vector<McpTool>& tools) {
    std::optional<std::string> best;
    int best_rank = 3;
    for (const auto& tool : tools) {
        const auto lower = ToLowerAscii(tool.name);
        int rank = 3;
        if (lower == "write_file" || lower == "writefile") {
            rank = 0;
        } else if (lower.find("write") != std::string::npos &&
                   lower.find("file") != std::string::npos) {
            rank = 1;
        } else if (tool.input_schema.properties.is_object() &&
                   tool.input_schema.properties.contains("path") &&
                   tool.input_schema.properties.contains("content")) {
            rank = 2;
        }
        if (rank < best_rank) {
            best_rank = rank;
            best = tool.name;
        }
    }
    return best;
}

} // namespace edge_agent
