#pragma once

#include <edge_agent/mcp/types.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace edge_agent {

// ---------------------------------------------------------------------------
// Tool catalog rendering for the model prompt.
// ---------------------------------------------------------------------------

/// Placeholder value for one JSON Schema: "default", else the first "enum"
/// entry, else a value by "type".
[[nodiscard]] nlohmann::json SampleValueForSchema(const nlohmann::json& schema);

/// Arguments object built from the required properties (all properties when
/// none are required), keys sorted. {"example": "value"} when empty.
[[nodiscard]] nlohmann::json BuildSampleArguments(const McpTool& tool);

/// A bracketed-JSON tool call block that DetectToolCalls parses back into
/// {tool.name, BuildSampleArguments(tool)}.
[[nodiscard]] std::string BuildToolSampleBlock(const McpTool& tool);

/// The text placed inside <tools>: one section per tool plus the call format.
/// Returns an empty string when `tools` is empty.
[[nodiscard]] std::string BuildToolInfo(const std::vector<McpTool>& tools);

/// Definitions of the locally handled read_file / write_file tools.
[[nodiscard]] std::vector<McpTool> BuiltinFileTools();

/// Pick the MCP tool best suited for writing a file:
///   0: exactly "write_file" or "writefile" (case-insensitive)
///   1: name contains both "write" and "file"
///   2: input schema has "path" and "content" properties
/// Ties go to the earliest tool. nullopt when nothing qualifies.
[[nodiscard]] std::optional<std::string> SelectWriteToolName(
    const std::vector<McpTool>& tools);

} // namespace edge_agent
