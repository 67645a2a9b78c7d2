#pragma once

#include <edge_agent/mcp/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

// ---------------------------------------------------------------------------
// Tool call detection in raw model output.
//
// Two syntaxes are recognized:
//
//   [TOOL_CALL]
//   {"name": "get_weather", "arguments": {"city": "Tokyo"}}
//   [END_TOOL_CALL]
//
//   <tool_call name="get_weather">
//     <argument name="city">Tokyo</argument>
//   </tool_call>
//
// The body of <tool_call> may also be a JSON object, which is then used as
// the arguments directly. Argument values are JSON-parsed when possible and
// kept as strings otherwise.
//
// All bracketed calls are returned first, then all tagged calls, each group
// in order of appearance. A malformed occurrence is skipped on its own.
// ---------------------------------------------------------------------------

[[nodiscard]] std::vector<ToolCall> DetectToolCalls(std::string_view text);

/// The text with every tool call block (either syntax) removed, for display.
[[nodiscard]] std::string StripToolCallBlocks(std::string_view text);

} // namespace edge_agent
