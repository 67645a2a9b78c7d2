#pragma once

#include <edge_agent/mcp/types.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

// A file whose content is attached to the prompt as read-only context.
struct AttachedFile {
    std::string path;     // as the user wrote it
    std::string content;
};

// A file the user referenced that could not be loaded.
struct FileLoadError {
    std::string path;
    std::string message;
};

// ---------------------------------------------------------------------------
// PromptInputs — everything a prompt is built from.
// ---------------------------------------------------------------------------
struct PromptInputs {
    std::string user_text;
    std::vector<AttachedFile> files;
    std::vector<FileLoadError> file_errors;
    std::string tool_info;                    // rendered <tools> body
    std::vector<std::string> output_targets;  // paths the user wants written
    std::vector<ToolResult> tool_results;     // accumulated this turn
};

using PromptBuilder = std::function<std::string(const PromptInputs&)>;

/// Sectioned prompt:
///   <system> instructions (+ file-operation instructions on write intent)
///   <tools> ... </tools>
///   <files> <file path=".."> .. </file> <file_error ..> </files>
///   <output_targets> <target>..</target> </output_targets>
///   <tool_results> <tool_result name=".." status=".."> </tool_results>
///   <user_input> .. </user_input>
/// Empty sections are omitted.
[[nodiscard]] std::string BuildChatPrompt(const PromptInputs& inputs);

/// Substitute the prompt for "{prompt}" in a chat template. An empty
/// template returns the prompt unchanged.
[[nodiscard]] std::string ApplyChatTemplate(std::string_view chat_template,
                                            std::string_view prompt);

/// Qwen-style template used when none is configured.
constexpr const char* kDefaultChatTemplate =
    "<|im_start|>user\n{prompt}<|im_end|>\n<|im_start|>assistant\n";

} // namespace edge_agent
