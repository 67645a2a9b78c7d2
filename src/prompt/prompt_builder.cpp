#include <edge_agent/prompt/prompt_builder.hpp>

#include <edge_agent/core/text.hpp>
#include <edge_agent/prompt/intent.hpp>

namespace edge_agent {

namespace {

constexpr const char* kSystemInstructions =
    "You are a helpful coding assistant running on a local CLI.\n"
    "The <files> section is read-only context. Do NOT echo it back. Only create "
    "or modify files the user explicitly asked for.\n"
    "When the user asks for translation, summarization or rewriting, transform "
    "the content accordingly instead of copying the input verbatim.\n"
    "If output targets are provided, write results to those paths and do not "
    "overwrite the source file unless the user says so.\n"
    "Use the available tools for environment actions (e.g. listing or reading "
    "files) instead of fabricating content.\n";

constexpr const char* kFileOperationInstructions =
    "## File Operation Instructions\n\n"
    "Only write files when the user EXPLICITLY asks to create, write or save "
    "them. Do not create example files unless asked.\n"
    "To write a file, call the write tool with the full file content, e.g.:\n\n"
    "[TOOL_CALL]\n"
    "{\n"
    "  \"name\": \"write_file\",\n"
    "  \"arguments\": {\n"
    "    \"path\": \"path/to/file.ext\",\n"
    "    \"content\": \"file content here\"\n"
    "  }\n"
    "}\n"
    "[END_TOOL_CALL]\n\n"
    "Alternatively, reply with the full file content as\n"
    "<file path=\"path/to/file.ext\">\n...\n</file>\n";

} // anonymous namespace

std::string BuildChatPrompt(const PromptInputs& inputs) {
    std::string prompt;

    prompt += "<system>\n";
    prompt += kSystemInstructions;
    if (HasFileOperationIntent(inputs.user_text)) {
        prompt += "\n";
        prompt += kFileOperationInstructions;
    }
    prompt += "</system>\n\n";

    const auto tool_info = Trim(inputs.tool_info);
    if (!tool_info.empty()) {
        prompt += "<tools>\n";
        prompt += tool_info;
        prompt += "\n</tools>\n\n";
    }

    if (!inputs.files.empty() || !inputs.file_errors.empty()) {
        prompt += "<files>\n";
        for (const auto& file : inputs.files) {
            prompt += "<file path=\"" + file.path + "\">\n" + file.content + "\n</file>\n\n";
        }
        for (const auto& error : inputs.file_errors) {
            prompt += "<file_error path=\"" + error.path + "\">\n" + error.message +
                      "\n</file_error>\n\n";
        }
        prompt += "</files>\n\n";
    }

    if (!inputs.output_targets.empty()) {
        prompt += "<output_targets>\n";
        for (const auto& target : inputs.output_targets) {
            prompt += "<target>" + target + "</target>\n";
        }
        prompt += "</output_targets>\n\n";
    }

    if (!inputs.tool_results.empty()) {
        prompt += "<tool_results>\n";
        for (const auto& result : inputs.tool_results) {
            prompt += "<tool_result name=\"" + result.name + "\" status=\"" +
                      (result.success ? "success" : "error") + "\">\n" +
                      std::string(TrimRight(result.output)) + "\n</tool_result>\n";
        }
        prompt += "</tool_results>\n\n";
    }

    prompt += "<user_input>\n";
    prompt += inputs.user_text;
    prompt += "\n</user_input>";
    return prompt;
}

std::string ApplyChatTemplate(std::string_view chat_template,
                              std::string_view prompt) {
    constexpr std::string_view kPlaceholder = "{prompt}";
    if (chat_template.empty()) {
        return std::string(prompt);
    }
    const auto pos = chat_template.find(kPlaceholder);
    if (pos == std::string_view::npos) {
        // A template without placeholder is treated as a prefix.
        return std::string(chat_template) + std::string(prompt);
    }
    std::string out(chat_template.substr(0, pos));
    out += prompt;
    out += chat_template.substr(pos + kPlaceholder.size());
    return out;
}

} // namespace edge_agent
