#pragma once

#include <edge_agent/prompt/prompt_builder.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

// A whole file the model wrote inline in its reply.
struct FileOutput {
    std::string path;
    std::string content;

    bool operator==(const FileOutput& other) const {
        return path == other.path && content == other.content;
    }
};

/// File blocks in a model reply, in two syntaxes:
///   <file path="p">content</file>
///   [CREATE_FILE: p] ```lang\ncontent\n``` [END_FILE]
/// All <file> blocks come first, then all [CREATE_FILE] blocks, each in
/// order of appearance. Paths are trimmed. Content is verbatim apart from
/// one newline directly after the opening tag and one before </file>.
/// Incomplete blocks are ignored.
[[nodiscard]] std::vector<FileOutput> ParseFileOutputs(std::string_view text);

/// Equal after CRLF -> LF and trailing whitespace removal.
[[nodiscard]] bool ContentsEqual(std::string_view a, std::string_view b);

struct SkippedOutput {
    std::string path;
    std::string matching_input;
};

struct FileOutputPlan {
    std::vector<FileOutput> writes;
    std::vector<SkippedOutput> unchanged;  // content equals an attached input
    bool remapped = false;                 // every write now targets the sole output target
};

/// Decide what to write. Blocks whose content equals an attached input are
/// dropped. When exactly one output target exists and every remaining block
/// names an attached input path, all blocks are redirected to that target.
[[nodiscard]] FileOutputPlan PlanFileOutputs(std::vector<FileOutput> outputs,
                                             const std::vector<AttachedFile>& inputs,
                                             const std::vector<std::string>& output_targets);

} // namespace edge_agent
