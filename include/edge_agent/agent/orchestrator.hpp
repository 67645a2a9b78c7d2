#pragma once

#include <edge_agent/agent/collaborators.hpp>
#include <edge_agent/agent/context_budget.hpp>
#include <edge_agent/agent/round_policy.hpp>
#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/server_registry.hpp>
#include <edge_agent/prompt/prompt_builder.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace edge_agent {

constexpr const char* kReadFileTool = "read_file";
constexpr const char* kWriteFileTool = "write_file";

struct OrchestratorOptions {
    int max_rounds = 3;
    // Local read_file / write_file are disabled; writes go through the best
    // matching MCP tool instead.
    bool tool_only = false;
    // Ask before every write, not only before overwriting.
    bool confirm_writes = false;
    // Echo generated text while it is produced.
    bool stream_output = true;
    // Print each assembled prompt before running the model.
    bool preview_prompt = false;
    std::string chat_template;
    BudgetConfig budget;
};

enum class TurnEnd {
    FinalAnswer,  // a round executed no tool call
    Blocked,      // a call was refused; no further round
    RoundLimit,   // max_rounds rounds executed tool calls
};

struct TurnOutcome {
    int rounds = 0;  // model invocations
    std::vector<ToolResult> results;
    std::vector<std::string> blocked;
    std::string final_response;
    TurnEnd end = TurnEnd::FinalAnswer;
};

// ---------------------------------------------------------------------------
// Orchestrator — one user turn of generate / detect / execute / rebuild.
//
// Per turn a tool name executes at most once. The round policy decides which
// calls a round may run; by default only round 0 may call arbitrary tools and
// later rounds may only call the designated write tool. The prompt is rebuilt
// under the token budget every round with all tool results of the turn.
// ---------------------------------------------------------------------------
class Orchestrator {
public:
    Orchestrator(IModelRuntime& model,
                 IToolRegistry& tools,
                 IFileSystem& files,
                 IConfirmer& confirmer,
                 OrchestratorOptions options,
                 std::ostream& out = std::cout);

    void SetPromptBuilder(PromptBuilder builder) { builder_ = std::move(builder); }
    void SetRoundPolicy(RoundPolicy policy) { policy_ = std::move(policy); }

    [[nodiscard]] Result<TurnOutcome, Error> RunTurn(
        const std::string& user_text,
        const std::vector<AttachedFile>& files = {},
        const std::vector<std::string>& output_targets = {},
        const std::vector<FileLoadError>& file_errors = {});

    /// Write the file blocks of a model reply (<file path> or [CREATE_FILE])
    /// through the designated write tool, so the overwrite and confirmation
    /// policy applies. Blocks that repeat an attached input are skipped; with
    /// a single output target, blocks naming only input paths are redirected
    /// to it. Returns one result per attempted write.
    [[nodiscard]] std::vector<ToolResult> ApplyFileOutputs(
        const std::string& response,
        const std::vector<AttachedFile>& files,
        const std::vector<std::string>& output_targets);

    /// The only tool allowed in WriteOnly rounds ("" when there is none).
    [[nodiscard]] std::string DesignatedWriteTool() const;

    /// Tools advertised to the model: built-in file tools (unless tool-only)
    /// followed by every MCP tool.
    [[nodiscard]] std::vector<McpTool> AdvertisedTools() const;

    [[nodiscard]] const OrchestratorOptions& Options() const noexcept { return options_; }

private:
    ToolResult Dispatch(const ToolCall& call);
    ToolResult ReadFileTool(const ToolCall& call);
    ToolResult WriteFileTool(const ToolCall& call);
    bool IsLocalTool(const std::string& name) const;

    IModelRuntime& model_;
    IToolRegistry& tools_;
    IFileSystem& files_;
    IConfirmer& confirmer_;
    OrchestratorOptions options_;
    std::ostream& out_;
    PromptBuilder builder_;
    RoundPolicy policy_;
};

} // namespace edge_agent
