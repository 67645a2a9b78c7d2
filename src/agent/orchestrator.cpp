#include <edge_agent/agent/orchestrator.hpp>

#include <edge_agent/agent/tool_call_detector.hpp>
#include <edge_agent/core/log.hpp>
#include <edge_agent/mcp/tool_samples.hpp>
#include <edge_agent/prompt/file_output_parser.hpp>

#include <set>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "orchestrator";

std::optional<std::string> StringArgument(const ToolCall& call, const char* key) {
    if (!call.arguments.is_object() || !call.arguments.contains(key) ||
        !call.arguments[key].is_string()) {
        return std::nullopt;
    }
    return call.arguments[key].get<std::string>();
}

ToolResult Failure(const std::string& name, const std::string& message) {
    return ToolResult{name, false, "Error: " + message};
}

} // anonymous namespace

Orchestrator::Orchestrator(IModelRuntime& model,
                           IToolRegistry& tools,
                           IFileSystem& files,
                           IConfirmer& confirmer,
                           OrchestratorOptions options,
                           std::ostream& out)
    : model_(model),
      tools_(tools),
      files_(files),
      confirmer_(confirmer),
      options_(std::move(options)),
      out_(out),
      builder_(BuildChatPrompt),
      policy_(DefaultRoundPolicy) {}

bool Orchestrator::IsLocalTool(const std::string& name) const {
    return !options_.tool_only && (name == kReadFileTool || name == kWriteFileTool);
}

std::vector<McpTool> Orchestrator::AdvertisedTools() const {
    std::vector<McpTool> advertised;
    if (!options_.tool_only) {
        advertised = BuiltinFileTools();
    }
    for (auto& owned : tools_.ListAllTools()) {
        if (IsLocalTool(owned.second.name)) {
            continue;  // shadowed by the local implementation
        }
        advertised.push_back(std::move(owned.second));
    }
    return advertised;
}

std::string Orchestrator::DesignatedWriteTool() const {
    if (!options_.tool_only) {
        return kWriteFileTool;
    }
    std::vector<McpTool> mcp_tools;
    for (auto& owned : tools_.ListAllTools()) {
        mcp_tools.push_back(std::move(owned.second));
    }
    return SelectWriteToolName(mcp_tools).value_or("");
}

Result<TurnOutcome, Error> Orchestrator::RunTurn(
    const std::string& user_text,
    const std::vector<AttachedFile>& files,
    const std::vector<std::string>& output_targets,
    const std::vector<FileLoadError>& file_errors) {
    using R = Result<TurnOutcome, Error>;

    PromptInputs inputs;
    inputs.user_text = user_text;
    inputs.files = files;
    inputs.file_errors = file_errors;
    inputs.output_targets = output_targets;
    inputs.tool_info = BuildToolInfo(AdvertisedTools());

    const std::string write_tool = DesignatedWriteTool();
    const PromptBuilder templated = [this](const PromptInputs& in) {
        return ApplyChatTemplate(options_.chat_template, builder_(in));
    };

    TurnOutcome outcome;
    std::set<std::string> seen;
    int round = 0;

    while (true) {
        inputs.tool_results = outcome.results;
        auto budgeted = BuildPromptWithinBudget(templated, inputs, options_.budget);
        if (budgeted.IsErr()) {
            return R::Err(std::move(budgeted).Error());
        }
        const auto prompt = std::move(budgeted).Value().prompt;

        if (options_.preview_prompt) {
            out_ << "----- prompt (round " << round << ") -----\n"
                 << prompt << "\n-----\n";
        }

        LogDebug(kComponent, "Round " + std::to_string(round) + ": running model");
        TokenCallback on_token;
        if (options_.stream_output) {
            on_token = [this](std::string_view chunk) {
                out_ << chunk;
                out_.flush();
            };
        }
        auto generated = model_.Run(prompt, on_token);
        ++outcome.rounds;
        if (generated.IsErr()) {
            return R::Err(std::move(generated).Error());
        }
        outcome.final_response = std::move(generated).Value();
        if (options_.stream_output) {
            out_ << "\n";
        } else {
            const auto visible = StripToolCallBlocks(outcome.final_response);
            if (!visible.empty()) {
                out_ << visible << "\n";
            }
        }

        const auto calls = DetectToolCalls(outcome.final_response);
        const auto allowance = policy_(round);
        int executed = 0;
        bool blocked = false;

        for (const auto& call : calls) {
            if (allowance == RoundAllowance::WriteOnly && call.name != write_tool) {
                LogWarn(kComponent, "Blocked tool '" + call.name +
                                        "': only the write tool may run in round " +
                                        std::to_string(round));
                out_ << "[Tool '" << call.name << "' blocked in this round]\n";
                outcome.blocked.push_back(call.name);
                blocked = true;
                continue;
            }
            if (!seen.insert(call.name).second) {
                LogWarn(kComponent, "Blocked tool '" + call.name +
                                        "': already executed this turn");
                out_ << "[Tool '" << call.name << "' already called this turn]\n";
                outcome.blocked.push_back(call.name);
                blocked = true;
                continue;
            }

            out_ << "[Tool: " << call.name << "]\n";
            auto result = Dispatch(call);
            out_ << "[Tool: " << call.name << (result.success ? " done" : " failed") << "]\n";
            outcome.results.push_back(std::move(result));
            ++executed;
        }

        if (blocked) {
            outcome.end = TurnEnd::Blocked;
            return R::Ok(std::move(outcome));
        }
        if (executed == 0) {
            outcome.end = TurnEnd::FinalAnswer;
            return R::Ok(std::move(outcome));
        }

        ++round;
        if (round >= options_.max_rounds) {
            LogWarn(kComponent, "Tool round limit reached (" +
                                    std::to_string(options_.max_rounds) + ")");
            out_ << "[Tool round limit reached]\n";
            outcome.end = TurnEnd::RoundLimit;
            return R::Ok(std::move(outcome));
        }
    }
}

// ---------------------------------------------------------------------------
// File blocks
// ---------------------------------------------------------------------------
std::vector<ToolResult> Orchestrator::ApplyFileOutputs(
    const std::string& response,
    const std::vector<AttachedFile>& files,
    const std::vector<std::string>& output_targets) {
    std::vector<ToolResult> results;
    auto outputs = ParseFileOutputs(response);
    if (outputs.empty()) {
        return results;
    }
    out_ << "[Detected " << outputs.size() << " file output(s)]\n";

    auto plan = PlanFileOutputs(std::move(outputs), files, output_targets);
    for (const auto& skipped : plan.unchanged) {
        out_ << "[Skipped unchanged (matches input " << skipped.matching_input
             << "): " << skipped.path << "]\n";
    }
    if (plan.remapped) {
        out_ << "[Remapped file output(s) to " << output_targets.front() << "]\n";
    }

    const std::string write_tool = DesignatedWriteTool();
    if (write_tool.empty()) {
        LogWarn(kComponent, "No write tool available; skipping " +
                                std::to_string(plan.writes.size()) + " file output(s)");
        out_ << "[No write tool available; file outputs skipped]\n";
        return results;
    }

    for (auto& output : plan.writes) {
        ToolCall call{write_tool, {{"path", output.path}, {"content", std::move(output.content)}}};
        auto result = Dispatch(call);
        out_ << "[" << (result.success ? "Wrote" : "Not written") << ": " << output.path << "]\n";
        if (!result.success) {
            LogWarn(kComponent, "File output '" + output.path + "' not written: " + result.output);
        }
        results.push_back(std::move(result));
    }
    return results;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
ToolResult Orchestrator::Dispatch(const ToolCall& call) {
    if (IsLocalTool(call.name)) {
        return call.name == kReadFileTool ? ReadFileTool(call) : WriteFileTool(call);
    }
    if (options_.confirm_writes && call.name == DesignatedWriteTool()) {
        const auto path = StringArgument(call, "path").value_or(call.name);
        if (!confirmer_.ConfirmWrite(path)) {
            return Failure(call.name, "write cancelled by user");
        }
    }
    return tools_.CallTool(call.name, call.arguments);
}

ToolResult Orchestrator::ReadFileTool(const ToolCall& call) {
    const auto path = StringArgument(call, "path");
    if (!path) {
        return Failure(call.name, "missing string argument 'path'");
    }
    auto content = files_.ReadFile(*path);
    if (content.IsErr()) {
        return Failure(call.name, content.Error().message);
    }
    LogInfo(kComponent, "read_file " + *path);
    return ToolResult{call.name, true, std::move(content).Value()};
}

ToolResult Orchestrator::WriteFileTool(const ToolCall& call) {
    const auto path = StringArgument(call, "path");
    const auto content = StringArgument(call, "content");
    if (!path || !content) {
        return Failure(call.name, "arguments 'path' and 'content' must be strings");
    }

    if (files_.Exists(*path)) {
        if (!confirmer_.ConfirmOverwrite(*path)) {
            return Failure(call.name, "overwrite of '" + *path + "' declined by user");
        }
    } else if (options_.confirm_writes && !confirmer_.ConfirmWrite(*path)) {
        return Failure(call.name, "write of '" + *path + "' declined by user");
    }

    auto written = files_.WriteFile(*path, *content);
    if (written.IsErr()) {
        return Failure(call.name, written.Error().message);
    }
    LogInfo(kComponent, "write_file " + *path);
    return ToolResult{call.name, true,
                      "Wrote " + std::to_string(content->size()) + " bytes to " + *path};
}

} // namespace edge_agent
