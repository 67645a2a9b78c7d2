#include <edge_agent/agent/orchestrator.hpp>
#include <edge_agent/cli/chat_loop.hpp>
#include <edge_agent/cli/output_formatter.hpp>
#include <edge_agent/config/config_loader.hpp>
#include <edge_agent/core/log.hpp>
#include <edge_agent/core/terminal.hpp>
#include <edge_agent/core/version.hpp>
#include <edge_agent/files/local_file_system.hpp>
#include <edge_agent/mcp/child_process.hpp>
#include <edge_agent/mcp/server_registry.hpp>
#include <edge_agent/runtime/http_model_runtime.hpp>
#include <edge_agent/runtime/process_model_runtime.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 2;

enum class Subcommand { Chat, Tools };

constexpr const char* kHelpText =
    "Usage: edge-agent [chat|tools] [options]\n"
    "\n"
    "Commands:\n"
    "  chat                     Interactive chat with tool calling (default)\n"
    "  tools                    Connect all MCP servers and list their tools\n"
    "\n"
    "Configuration:\n"
    "  -c, --config <file>      YAML config file\n"
    "  --mcp-config <file>      YAML file with a 'servers:' list\n"
    "\n"
    "Model:\n"
    "  --model-command <cmd>    Local inference command (prompt on stdin,\n"
    "                           or substituted for {prompt} in an argument)\n"
    "  --model-arg <arg>        Argument for the model command (repeatable)\n"
    "  --model-url <url>        llama.cpp server, e.g. http://127.0.0.1:8080\n"
    "  --n-predict <n>          Maximum tokens to generate\n"
    "  --chat-template <text>   Chat template containing {prompt}\n"
    "\n"
    "Agent:\n"
    "  --max-prompt-tokens <n>  Prompt token budget (env EDGE_AGENT_MAX_PROMPT_TOKENS)\n"
    "  --reserved-tokens <n>    Tokens kept for the answer (env EDGE_AGENT_RESERVED_TOKENS)\n"
    "  --max-rounds <n>         Tool rounds per turn (default 3)\n"
    "  --detect-ext <list>      Comma-separated extensions to detect; empty disables\n"
    "  --tool-only              Disable local file tools; write through MCP tools\n"
    "  --confirm-writes         Ask before every file write\n"
    "  --preview-prompt         Print each prompt before generation\n"
    "\n"
    "Output:\n"
    "  --json                   JSON output (tools, errors)\n"
    "  --log-file <file>        Also write JSON log lines to this file\n"
    "  --color / --no-color     Force or disable colors (NO_COLOR honoured)\n"
    "  -v, -vv                  Info / debug logging on stderr\n"
    "  --version                Print version\n"
    "  -h, --help               Print this help\n";

bool HasFlag(int argc, const char* const* argv, std::string_view a, std::string_view b = {}) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == a || (!b.empty() && arg == b)) {
            return true;
        }
    }
    return false;
}

// Drop argv[0]'s subcommand and the verbosity flags handled here; argparse
// sees only the remaining options.
std::vector<const char*> StripHandledArgs(int argc, const char* const* argv,
                                          bool has_subcommand) {
    std::vector<const char*> out;
    out.push_back(argv[0]);
    for (int i = has_subcommand ? 2 : 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv") {
            continue;
        }
        out.push_back(argv[i]);
    }
    return out;
}

std::unique_ptr<edge_agent::IModelRuntime> MakeRuntime(const edge_agent::ModelConfig& model,
                                                       edge_agent::Error* error) {
    using namespace edge_agent;
    if (model.backend == ModelBackend::Http) {
        auto endpoint = ParseHttpEndpoint(model.url);
        if (endpoint.IsErr()) {
            *error = endpoint.Error();
            return nullptr;
        }
        return std::make_unique<HttpModelRuntime>(std::move(endpoint).Value(), model.n_predict);
    }
    return std::make_unique<ProcessModelRuntime>(ProcessSpec{model.command, model.args, {}});
}

int RunTools(edge_agent::ServerRegistry& registry, const edge_agent::AgentConfig& config,
             const edge_agent::OutputFormatter& formatter) {
    using namespace edge_agent;
    formatter.PrintTable(ToolCatalogTable(registry.ListCatalog(), !config.tool_only));
    return kExitSuccess;
}

int RunChat(edge_agent::ServerRegistry& registry, const edge_agent::AgentConfig& config,
            const edge_agent::OutputFormatter& formatter) {
    using namespace edge_agent;
    auto valid = ValidateModelConfig(config.model);
    if (valid.IsErr()) {
        formatter.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }
    Error runtime_error;
    auto runtime = MakeRuntime(config.model, &runtime_error);
    if (!runtime) {
        formatter.PrintError(runtime_error);
        return runtime_error.ExitCode();
    }

    LocalFileSystem files;
    StreamConfirmer confirmer;

    OrchestratorOptions options;
    options.max_rounds = config.max_rounds;
    options.tool_only = config.tool_only;
    options.confirm_writes = config.confirm_writes;
    options.preview_prompt = config.preview_prompt;
    options.chat_template = config.model.chat_template.value_or(kDefaultChatTemplate);
    options.budget = config.budget;

    Orchestrator orchestrator(*runtime, registry, files, confirmer, options);

    ChatOptions chat_options;
    chat_options.detect_extensions = config.detect_extensions;
    chat_options.tool_only = config.tool_only;

    std::cout << "edge-agent " << kVersion << " ("
              << registry.ServerCount() << " MCP server(s), "
              << orchestrator.AdvertisedTools().size() << " tool(s)). "
              << "Type 'exit' or 'quit' to leave.\n";
    ChatLoop loop(orchestrator, files, formatter, std::move(chat_options));
    loop.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace edge_agent;

    if (HasFlag(argc, argv, "--version")) {
        std::cout << "edge-agent " << kVersion << "\n";
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--help", "-h")) {
        std::cout << kHelpText;
        return kExitSuccess;
    }

    auto subcommand = Subcommand::Chat;
    bool has_subcommand = false;
    if (argc > 1) {
        std::string_view arg1{argv[1]};
        if (arg1 == "chat") {
            has_subcommand = true;
        } else if (arg1 == "tools") {
            subcommand = Subcommand::Tools;
            has_subcommand = true;
        }
    }

    // Verbosity and color.
    auto log_level = LogLevel::Warn;
    auto color_mode = ColorMode::Auto;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") { log_level = LogLevel::Debug; }
        else if (arg == "-v" && log_level != LogLevel::Debug) { log_level = LogLevel::Info; }
        else if (arg == "--color" && color_mode != ColorMode::Never) { color_mode = ColorMode::Always; }
        else if (arg == "--no-color") { color_mode = ColorMode::Never; }
    }
    const bool use_color = ShouldColor(color_mode, STDERR_FILENO);
    InitGlobalLogger(std::make_unique<TerminalSink>(use_color), log_level);

    auto stripped = StripHandledArgs(argc, argv, has_subcommand);
    auto cli = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli.IsErr()) {
        OutputFormatter(false, use_color).PrintError(cli.Error());
        std::cerr << "Run 'edge-agent --help' for usage.\n";
        return kExitConfig;
    }
    const bool json_output = cli.Value().json_output;

    auto resolved = ResolveConfig(cli.Value(), [](const char* name) { return std::getenv(name); });
    if (resolved.IsErr()) {
        OutputFormatter(json_output, use_color).PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    if (config.log_file.has_value()) {
        auto file = std::make_unique<std::ofstream>(*config.log_file, std::ios::app);
        if (!*file) {
            Error err{"OpenLogFile", *config.log_file, "Cannot open log file",
                      std::nullopt, ErrorCategory::Config};
            OutputFormatter(json_output, use_color).PrintError(err);
            return err.ExitCode();
        }
        std::vector<std::unique_ptr<ILogSink>> sinks;
        sinks.push_back(std::make_unique<TerminalSink>(use_color));
        sinks.push_back(std::make_unique<FileSink>(std::move(file)));
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)), log_level);
    }

    ChildProcess::IgnoreSigpipe();
    const OutputFormatter formatter(config.json_output,
                                    ShouldColor(color_mode, STDOUT_FILENO));

    ServerRegistry registry;
    const auto connected = registry.ConnectAll(ToLaunchSpecs(config.servers));
    if (connected < config.servers.size()) {
        LogWarn("main", std::to_string(config.servers.size() - connected) +
                            " MCP server(s) failed to start; continuing without them");
    }

    if (subcommand == Subcommand::Tools) {
        return RunTools(registry, config, formatter);
    }
    return RunChat(registry, config, formatter);
}
