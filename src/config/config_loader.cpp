#include <edge_agent/config/config_loader.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>
#include <edge_agent/core/version.hpp>
#include <edge_agent/prompt/file_detector.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <set>
#include <stdexcept>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "config";
constexpr const char* kEnvMaxPromptTokens = "EDGE_AGENT_MAX_PROMPT_TOKENS";
constexpr const char* kEnvReservedTokens = "EDGE_AGENT_RESERVED_TOKENS";

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error{"ConfigLoader", target, message, std::nullopt, ErrorCategory::Config};
}

std::vector<std::string> SplitExtensions(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        const auto comma = list.find(',', start);
        const auto end = comma == std::string::npos ? list.size() : comma;
        auto item = Trim(std::string_view(list).substr(start, end - start));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

std::vector<std::string> StringList(const YAML::Node& node) {
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

Result<ServerConfig, Error> ParseYamlServer(const YAML::Node& node) {
    using R = Result<ServerConfig, Error>;
    if (!node.IsMap()) {
        return R::Err(MakeConfigError("Server entry must be a mapping"));
    }
    if (!node["name"]) {
        return R::Err(MakeConfigError("Server entry missing 'name' field"));
    }
    if (!node["command"]) {
        return R::Err(MakeConfigError("Server entry missing 'command' field",
                                      node["name"].as<std::string>()));
    }

    ServerConfig server;
    server.name = node["name"].as<std::string>();
    server.command = node["command"].as<std::string>();
    if (node["args"]) {
        server.args = StringList(node["args"]);
    }
    if (node["env"]) {
        if (!node["env"].IsMap()) {
            return R::Err(MakeConfigError("Server 'env' must be a mapping", server.name));
        }
        for (const auto& kv : node["env"]) {
            server.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["timeout"]) {
        server.timeout_seconds = node["timeout"].as<int>();
    }
    return R::Ok(std::move(server));
}

Result<std::vector<ServerConfig>, Error> ParseYamlServers(const YAML::Node& node) {
    using R = Result<std::vector<ServerConfig>, Error>;
    std::vector<ServerConfig> servers;
    if (!node) {
        return R::Ok(std::move(servers));
    }
    if (!node.IsSequence()) {
        return R::Err(MakeConfigError("'servers' must be a list"));
    }
    for (const auto& server_node : node) {
        auto server = ParseYamlServer(server_node);
        if (server.IsErr()) {
            return R::Err(std::move(server).Error());
        }
        servers.push_back(std::move(server).Value());
    }
    return R::Ok(std::move(servers));
}

Result<size_t, Error> ParseTokenCount(const char* name, const std::string& value) {
    using R = Result<size_t, Error>;
    const auto trimmed = std::string(Trim(value));
    if (trimmed.empty() || trimmed.size() > 9 ||
        trimmed.find_first_not_of("0123456789") != std::string::npos) {
        return R::Err(MakeConfigError(std::string(name) + " must be a positive integer, got '" +
                                      value + "'"));
    }
    return R::Ok(static_cast<size_t>(std::stoul(trimmed)));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AgentConfig, Error> LoadFromYaml(std::string_view file_path) {
    using R = Result<AgentConfig, Error>;
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                                      std::string(file_path)));
    }

    AgentConfig config;
    try {
        // -- Model --
        if (const auto model = root["model"]) {
            if (model["backend"]) {
                const auto backend = ToLowerAscii(model["backend"].as<std::string>());
                if (backend == "process") {
                    config.model.backend = ModelBackend::Process;
                } else if (backend == "http") {
                    config.model.backend = ModelBackend::Http;
                } else {
                    return R::Err(MakeConfigError("Unknown model backend '" + backend +
                                                  "' (expected process or http)"));
                }
            } else if (model["url"] && !model["command"]) {
                config.model.backend = ModelBackend::Http;
            }
            if (model["command"]) {
                config.model.command = model["command"].as<std::string>();
            }
            if (model["args"]) {
                config.model.args = StringList(model["args"]);
            }
            if (model["url"]) {
                config.model.url = model["url"].as<std::string>();
            }
            if (model["n_predict"]) {
                config.model.n_predict = model["n_predict"].as<int>();
            }
            if (model["context_length"]) {
                config.model.context_length = model["context_length"].as<size_t>();
            }
            if (model["template"]) {
                config.model.chat_template = model["template"].as<std::string>();
            }
        }

        // -- Servers --
        auto servers = ParseYamlServers(root["servers"]);
        if (servers.IsErr()) {
            return R::Err(std::move(servers).Error());
        }
        config.servers = std::move(servers).Value();

        // -- Budget --
        if (const auto budget = root["budget"]) {
            if (budget["max_prompt_tokens"]) {
                config.budget.max_prompt_tokens = budget["max_prompt_tokens"].as<size_t>();
            }
            if (budget["reserved_tokens"]) {
                config.budget.reserved_tokens = budget["reserved_tokens"].as<size_t>();
            }
        }

        // -- Agent --
        if (const auto agent = root["agent"]) {
            if (agent["max_rounds"]) {
                config.max_rounds = agent["max_rounds"].as<int>();
            }
            if (agent["tool_only"]) {
                config.tool_only = agent["tool_only"].as<bool>();
            }
            if (agent["confirm_writes"]) {
                config.confirm_writes = agent["confirm_writes"].as<bool>();
            }
            if (agent["preview_prompt"]) {
                config.preview_prompt = agent["preview_prompt"].as<bool>();
            }
            if (agent["detect_extensions"]) {
                config.detect_extensions =
                    NormalizeExtensions(StringList(agent["detect_extensions"]));
            }
        }

        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Invalid value in config file: " + std::string(e.what()),
                                      std::string(file_path)));
    }

    LogDebug(kComponent, "Loaded config from " + std::string(file_path) + " (" +
                             std::to_string(config.servers.size()) + " server(s))");
    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadServersFromYaml
// ---------------------------------------------------------------------------
Result<std::vector<ServerConfig>, Error> LoadServersFromYaml(std::string_view file_path) {
    using R = Result<std::vector<ServerConfig>, Error>;
    try {
        const auto root = YAML::LoadFile(std::string(file_path));
        if (!root["servers"]) {
            return R::Err(MakeConfigError("MCP config has no 'servers' list",
                                          std::string(file_path)));
        }
        return ParseYamlServers(root["servers"]);
    } catch (const YAML::Exception& e) {
        return R::Err(MakeConfigError("Failed to parse MCP config: " + std::string(e.what()),
                                      std::string(file_path)));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("edge-agent", kVersion,
                                     argparse::default_arguments::none);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--mcp-config")
        .help("YAML file with a 'servers:' list");

    // Model
    program.add_argument("--model-command")
        .help("Local inference command (process backend)");
    program.add_argument("--model-arg")
        .help("Argument for the model command (repeatable)")
        .append();
    program.add_argument("--model-url")
        .help("llama.cpp server URL (http backend)");
    program.add_argument("--n-predict")
        .help("Maximum tokens to generate")
        .scan<'i', int>();
    program.add_argument("--chat-template")
        .help("Chat template containing {prompt}");

    // Budget and agent
    program.add_argument("--max-prompt-tokens")
        .help("Prompt token budget")
        .scan<'i', int>();
    program.add_argument("--reserved-tokens")
        .help("Tokens reserved for the answer")
        .scan<'i', int>();
    program.add_argument("--max-rounds")
        .help("Tool rounds per turn")
        .scan<'i', int>();
    program.add_argument("--detect-ext")
        .help("Comma-separated file extensions to detect (empty disables)");
    program.add_argument("--tool-only")
        .help("Disable local file tools; use MCP tools only")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--confirm-writes")
        .help("Ask before every file write")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--preview-prompt")
        .help("Print each prompt before generation")
        .default_value(false)
        .implicit_value(true);

    // Output
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write JSON log lines to this file");
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    } catch (const std::logic_error& e) {
        // scan<> reports non-numeric or out-of-range values this way.
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverrides overrides;
    overrides.config_path = program.present("--config");
    overrides.mcp_config_path = program.present("--mcp-config");
    overrides.model_command = program.present("--model-command");
    if (auto val = program.present<std::vector<std::string>>("--model-arg")) {
        overrides.model_args = *val;
    }
    overrides.model_url = program.present("--model-url");
    overrides.n_predict = program.present<int>("--n-predict");
    overrides.chat_template = program.present("--chat-template");

    if (auto val = program.present<int>("--max-prompt-tokens")) {
        if (*val <= 0) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("--max-prompt-tokens must be positive"));
        }
        overrides.max_prompt_tokens = static_cast<size_t>(*val);
    }
    if (auto val = program.present<int>("--reserved-tokens")) {
        if (*val < 0) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("--reserved-tokens must not be negative"));
        }
        overrides.reserved_tokens = static_cast<size_t>(*val);
    }
    overrides.max_rounds = program.present<int>("--max-rounds");
    if (auto val = program.present("--detect-ext")) {
        overrides.detect_extensions = NormalizeExtensions(SplitExtensions(*val));
    }
    overrides.log_file = program.present("--log-file");
    overrides.tool_only = program.get<bool>("--tool-only");
    overrides.confirm_writes = program.get<bool>("--confirm-writes");
    overrides.preview_prompt = program.get<bool>("--preview-prompt");
    overrides.json_output = program.get<bool>("--json");

    return Result<ConfigOverrides, Error>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// LoadFromEnvironment
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnvironment(const EnvLookup& getenv) {
    using R = Result<ConfigOverrides, Error>;
    ConfigOverrides overrides;
    if (const char* val = getenv(kEnvMaxPromptTokens)) {
        auto parsed = ParseTokenCount(kEnvMaxPromptTokens, val);
        if (parsed.IsErr()) {
            return R::Err(std::move(parsed).Error());
        }
        overrides.max_prompt_tokens = parsed.Value();
    }
    if (const char* val = getenv(kEnvReservedTokens)) {
        auto parsed = ParseTokenCount(kEnvReservedTokens, val);
        if (parsed.IsErr()) {
            return R::Err(std::move(parsed).Error());
        }
        overrides.reserved_tokens = parsed.Value();
    }
    return R::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AgentConfig MergeConfigs(const AgentConfig& base, const ConfigOverrides& overrides) {
    AgentConfig merged = base;

    // An explicit command or URL also selects the backend.
    if (overrides.model_command.has_value()) {
        merged.model.backend = ModelBackend::Process;
        merged.model.command = *overrides.model_command;
        merged.model.args = overrides.model_args;
    } else if (!overrides.model_args.empty()) {
        merged.model.args = overrides.model_args;
    }
    if (overrides.model_url.has_value()) {
        merged.model.backend = ModelBackend::Http;
        merged.model.url = *overrides.model_url;
    }
    if (overrides.n_predict.has_value()) {
        merged.model.n_predict = *overrides.n_predict;
    }
    if (overrides.chat_template.has_value()) {
        merged.model.chat_template = overrides.chat_template;
    }

    if (overrides.max_prompt_tokens.has_value()) {
        merged.budget.max_prompt_tokens = *overrides.max_prompt_tokens;
    }
    if (overrides.reserved_tokens.has_value()) {
        merged.budget.reserved_tokens = *overrides.reserved_tokens;
    }
    if (overrides.max_rounds.has_value()) {
        merged.max_rounds = *overrides.max_rounds;
    }
    if (overrides.detect_extensions.has_value()) {
        merged.detect_extensions = *overrides.detect_extensions;
    }
    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.tool_only) {
        merged.tool_only = true;
    }
    if (overrides.confirm_writes) {
        merged.confirm_writes = true;
    }
    if (overrides.preview_prompt) {
        merged.preview_prompt = true;
    }
    if (overrides.json_output) {
        merged.json_output = true;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AgentConfig& config) {
    std::set<std::string> names;
    for (const auto& server : config.servers) {
        if (server.name.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
        }
        if (!names.insert(server.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate server name '" + server.name + "'", server.name));
        }
        if (Trim(server.command).empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + server.name + "' has an empty command",
                                server.name));
        }
        if (server.timeout_seconds <= 0) {
            return Result<void, Error>::Err(
                MakeConfigError("Server '" + server.name + "' timeout must be positive, got " +
                                    std::to_string(server.timeout_seconds),
                                server.name));
        }
    }
    if (config.budget.max_prompt_tokens == 0) {
        return Result<void, Error>::Err(MakeConfigError("max_prompt_tokens must be positive"));
    }
    if (config.budget.reserved_tokens >= config.budget.max_prompt_tokens) {
        return Result<void, Error>::Err(MakeConfigError(
            "reserved_tokens (" + std::to_string(config.budget.reserved_tokens) +
            ") must be smaller than max_prompt_tokens (" +
            std::to_string(config.budget.max_prompt_tokens) + ")"));
    }
    if (config.model.context_length == 0) {
        return Result<void, Error>::Err(MakeConfigError("context_length must be positive"));
    }
    if (config.budget.max_prompt_tokens > config.model.context_length) {
        return Result<void, Error>::Err(MakeConfigError(
            "max_prompt_tokens (" + std::to_string(config.budget.max_prompt_tokens) +
            ") exceeds the model context_length (" +
            std::to_string(config.model.context_length) + ")"));
    }
    if (config.max_rounds < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("max_rounds must be at least 1, got " +
                            std::to_string(config.max_rounds)));
    }
    if (config.model.n_predict <= 0) {
        return Result<void, Error>::Err(MakeConfigError("n_predict must be positive"));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ValidateModelConfig(const ModelConfig& model) {
    if (model.backend == ModelBackend::Process && Trim(model.command).empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "No model configured: set model.command or --model-command (or use --model-url)"));
    }
    if (model.backend == ModelBackend::Http && Trim(model.url).empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("HTTP model backend needs model.url or --model-url"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AgentConfig, Error> ResolveConfig(const ConfigOverrides& cli, const EnvLookup& getenv) {
    using R = Result<AgentConfig, Error>;

    AgentConfig config;
    if (cli.config_path.has_value()) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return R::Err(std::move(yaml).Error());
        }
        config = std::move(yaml).Value();
    }

    auto env = LoadFromEnvironment(getenv);
    if (env.IsErr()) {
        return R::Err(std::move(env).Error());
    }
    config = MergeConfigs(config, env.Value());
    config = MergeConfigs(config, cli);

    if (cli.mcp_config_path.has_value()) {
        auto servers = LoadServersFromYaml(*cli.mcp_config_path);
        if (servers.IsErr()) {
            return R::Err(std::move(servers).Error());
        }
        for (auto& server : std::move(servers).Value()) {
            config.servers.push_back(std::move(server));
        }
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(std::move(valid).Error());
    }
    return R::Ok(std::move(config));
}

std::vector<ServerLaunchSpec> ToLaunchSpecs(const std::vector<ServerConfig>& servers) {
    std::vector<ServerLaunchSpec> specs;
    specs.reserve(servers.size());
    for (const auto& server : servers) {
        ServerLaunchSpec spec;
        spec.name = server.name;
        spec.process = ProcessSpec{server.command, server.args, server.env};
        spec.timeout = std::chrono::seconds(server.timeout_seconds);
        specs.push_back(std::move(spec));
    }
    return specs;
}

} // namespace edge_agent
