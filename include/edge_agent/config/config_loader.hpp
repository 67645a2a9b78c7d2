#pragma once

#include <edge_agent/config/app_config.hpp>
#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/stdio_transport.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

// Parse a YAML config file into an AgentConfig (defaults for absent keys).
Result<AgentConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse a YAML file holding only a `servers:` list.
Result<std::vector<ServerConfig>, Error> LoadServersFromYaml(std::string_view file_path);

// Parse CLI flags (subcommand and -v/-vv already removed) into overrides.
Result<ConfigOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Read EDGE_AGENT_MAX_PROMPT_TOKENS / EDGE_AGENT_RESERVED_TOKENS through
// `getenv` into overrides. A non-numeric value is a Config error.
using EnvLookup = std::function<const char*(const char*)>;
Result<ConfigOverrides, Error> LoadFromEnvironment(const EnvLookup& getenv);

// Apply overrides on top of base: set fields replace, flags only switch on.
AgentConfig MergeConfigs(const AgentConfig& base, const ConfigOverrides& overrides);

// Validate server list, budget and agent limits.
Result<void, Error> ValidateConfig(const AgentConfig& config);

// The selected backend has what it needs (command or URL).
Result<void, Error> ValidateModelConfig(const ModelConfig& model);

// Full startup resolution: YAML file (if given) < environment < CLI, then
// the --mcp-config servers are appended and the result is validated.
Result<AgentConfig, Error> ResolveConfig(const ConfigOverrides& cli, const EnvLookup& getenv);

// Launch specs for every configured server, in configuration order.
std::vector<ServerLaunchSpec> ToLaunchSpecs(const std::vector<ServerConfig>& servers);

} // namespace edge_agent
