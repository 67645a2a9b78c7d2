#pragma once

#include <edge_agent/agent/context_budget.hpp>
#include <edge_agent/prompt/file_detector.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace edge_agent {

enum class ModelBackend {
    Process,  // spawn a local inference command per completion
    Http,     // llama.cpp style /completion endpoint
};

struct ModelConfig {
    ModelBackend backend = ModelBackend::Process;
    std::string command;                 // Process backend
    std::vector<std::string> args;
    std::string url;                     // Http backend
    int n_predict = 512;
    size_t context_length = 4096;
    std::optional<std::string> chat_template;  // unset: default template
};

struct ServerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    int timeout_seconds = 30;
};

struct AgentConfig {
    ModelConfig model;
    std::vector<ServerConfig> servers;
    BudgetConfig budget;
    int max_rounds = 3;
    bool tool_only = false;
    bool confirm_writes = false;
    bool preview_prompt = false;
    std::vector<std::string> detect_extensions = DefaultDetectExtensions();  // empty: off
    std::optional<std::string> log_file;
    bool json_output = false;
};

// ---------------------------------------------------------------------------
// ConfigOverrides — values given explicitly on the command line or in the
// environment. Unset fields leave the base configuration untouched.
// ---------------------------------------------------------------------------
struct ConfigOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> mcp_config_path;
    std::optional<std::string> model_command;
    std::vector<std::string> model_args;
    std::optional<std::string> model_url;
    std::optional<int> n_predict;
    std::optional<std::string> chat_template;
    std::optional<size_t> max_prompt_tokens;
    std::optional<size_t> reserved_tokens;
    std::optional<int> max_rounds;
    std::optional<std::vector<std::string>> detect_extensions;
    std::optional<std::string> log_file;
    bool tool_only = false;
    bool confirm_writes = false;
    bool preview_prompt = false;
    bool json_output = false;
};

} // namespace edge_agent
