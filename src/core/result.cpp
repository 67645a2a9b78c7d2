#include <edge_agent/core/result.hpp>

#include <nlohmann/json.hpp>

namespace edge_agent {

namespace {

struct CategoryInfo {
    ErrorCategory category;
    const char* name;
    int exit_code;
};

constexpr CategoryInfo kCategories[] = {
    {ErrorCategory::Config,           "config",            2},
    {ErrorCategory::Spawn,            "spawn",             3},
    {ErrorCategory::BrokenPipe,       "broken_pipe",       3},
    {ErrorCategory::MalformedMessage, "malformed_message", 3},
    {ErrorCategory::ServerClosed,     "server_closed",     3},
    {ErrorCategory::Timeout,          "timeout",           4},
    {ErrorCategory::Protocol,         "protocol",          5},
    {ErrorCategory::ToolNotFound,     "tool_not_found",    5},
    {ErrorCategory::BudgetOverflow,   "budget_overflow",   6},
    {ErrorCategory::Model,            "model",             7},
    {ErrorCategory::FileIo,           "file_io",           8},
    {ErrorCategory::Internal,         "internal",          99},
};

const CategoryInfo& InfoFor(ErrorCategory category) {
    for (const auto& info : kCategories) {
        if (info.category == category) {
            return info;
        }
    }
    return kCategories[sizeof(kCategories) / sizeof(kCategories[0]) - 1];
}

// Human-readable names for the reserved JSON-RPC 2.0 error codes.
const char* JsonRpcCodeName(int code) {
    switch (code) {
        case -32700: return "Parse error";
        case -32600: return "Invalid request";
        case -32601: return "Method not found";
        case -32602: return "Invalid params";
        case -32603: return "Internal error";
        default:     break;
    }
    if (code <= -32000 && code >= -32099) {
        return "Server error";
    }
    return nullptr;
}

} // anonymous namespace

Error Error::FromJsonRpc(const std::string& operation,
                         const std::string& target,
                         int code,
                         const std::string& message,
                         const std::string& data) {
    std::string detail = "code " + std::to_string(code);
    if (const char* name = JsonRpcCodeName(code)) {
        detail += " " + std::string(name);
    }
    if (!data.empty()) {
        detail += ": " + data;
    }
    return Error{operation,
                 target,
                 "MCP server returned error: " + message,
                 std::move(detail),
                 ErrorCategory::Protocol};
}

int Error::ExitCode() const {
    return InfoFor(category).exit_code;
}

std::string Error::CategoryName() const {
    return InfoFor(category).name;
}

std::string Error::ToString() const {
    std::string out = operation;
    if (!target.empty()) {
        out += " [" + target + "]";
    }
    out += ": " + message;
    if (detail.has_value() && !detail->empty()) {
        out += " (" + *detail + ")";
    }
    return out;
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!target.empty()) {
        body["target"] = target;
    }
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace edge_agent
