#pragma once

#include <edge_agent/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace edge_agent {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 message model.
//
// Exactly one of result/error is set on a response. Notifications never carry
// an id. Encoding always produces a single line with no embedded newline.
// ---------------------------------------------------------------------------

constexpr const char* kJsonRpcVersion = "2.0";

namespace jsonrpc {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
} // namespace jsonrpc

struct JsonRpcRequest {
    nlohmann::json id;
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;
};

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

struct JsonRpcResponse {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;
};

using JsonRpcMessage =
    std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse>;

/// Serialize to a single line (no trailing newline).
[[nodiscard]] std::string EncodeMessage(const JsonRpcMessage& message);

/// Parse one line. Fails with MalformedMessage on invalid JSON, a missing or
/// wrong "jsonrpc" member, or a shape that is neither request, notification
/// nor response.
[[nodiscard]] Result<JsonRpcMessage, Error> DecodeMessage(std::string_view line);

/// Compare a response id to the integer id a client assigned.
[[nodiscard]] bool IdMatches(const nlohmann::json& id, int64_t expected);

} // namespace edge_agent
