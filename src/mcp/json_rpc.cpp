#include <edge_agent/mcp/json_rpc.hpp>

namespace edge_agent {

namespace {

Error MakeDecodeError(const std::string& message, std::string_view line) {
    std::string excerpt(line.substr(0, 200));
    return Error{"DecodeMessage", "", message, std::move(excerpt),
                 ErrorCategory::MalformedMessage};
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_number_integer() || id.is_string() || id.is_null();
}

nlohmann::json ToJson(const JsonRpcRequest& m) {
    nlohmann::json j = {{"jsonrpc", kJsonRpcVersion}, {"id", m.id}, {"method", m.method}};
    if (m.params.has_value()) {
        j["params"] = *m.params;
    }
    return j;
}

nlohmann::json ToJson(const JsonRpcNotification& m) {
    nlohmann::json j = {{"jsonrpc", kJsonRpcVersion}, {"method", m.method}};
    if (m.params.has_value()) {
        j["params"] = *m.params;
    }
    return j;
}

nlohmann::json ToJson(const JsonRpcResponse& m) {
    nlohmann::json j = {{"jsonrpc", kJsonRpcVersion}, {"id", m.id}};
    if (m.error.has_value()) {
        nlohmann::json err = {{"code", m.error->code}, {"message", m.error->message}};
        if (m.error->data.has_value()) {
            err["data"] = *m.error->data;
        }
        j["error"] = std::move(err);
    } else {
        j["result"] = m.result.value_or(nlohmann::json::object());
    }
    return j;
}

} // anonymous namespace

std::string EncodeMessage(const JsonRpcMessage& message) {
    auto j = std::visit([](const auto& m) { return ToJson(m); }, message);
    // dump() without indentation never emits a raw newline; string contents
    // are escaped. Invalid UTF-8 becomes U+FFFD instead of throwing.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<JsonRpcMessage, Error> DecodeMessage(std::string_view line) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        return Result<JsonRpcMessage, Error>::Err(
            MakeDecodeError("Invalid JSON", line));
    }
    if (!j.is_object()) {
        return Result<JsonRpcMessage, Error>::Err(
            MakeDecodeError("JSON-RPC message is not an object", line));
    }
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return Result<JsonRpcMessage, Error>::Err(
            MakeDecodeError("Missing or unsupported jsonrpc version", line));
    }

    std::optional<nlohmann::json> params;
    if (j.contains("params")) {
        params = j["params"];
    }

    auto method = j.find("method");
    if (method != j.end()) {
        if (!method->is_string()) {
            return Result<JsonRpcMessage, Error>::Err(
                MakeDecodeError("'method' must be a string", line));
        }
        if (!j.contains("id")) {
            return Result<JsonRpcMessage, Error>::Ok(
                JsonRpcNotification{method->get<std::string>(), std::move(params)});
        }
        if (!IsValidId(j["id"])) {
            return Result<JsonRpcMessage, Error>::Err(
                MakeDecodeError("Invalid request id", line));
        }
        return Result<JsonRpcMessage, Error>::Ok(
            JsonRpcRequest{j["id"], method->get<std::string>(), std::move(params)});
    }

    if (!j.contains("id") || !IsValidId(j["id"])) {
        return Result<JsonRpcMessage, Error>::Err(
            MakeDecodeError("Response without a valid id", line));
    }

    JsonRpcResponse response;
    response.id = j["id"];
    if (j.contains("error") && !j["error"].is_null()) {
        const auto& err = j["error"];
        if (!err.is_object() || !err.contains("code") ||
            !err["code"].is_number_integer()) {
            return Result<JsonRpcMessage, Error>::Err(
                MakeDecodeError("Malformed error object", line));
        }
        JsonRpcError rpc_error;
        rpc_error.code = err["code"].get<int>();
        if (err.contains("message") && err["message"].is_string()) {
            rpc_error.message = err["message"].get<std::string>();
        }
        if (err.contains("data")) {
            rpc_error.data = err["data"];
        }
        response.error = std::move(rpc_error);
    } else if (j.contains("result")) {
        response.result = j["result"];
    } else {
        return Result<JsonRpcMessage, Error>::Err(
            MakeDecodeError("Response has neither result nor error", line));
    }
    return Result<JsonRpcMessage, Error>::Ok(std::move(response));
}

bool IdMatches(const nlohmann::json& id, int64_t expected) {
    if (id.is_number_integer()) {
        return id.get<int64_t>() == expected;
    }
    if (id.is_string()) {
        return id.get<std::string>() == std::to_string(expected);
    }
    return false;
}

} // namespace edge_agent
