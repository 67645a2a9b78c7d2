#pragma once

#include <edge_agent/mcp/i_transport.hpp>

#include <deque>
#include <string>
#include <vector>

namespace edge_agent {
namespace testing {

// ---------------------------------------------------------------------------
// MockTransport — scripted ITransport for offline session tests.
//
// Usage:
//   auto mock = std::make_unique<MockTransport>();
//   mock->EnqueueResult({{"protocolVersion", "2025-06-18"}, ...});
//   auto* raw = mock.get();
//   McpSession session("fs", std::move(mock));
//   CHECK(raw->Requests()[0].method == "initialize");
//
// Responses are consumed FIFO. If the queue is empty when Request() is
// called, the mock returns a ServerClosed error rather than crashing.
// ---------------------------------------------------------------------------

struct RequestCall {
    std::string method;
    nlohmann::json params;
};

struct NotifyCall {
    std::string method;
    nlohmann::json params;
};

class MockTransport : public ITransport {
public:
    MockTransport() = default;

    void EnqueueResponse(Result<JsonRpcResponse, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueResult(nlohmann::json result) {
        JsonRpcResponse response;
        response.id = static_cast<int64_t>(responses_.size() + 1);
        response.result = std::move(result);
        EnqueueResponse(Result<JsonRpcResponse, Error>::Ok(std::move(response)));
    }

    void EnqueueError(Error error) {
        EnqueueResponse(Result<JsonRpcResponse, Error>::Err(std::move(error)));
    }

    void SetNotifyError(Error error) { notify_error_ = std::move(error); }

    Result<JsonRpcResponse, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> /*timeout*/) override {
        requests_.push_back({method, params});
        if (responses_.empty()) {
            return Result<JsonRpcResponse, Error>::Err(Error{
                "Request", "mock", "MockTransport: no response enqueued for " + method,
                std::nullopt, ErrorCategory::ServerClosed});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    Result<void, Error> Notify(const std::string& method,
                               const nlohmann::json& params) override {
        notifications_.push_back({method, params});
        if (notify_error_.has_value()) {
            return Result<void, Error>::Err(*notify_error_);
        }
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] const std::vector<RequestCall>& Requests() const { return requests_; }
    [[nodiscard]] const std::vector<NotifyCall>& Notifications() const {
        return notifications_;
    }

private:
    std::deque<Result<JsonRpcResponse, Error>> responses_;
    std::vector<RequestCall> requests_;
    std::vector<NotifyCall> notifications_;
    std::optional<Error> notify_error_;
};

} // namespace testing
} // namespace edge_agent
