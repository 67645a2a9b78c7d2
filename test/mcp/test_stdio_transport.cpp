#include <catch2/catch_test_macros.hpp>

#include <edge_agent/mcp/stdio_transport.hpp>

#include "mocks/recording_sink.hpp"

#include <string>
#include <vector>

using namespace edge_agent;
using namespace std::chrono_literals;

// ===========================================================================
// Helper: a fake MCP server written as a /bin/sh script.
// ===========================================================================

namespace {

ServerLaunchSpec ShellServer(const std::string& script,
                             std::chrono::milliseconds timeout = 5000ms) {
    ServerLaunchSpec spec;
    spec.name = "fake";
    spec.process = ProcessSpec{"/bin/sh", {"-c", script}, {}};
    spec.timeout = timeout;
    return spec;
}

std::unique_ptr<StdioTransport> SpawnOrFail(const ServerLaunchSpec& spec) {
    ChildProcess::IgnoreSigpipe();
    auto spawned = StdioTransport::Spawn(spec);
    REQUIRE(spawned.IsOk());
    return std::move(spawned).Value();
}

} // anonymous namespace

// ===========================================================================
// Spawn
// ===========================================================================

TEST_CASE("StdioTransport: missing binary is a Spawn error", "[mcp][transport]") {
    ServerLaunchSpec spec;
    spec.name = "ghost";
    spec.process.command = "/nonexistent/edge-agent-test-server";

    auto spawned = StdioTransport::Spawn(spec);
    REQUIRE(spawned.IsErr());
    CHECK(spawned.Error().category == ErrorCategory::Spawn);
}

// ===========================================================================
// Request
// ===========================================================================

TEST_CASE("StdioTransport: matches the reply by id and skips the rest", "[mcp][transport]") {
    auto transport = SpawnOrFail(ShellServer(
        "read line; "
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"method\":\"notifications/progress\",\"params\":{\"progress\":1}}'; "
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":\"srv-1\",\"method\":\"roots/list\"}'; "
        "printf '\\n'; "
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":99,\"result\":{}}'; "
        "printf '%s\\r\\n' '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"ok\":true}}'; "
        "read line"));

    std::vector<std::string> notifications;
    transport->SetNotificationHandler([&](const JsonRpcNotification& n) {
        notifications.push_back(n.method);
    });

    auto r = transport->Request("tools/list", nlohmann::json::object());
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().result.has_value());
    CHECK((*r.Value().result)["ok"] == true);
    REQUIRE(notifications.size() == 1);
    CHECK(notifications[0] == "notifications/progress");
}

TEST_CASE("StdioTransport: response with a stale id is logged at Info", "[mcp][transport]") {
    auto* sink = testing::RecordingSink::Install(LogLevel::Info);
    {
        auto transport = SpawnOrFail(ShellServer(
            "read line; "
            "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":99,\"result\":{}}'; "
            "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}'; "
            "read line"));

        auto r = transport->Request("tools/list", nlohmann::json::object());
        REQUIRE(r.IsOk());
    }

    bool found = false;
    for (const auto& m : sink->Messages()) {
        if (m.message.find("unexpected id 99") != std::string::npos) {
            CHECK(m.level == LogLevel::Info);
            found = true;
        }
    }
    CHECK(found);
    InitGlobalLogger(std::make_unique<testing::RecordingSink>(), LogLevel::Error);
}

TEST_CASE("StdioTransport: JSON-RPC error becomes a Protocol error", "[mcp][transport]") {
    auto transport = SpawnOrFail(ShellServer(
        "read line; "
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":1,\"error\":{\"code\":-32601,\"message\":\"Method not found\"}}'; "
        "read line"));

    auto r = transport->Request("prompts/list", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Protocol);
    CHECK(r.Error().target == "fake");
    REQUIRE(r.Error().detail.has_value());
    CHECK(r.Error().detail->find("-32601") != std::string::npos);
}

TEST_CASE("StdioTransport: timeout leaves the transport open", "[mcp][transport]") {
    auto transport = SpawnOrFail(ShellServer("read line; sleep 5"));

    auto r = transport->Request("tools/list", nlohmann::json::object(), 200ms);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK_FALSE(transport->IsClosed());
}

TEST_CASE("StdioTransport: malformed line fails one request only", "[mcp][transport]") {
    auto transport = SpawnOrFail(ShellServer(
        "read line; echo 'this is not json'; "
        "read line; printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{}}'; "
        "read line"));

    auto first = transport->Request("tools/list", nlohmann::json::object());
    REQUIRE(first.IsErr());
    CHECK(first.Error().category == ErrorCategory::MalformedMessage);

    auto second = transport->Request("tools/list", nlohmann::json::object());
    CHECK(second.IsOk());
}

TEST_CASE("StdioTransport: EOF closes the transport for good", "[mcp][transport]") {
    auto transport = SpawnOrFail(ShellServer("read line; exit 0"));

    auto first = transport->Request("initialize", nlohmann::json::object());
    REQUIRE(first.IsErr());
    CHECK(first.Error().category == ErrorCategory::ServerClosed);
    CHECK(transport->IsClosed());

    auto second = transport->Request("tools/list", nlohmann::json::object());
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::ServerClosed);
}

TEST_CASE("StdioTransport: request ids increase from 1", "[mcp][transport]") {
    // The server echoes the id it received so the reply always matches.
    auto transport = SpawnOrFail(ShellServer(
        "while read line; do "
        "  id=$(printf '%s' \"$line\" | sed 's/.*\"id\":\\([0-9]*\\).*/\\1/'); "
        "  printf '{\"jsonrpc\":\"2.0\",\"id\":%s,\"result\":{\"seen\":%s}}\\n' \"$id\" \"$id\"; "
        "done"));

    for (int expected = 1; expected <= 3; ++expected) {
        auto r = transport->Request("ping", nlohmann::json::object());
        REQUIRE(r.IsOk());
        CHECK((*r.Value().result)["seen"] == expected);
    }
}

TEST_CASE("StdioTransport: env overrides reach the server", "[mcp][transport]") {
    auto spec = ShellServer(
        "read line; "
        "printf '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"v\":\"%s\"}}\\n' \"$EDGE_AGENT_TEST_VALUE\"; "
        "read line");
    spec.process.env["EDGE_AGENT_TEST_VALUE"] = "from-config";
    auto transport = SpawnOrFail(spec);

    auto r = transport->Request("ping", nlohmann::json::object());
    REQUIRE(r.IsOk());
    CHECK((*r.Value().result)["v"] == "from-config");
}

TEST_CASE("StdioTransport: stderr lines are logged under mcp:<name>", "[mcp][transport]") {
    auto* sink = testing::RecordingSink::Install();
    {
        auto transport = SpawnOrFail(ShellServer("echo 'server starting' >&2; read line"));
        CHECK(sink->WaitFor("mcp:fake", "server starting"));
    }
    InitGlobalLogger(std::make_unique<testing::RecordingSink>(), LogLevel::Error);
}

// ===========================================================================
// LogServerNotification
// ===========================================================================

TEST_CASE("LogServerNotification: maps log levels", "[mcp][transport]") {
    auto* sink = testing::RecordingSink::Install();

    LogServerNotification("docs", JsonRpcNotification{
        "notifications/message",
        nlohmann::json{{"level", "warning"}, {"data", "index stale"}}});
    LogServerNotification("docs", JsonRpcNotification{
        "notifications/progress",
        nlohmann::json{{"progress", 2}, {"total", 4}}});

    auto messages = sink->Messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[0].component == "mcp:docs");
    CHECK(messages[0].message == "index stale");
    CHECK(messages[1].message == "progress 2/4");

    InitGlobalLogger(std::make_unique<testing::RecordingSink>(), LogLevel::Error);
}

TEST_CASE("LogServerNotification: unknown notifications are logged at Info", "[mcp][transport]") {
    auto* sink = testing::RecordingSink::Install(LogLevel::Info);

    LogServerNotification("docs", JsonRpcNotification{
        "notifications/resources/list_changed", std::nullopt});

    auto messages = sink->Messages();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].level == LogLevel::Info);
    CHECK(messages[0].component == "mcp:docs");
    CHECK(messages[0].message.find("notifications/resources/list_changed") != std::string::npos);

    InitGlobalLogger(std::make_unique<testing::RecordingSink>(), LogLevel::Error);
}
