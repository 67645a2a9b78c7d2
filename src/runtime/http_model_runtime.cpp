#include <edge_agent/runtime/http_model_runtime.hpp>

#include <edge_agent/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "runtime";

std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
    auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
    cli->set_connection_timeout(5);
    cli->set_read_timeout(300);
    cli->set_write_timeout(30);
    return cli;
}

Error MakeModelError(const std::string& target, const std::string& message,
                     std::optional<std::string> detail = std::nullopt) {
    return Error{"Run", target, message, std::move(detail), ErrorCategory::Model};
}

} // anonymous namespace

Result<HttpEndpoint, Error> ParseHttpEndpoint(const std::string& url) {
    using R = Result<HttpEndpoint, Error>;
    constexpr std::string_view kScheme = "http://";
    auto config_error = [&](const std::string& message) {
        return R::Err(Error{"ParseHttpEndpoint", url, message, std::nullopt,
                            ErrorCategory::Config});
    };

    if (url.compare(0, kScheme.size(), kScheme) != 0) {
        return config_error("Model URL must start with http://");
    }
    auto rest = url.substr(kScheme.size());
    HttpEndpoint ep;
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        ep.base_path = rest.substr(slash);
        rest.resize(slash);
        while (!ep.base_path.empty() && ep.base_path.back() == '/') {
            ep.base_path.pop_back();
        }
    }
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        const auto port_str = rest.substr(colon + 1);
        if (port_str.empty() ||
            port_str.find_first_not_of("0123456789") != std::string::npos ||
            port_str.size() > 5) {
            return config_error("Invalid port in model URL");
        }
        ep.port = std::stoi(port_str);
        if (ep.port < 1 || ep.port > 65535) {
            return config_error("Invalid port in model URL");
        }
        rest.resize(colon);
    }
    if (rest.empty()) {
        return config_error("Model URL has no host");
    }
    ep.host = rest;
    return R::Ok(std::move(ep));
}

HttpModelRuntime::HttpModelRuntime(HttpEndpoint endpoint, int n_predict)
    : endpoint_(std::move(endpoint)), n_predict_(n_predict) {}

Result<std::string, Error> HttpModelRuntime::Run(const std::string& prompt,
                                                 const TokenCallback& on_token) {
    using R = Result<std::string, Error>;
    const std::string target = endpoint_.host + ":" + std::to_string(endpoint_.port);

    nlohmann::json j;
    j["prompt"] = prompt;
    j["n_predict"] = n_predict_;
    j["stream"] = false;

    auto cli = MakeClient(endpoint_);
    LogDebug(kComponent, "POST " + target + endpoint_.base_path + "/completion");
    auto res = cli->Post(endpoint_.base_path + "/completion",
                         j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                         "application/json");
    if (!res) {
        return R::Err(MakeModelError(target, "Failed to connect to model server",
                                     httplib::to_string(res.error())));
    }
    if (res->status < 200 || res->status >= 300) {
        return R::Err(MakeModelError(target,
                                     "Model server returned HTTP " +
                                         std::to_string(res->status),
                                     res->body.substr(0, 200)));
    }
    auto reply = nlohmann::json::parse(res->body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.contains("content") ||
        !reply["content"].is_string()) {
        return R::Err(MakeModelError(target, "Invalid JSON from /completion",
                                     res->body.substr(0, 200)));
    }
    auto content = reply["content"].get<std::string>();
    if (on_token && !content.empty()) {
        on_token(content);
    }
    return R::Ok(std::move(content));
}

} // namespace edge_agent
