#pragma once

#include <edge_agent/agent/collaborators.hpp>

#include <string>

namespace edge_agent {

struct HttpEndpoint {
    std::string host;
    int port = 8080;
    std::string base_path;  // prefix before "/completion", no trailing slash
};

/// Parse "http://host[:port][/base]". Only plain HTTP is accepted.
[[nodiscard]] Result<HttpEndpoint, Error> ParseHttpEndpoint(const std::string& url);

// ---------------------------------------------------------------------------
// HttpModelRuntime — completion against a llama.cpp style server.
//
// POST {base}/completion with {"prompt", "n_predict", "stream": false}; the
// "content" member of the reply is the generated text.
// ---------------------------------------------------------------------------
class HttpModelRuntime : public IModelRuntime {
public:
    HttpModelRuntime(HttpEndpoint endpoint, int n_predict);

    [[nodiscard]] Result<std::string, Error> Run(const std::string& prompt,
                                                 const TokenCallback& on_token) override;

private:
    HttpEndpoint endpoint_;
    int n_predict_;
};

} // namespace edge_agent
