#pragma once

#include <edge_agent/agent/collaborators.hpp>
#include <edge_agent/mcp/child_process.hpp>

#include <string>

namespace edge_agent {

// ---------------------------------------------------------------------------
// ProcessModelRuntime — runs a local inference command once per completion.
//
// If any argument contains "{prompt}" the prompt is substituted there and
// stdin is left empty; otherwise the prompt is written to the child's stdin.
// Stdout is streamed to on_token as it arrives, stderr goes to the log. A
// non-zero exit status is a Model error.
// ---------------------------------------------------------------------------
class ProcessModelRuntime : public IModelRuntime {
public:
    explicit ProcessModelRuntime(ProcessSpec spec);

    [[nodiscard]] Result<std::string, Error> Run(const std::string& prompt,
                                                 const TokenCallback& on_token) override;

private:
    ProcessSpec spec_;
};

} // namespace edge_agent
