#pragma once

#include <edge_agent/agent/collaborators.hpp>
#include <edge_agent/agent/orchestrator.hpp>
#include <edge_agent/cli/output_formatter.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace edge_agent {

// ---------------------------------------------------------------------------
// StreamConfirmer — y/N prompts on a pair of streams. Anything but "y" or
// "yes" (case-insensitive), including EOF, declines.
// ---------------------------------------------------------------------------
class StreamConfirmer : public IConfirmer {
public:
    explicit StreamConfirmer(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    [[nodiscard]] bool ConfirmOverwrite(const std::string& path) override;
    [[nodiscard]] bool ConfirmWrite(const std::string& path) override;

private:
    bool Ask(const std::string& question);

    std::istream& in_;
    std::ostream& out_;
};

struct ChatOptions {
    std::vector<std::string> detect_extensions;  // empty disables detection
    bool tool_only = false;
    std::string prompt_marker = "> ";
};

// ---------------------------------------------------------------------------
// ChatLoop — the interactive read / turn / print loop.
//
// Each non-empty input line is one turn. File paths mentioned in the line are
// detected; existing inputs are loaded and attached, write targets are passed
// as output targets. When the user asked for a write, file blocks in the final
// reply are written too. Errors of a turn are printed and the loop continues.
// ---------------------------------------------------------------------------
class ChatLoop {
public:
    ChatLoop(Orchestrator& orchestrator,
             IFileSystem& files,
             const OutputFormatter& formatter,
             ChatOptions options,
             std::istream& in = std::cin,
             std::ostream& out = std::cout);

    // Read lines until EOF or exit/quit. Returns the number of turns run.
    int Run();

    // Handle one input line. Returns false when the line ends the session.
    bool HandleLine(const std::string& line);

private:
    Orchestrator& orchestrator_;
    IFileSystem& files_;
    const OutputFormatter& formatter_;
    ChatOptions options_;
    std::istream& in_;
    std::ostream& out_;
    int turns_ = 0;
};

} // namespace edge_agent
