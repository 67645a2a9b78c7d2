#include <edge_agent/cli/chat_loop.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>
#include <edge_agent/prompt/file_detector.hpp>
#include <edge_agent/prompt/intent.hpp>

namespace edge_agent {

namespace {

constexpr const char* kComponent = "chat";

std::string Join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// StreamConfirmer
// ---------------------------------------------------------------------------
bool StreamConfirmer::Ask(const std::string& question) {
    out_ << "\n[" << question << " (y/N): ";
    out_.flush();
    std::string answer;
    if (!std::getline(in_, answer)) {
        out_ << "\n";
        return false;
    }
    const auto normalized = ToLowerAscii(Trim(answer));
    return normalized == "y" || normalized == "yes";
}

bool StreamConfirmer::ConfirmOverwrite(const std::string& path) {
    return Ask("File '" + path + "' already exists. Overwrite?");
}

bool StreamConfirmer::ConfirmWrite(const std::string& path) {
    return Ask("Write file '" + path + "'?");
}

// ---------------------------------------------------------------------------
// ChatLoop
// ---------------------------------------------------------------------------
ChatLoop::ChatLoop(Orchestrator& orchestrator,
                   IFileSystem& files,
                   const OutputFormatter& formatter,
                   ChatOptions options,
                   std::istream& in,
                   std::ostream& out)
    : orchestrator_(orchestrator),
      files_(files),
      formatter_(formatter),
      options_(std::move(options)),
      in_(in),
      out_(out) {}

int ChatLoop::Run() {
    std::string line;
    while (true) {
        out_ << options_.prompt_marker;
        out_.flush();
        if (!std::getline(in_, line)) {
            out_ << "\n";
            break;
        }
        if (!HandleLine(line)) {
            break;
        }
    }
    return turns_;
}

bool ChatLoop::HandleLine(const std::string& line) {
    const std::string input(Trim(line));
    if (input.empty()) {
        return true;
    }
    const auto lowered = ToLowerAscii(input);
    if (lowered == "exit" || lowered == "quit") {
        out_ << "See you!\n";
        return false;
    }

    const bool write_intent = HasFileOperationIntent(input);
    if (options_.tool_only && write_intent) {
        formatter_.PrintNotice("tool-only: local file writes are disabled; MCP tools handle outputs");
    }

    std::vector<AttachedFile> attached;
    std::vector<FileLoadError> errors;
    std::vector<std::string> output_targets;

    const auto paths = DetectFilePaths(input, options_.detect_extensions);
    if (!paths.empty()) {
        formatter_.PrintNotice("Detected files: " + Join(paths, ", "));
        auto split = ClassifyDetectedPaths(paths, write_intent);
        for (const auto& path : split.inputs) {
            if (!files_.Exists(path)) {
                errors.push_back(FileLoadError{path, "File not found"});
                continue;
            }
            auto content = files_.ReadFile(path);
            if (content.IsErr()) {
                errors.push_back(FileLoadError{path, content.Error().message});
                continue;
            }
            attached.push_back(AttachedFile{path, std::move(content).Value()});
        }
        output_targets = std::move(split.outputs);

        if (!attached.empty()) {
            formatter_.PrintNotice("Loaded " + std::to_string(attached.size()) + " file(s)");
        }
        for (const auto& error : errors) {
            LogWarn(kComponent, "Could not load '" + error.path + "': " + error.message);
        }
        if (!output_targets.empty()) {
            formatter_.PrintNotice("Output targets (not loaded): " + Join(output_targets, ", "));
        }
    }

    ++turns_;
    auto outcome = orchestrator_.RunTurn(input, attached, output_targets, errors);
    if (outcome.IsErr()) {
        formatter_.PrintError(outcome.Error());
        return true;
    }

    const auto& turn = outcome.Value();
    for (const auto& name : turn.blocked) {
        LogInfo(kComponent, "Tool '" + name + "' was blocked this turn");
    }
    if (write_intent) {
        auto written = orchestrator_.ApplyFileOutputs(turn.final_response, attached,
                                                      output_targets);
        LogDebug(kComponent, std::to_string(written.size()) + " file output(s) attempted");
    }
    out_ << "\n";
    return true;
}

} // namespace edge_agent
