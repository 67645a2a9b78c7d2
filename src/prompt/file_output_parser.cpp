#include <edge_agent/prompt/file_output_parser.hpp>

#include <edge_agent/core/text.hpp>

#include <algorithm>

namespace edge_agent {

namespace {

constexpr std::string_view kFileOpen = "<file";
constexpr std::string_view kFileClose = "</file>";
constexpr std::string_view kCreateOpen = "[CREATE_FILE:";
constexpr std::string_view kFence = "```";
constexpr std::string_view kEndFile = "[END_FILE]";

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

size_t SkipSpace(std::string_view text, size_t pos) {
    while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
    }
    return pos;
}

// `<file path="p">content</file>` starting at `open`. Sets `end` past the
// closing tag on success.
bool ParseFileTag(std::string_view text, size_t open, FileOutput& out, size_t& end) {
    size_t pos = open + kFileOpen.size();
    if (pos >= text.size() || !IsSpace(text[pos])) {
        return false;
    }
    pos = SkipSpace(text, pos);
    constexpr std::string_view kPathAttr = "path=\"";
    if (text.substr(pos, kPathAttr.size()) != kPathAttr) {
        return false;
    }
    pos += kPathAttr.size();
    const auto quote = text.find('"', pos);
    if (quote == std::string_view::npos || quote == pos) {
        return false;
    }
    const auto path = Trim(text.substr(pos, quote - pos));
    pos = SkipSpace(text, quote + 1);
    if (pos >= text.size() || text[pos] != '>' || path.empty()) {
        return false;
    }
    const auto body = pos + 1;
    const auto close = text.find(kFileClose, body);
    if (close == std::string_view::npos) {
        return false;
    }
    auto content = text.substr(body, close - body);
    // <file path="p">\ncontent\n</file> carries exactly the content.
    if (content.substr(0, 2) == "\r\n") {
        content.remove_prefix(2);
    } else if (content.substr(0, 1) == "\n") {
        content.remove_prefix(1);
    }
    if (content.size() >= 2 && content.substr(content.size() - 2) == "\r\n") {
        content.remove_suffix(2);
    } else if (!content.empty() && content.back() == '\n') {
        content.remove_suffix(1);
    }
    out = FileOutput{std::string(path), std::string(content)};
    end = close + kFileClose.size();
    return true;
}

// `[CREATE_FILE: p]` then a fenced block then `[END_FILE]`. The content ends
// at the first "\n```" that is followed (after whitespace) by [END_FILE].
bool ParseCreateBlock(std::string_view text, size_t open, FileOutput& out, size_t& end) {
    size_t pos = open + kCreateOpen.size();
    const auto bracket = text.find(']', pos);
    if (bracket == std::string_view::npos) {
        return false;
    }
    const auto header = text.substr(pos, bracket - pos);
    if (header.find('\n') != std::string_view::npos) {
        return false;
    }
    const auto path = Trim(header);
    if (path.empty()) {
        return false;
    }
    pos = SkipSpace(text, bracket + 1);
    if (text.substr(pos, kFence.size()) != kFence) {
        return false;
    }
    pos += kFence.size();
    while (pos < text.size() && text[pos] >= 'a' && text[pos] <= 'z') {
        ++pos;
    }
    if (pos < text.size() && text[pos] == '\r') {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != '\n') {
        return false;
    }
    const auto body = pos + 1;

    size_t search = body;
    while (true) {
        const auto fence = text.find("\n```", search);
        if (fence == std::string_view::npos) {
            return false;
        }
        const auto after = SkipSpace(text, fence + 1 + kFence.size());
        if (text.substr(after, kEndFile.size()) == kEndFile) {
            auto content = text.substr(body, fence - body);
            if (!content.empty() && content.back() == '\r') {
                content.remove_suffix(1);
            }
            out = FileOutput{std::string(path), std::string(content)};
            end = after + kEndFile.size();
            return true;
        }
        search = fence + 1;
    }
}

template <typename Parser>
void Collect(std::string_view text, std::string_view marker, Parser parse,
             std::vector<FileOutput>& outputs) {
    size_t pos = 0;
    while (true) {
        const auto open = text.find(marker, pos);
        if (open == std::string_view::npos) {
            return;
        }
        FileOutput output;
        size_t end = 0;
        if (parse(text, open, output, end)) {
            outputs.push_back(std::move(output));
            pos = end;
        } else {
            pos = open + 1;
        }
    }
}

std::string Normalize(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') {
            continue;
        }
        out += s[i];
    }
    return std::string(TrimRight(out));
}

} // anonymous namespace

std::vector<FileOutput> ParseFileOutputs(std::string_view text) {
    std::vector<FileOutput> outputs;
    Collect(text, kFileOpen, ParseFileTag, outputs);
    Collect(text, kCreateOpen, ParseCreateBlock, outputs);
    return outputs;
}

bool ContentsEqual(std::string_view a, std::string_view b) {
    return Normalize(a) == Normalize(b);
}

FileOutputPlan PlanFileOutputs(std::vector<FileOutput> outputs,
                               const std::vector<AttachedFile>& inputs,
                               const std::vector<std::string>& output_targets) {
    FileOutputPlan plan;
    for (auto& output : outputs) {
        const auto same = std::find_if(inputs.begin(), inputs.end(),
                                       [&](const AttachedFile& input) {
                                           return ContentsEqual(input.content, output.content);
                                       });
        if (same != inputs.end()) {
            plan.unchanged.push_back(SkippedOutput{output.path, same->path});
            continue;
        }
        plan.writes.push_back(std::move(output));
    }

    if (plan.writes.empty() || output_targets.size() != 1) {
        return plan;
    }
    const bool all_inputs = std::all_of(
        plan.writes.begin(), plan.writes.end(), [&](const FileOutput& output) {
            return std::any_of(inputs.begin(), inputs.end(), [&](const AttachedFile& input) {
                return input.path == output.path;
            });
        });
    if (all_inputs) {
        for (auto& output : plan.writes) {
            output.path = output_targets.front();
        }
        plan.remapped = true;
    }
    return plan;
}

} // namespace edge_agent
