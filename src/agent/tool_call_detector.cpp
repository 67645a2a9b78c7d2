#include <edge_agent/agent/tool_call_detector.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>

#include <tinyxml2.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace edge_agent {

namespace {

constexpr std::string_view kBracketOpen = "[TOOL_CALL]";
constexpr std::string_view kBracketClose = "[END_TOOL_CALL]";
constexpr std::string_view kTagOpen = "<tool_call";
constexpr std::string_view kTagClose = "</tool_call>";

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// A located block: [begin, end) in the source text plus its inner body.
struct Block {
    size_t begin = 0;
    size_t end = 0;
    std::string_view body;
    std::string name;  // tagged syntax only
};

std::vector<Block> FindBracketBlocks(std::string_view text) {
    std::vector<Block> blocks;
    size_t pos = 0;
    while (true) {
        const auto open = text.find(kBracketOpen, pos);
        if (open == std::string_view::npos) {
            break;
        }
        const auto body_start = open + kBracketOpen.size();
        const auto close = text.find(kBracketClose, body_start);
        if (close == std::string_view::npos) {
            break;
        }
        blocks.push_back({open, close + kBracketClose.size(),
                          text.substr(body_start, close - body_start), ""});
        pos = close + kBracketClose.size();
    }
    return blocks;
}

// Parse `\s+name="X"\s*>` starting right after "<tool_call". Returns the name
// and the offset just past '>'.
std::optional<std::pair<std::string, size_t>> ParseTagHeader(
    std::string_view text, size_t pos) {
    if (pos >= text.size() || !IsSpace(text[pos])) {
        return std::nullopt;
    }
    while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
    }
    constexpr std::string_view kNameAttr = "name=\"";
    if (text.substr(pos, kNameAttr.size()) != kNameAttr) {
        return std::nullopt;
    }
    pos += kNameAttr.size();
    const auto quote = text.find('"', pos);
    if (quote == std::string_view::npos || quote == pos) {
        return std::nullopt;
    }
    std::string name(text.substr(pos, quote - pos));
    pos = quote + 1;
    while (pos < text.size() && IsSpace(text[pos])) {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != '>') {
        return std::nullopt;
    }
    return std::make_pair(std::move(name), pos + 1);
}

std::vector<Block> FindTaggedBlocks(std::string_view text) {
    std::vector<Block> blocks;
    size_t pos = 0;
    while (true) {
        const auto open = text.find(kTagOpen, pos);
        if (open == std::string_view::npos) {
            break;
        }
        auto header = ParseTagHeader(text, open + kTagOpen.size());
        if (!header) {
            pos = open + kTagOpen.size();
            continue;
        }
        const auto body_start = header->second;
        const auto close = text.find(kTagClose, body_start);
        if (close == std::string_view::npos) {
            break;
        }
        blocks.push_back({open, close + kTagClose.size(),
                          text.substr(body_start, close - body_start),
                          std::move(header->first)});
        pos = close + kTagClose.size();
    }
    return blocks;
}

// "42" -> 42, "true" -> true, "Tokyo" -> "Tokyo".
nlohmann::json ParseArgumentValue(const std::string& raw) {
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return raw;
    }
    return parsed;
}

std::optional<nlohmann::json> NormalizeArguments(const nlohmann::json& args) {
    if (args.is_object()) {
        return args;
    }
    if (args.is_null()) {
        return nlohmann::json::object();
    }
    // Some models emit the arguments object as a JSON string.
    if (args.is_string()) {
        auto inner = nlohmann::json::parse(args.get<std::string>(), nullptr, false);
        if (!inner.is_discarded() && inner.is_object()) {
            return inner;
        }
    }
    return std::nullopt;
}

std::optional<ToolCall> ParseBracketBody(std::string_view body) {
    const auto trimmed = Trim(body);
    if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
        return std::nullopt;
    }
    auto j = nlohmann::json::parse(trimmed, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    if (!j.contains("name") || !j["name"].is_string() || !j.contains("arguments")) {
        return std::nullopt;
    }
    auto args = NormalizeArguments(j["arguments"]);
    if (!args) {
        return std::nullopt;
    }
    return ToolCall{j["name"].get<std::string>(), std::move(*args)};
}

// Argument names and raw values end up in a JSON-RPC request, so both must
// be UTF-8. A single bad pair invalidates the whole call.
bool AddArgument(nlohmann::json& args, const std::string& name, const std::string& raw) {
    if (!IsValidUtf8(name) || !IsValidUtf8(raw)) {
        LogDebug("detector", "Skipping tool call with non-UTF-8 argument");
        return false;
    }
    args[name] = ParseArgumentValue(raw);
    return true;
}

// Plain scan for <argument name="k">v</argument>, used when the body is not
// well-formed XML (e.g. a stray '&').
std::optional<nlohmann::json> ScanArgumentTags(std::string_view body) {
    constexpr std::string_view kArgOpen = "<argument";
    constexpr std::string_view kArgClose = "</argument>";
    nlohmann::json args = nlohmann::json::object();
    size_t pos = 0;
    while (true) {
        const auto open = body.find(kArgOpen, pos);
        if (open == std::string_view::npos) {
            break;
        }
        auto header = ParseTagHeader(body, open + kArgOpen.size());
        if (!header) {
            pos = open + kArgOpen.size();
            continue;
        }
        const auto value_start = header->second;
        const auto value_end = body.find('<', value_start);
        if (value_end == std::string_view::npos) {
            break;
        }
        if (body.substr(value_end, kArgClose.size()) != kArgClose) {
            pos = value_end;
            continue;
        }
        if (!AddArgument(args, header->first,
                         std::string(body.substr(value_start, value_end - value_start)))) {
            return std::nullopt;
        }
        pos = value_end + kArgClose.size();
    }
    return args;
}

std::optional<nlohmann::json> ParseArgumentElements(std::string_view body) {
    const std::string wrapped = "<arguments>" + std::string(body) + "</arguments>";
    tinyxml2::XMLDocument doc(true, tinyxml2::PRESERVE_WHITESPACE);
    if (doc.Parse(wrapped.c_str(), wrapped.size()) != tinyxml2::XML_SUCCESS) {
        LogDebug("detector", std::string("Tool call body is not well-formed XML: ") +
                                 doc.ErrorStr());
        return ScanArgumentTags(body);
    }

    nlohmann::json args = nlohmann::json::object();
    const auto* root = doc.RootElement();
    for (const auto* el = root->FirstChildElement("argument"); el != nullptr;
         el = el->NextSiblingElement("argument")) {
        const char* name = el->Attribute("name");
        if (name == nullptr || *name == '\0') {
            continue;
        }
        const char* text = el->GetText();
        if (!AddArgument(args, name, text != nullptr ? text : "")) {
            return std::nullopt;
        }
    }
    return args;
}

std::optional<ToolCall> ParseTaggedBlock(const Block& block) {
    if (!IsValidUtf8(block.name)) {
        return std::nullopt;
    }
    const auto trimmed = Trim(block.body);
    if (!trimmed.empty() && trimmed.front() == '{') {
        auto j = nlohmann::json::parse(trimmed, nullptr, false);
        if (!j.is_discarded() && j.is_object()) {
            return ToolCall{block.name, std::move(j)};
        }
    }
    auto args = ParseArgumentElements(block.body);
    if (!args) {
        return std::nullopt;
    }
    return ToolCall{block.name, std::move(*args)};
}

} // anonymous namespace

std::vector<ToolCall> DetectToolCalls(std::string_view text) {
    std::vector<ToolCall> calls;

    for (const auto& block : FindBracketBlocks(text)) {
        if (auto call = ParseBracketBody(block.body)) {
            calls.push_back(std::move(*call));
        } else {
            LogDebug("detector", "Skipping malformed [TOOL_CALL] block");
        }
    }
    for (const auto& block : FindTaggedBlocks(text)) {
        if (auto call = ParseTaggedBlock(block)) {
            calls.push_back(std::move(*call));
        } else {
            LogDebug("detector", "Skipping malformed <tool_call> block");
        }
    }
    return calls;
}

std::string StripToolCallBlocks(std::string_view text) {
    auto blocks = FindBracketBlocks(text);
    auto tagged = FindTaggedBlocks(text);
    blocks.insert(blocks.end(), tagged.begin(), tagged.end());
    std::sort(blocks.begin(), blocks.end(),
              [](const Block& a, const Block& b) { return a.begin < b.begin; });

    std::string out;
    size_t pos = 0;
    for (const auto& block : blocks) {
        if (block.begin < pos) {
            continue;  // overlapping syntaxes; the earlier block already covers it
        }
        out.append(text.substr(pos, block.begin - pos));
        pos = block.end;
    }
    out.append(text.substr(pos));
    return std::string(Trim(out));
}

} // namespace edge_agent
