#include <edge_agent/prompt/file_detector.hpp>

#include <edge_agent/core/text.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace edge_agent {

namespace {

const std::regex& FilePathPattern() {
    static const std::regex pattern(
        R"((?:~/|/|\./)?[A-Za-z0-9_\-.]+(?:/[A-Za-z0-9_\-.]+)*\.[A-Za-z0-9]+)");
    return pattern;
}

bool HasAsciiLetter(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalpha(c) != 0;
    });
}

} // anonymous namespace

const std::vector<std::string>& DefaultDetectExtensions() {
    static const std::vector<std::string> defaults = {
        "rs", "toml", "md", "json", "yaml", "yml", "ts", "js", "py",
        "go", "sh", "txt", "c", "cpp", "h", "java", "cs",
    };
    return defaults;
}

std::vector<std::string> NormalizeExtensions(const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return {};
    }
    std::vector<std::string> normalized;
    std::set<std::string> seen;
    for (const auto& raw : extensions) {
        auto ext = ToLowerAscii(Trim(raw));
        if (ext.empty()) {
            continue;
        }
        const bool alnum = std::all_of(ext.begin(), ext.end(), [](unsigned char c) {
            return c < 0x80 && std::isalnum(c) != 0;
        });
        if (alnum && seen.insert(ext).second) {
            normalized.push_back(std::move(ext));
        }
    }
    if (normalized.empty()) {
        return DefaultDetectExtensions();
    }
    return normalized;
}

std::vector<std::string> DetectFilePaths(std::string_view text,
                                         const std::vector<std::string>& extensions) {
    std::vector<std::string> paths;
    if (extensions.empty()) {
        return paths;
    }
    std::set<std::string> allowed;
    for (const auto& ext : extensions) {
        allowed.insert(ToLowerAscii(ext));
    }

    std::set<std::string> seen;
    const std::string input(text);
    for (auto it = std::sregex_iterator(input.begin(), input.end(), FilePathPattern());
         it != std::sregex_iterator(); ++it) {
        const std::string path = it->str();
        if (!HasAsciiLetter(path)) {
            continue;
        }
        const auto dot = path.rfind('.');
        const auto ext = path.substr(dot + 1);
        if (!HasAsciiLetter(ext) || allowed.count(ToLowerAscii(ext)) == 0) {
            continue;
        }
        if (seen.insert(path).second) {
            paths.push_back(path);
        }
    }
    return paths;
}

DetectedPaths ClassifyDetectedPaths(const std::vector<std::string>& paths,
                                    bool write_intent) {
    DetectedPaths split;
    if (!write_intent) {
        split.inputs = paths;
    } else if (paths.size() == 1) {
        split.outputs = paths;
    } else if (!paths.empty()) {
        split.inputs.push_back(paths.front());
        split.outputs.assign(paths.begin() + 1, paths.end());
    }
    return split;
}

} // namespace edge_agent
