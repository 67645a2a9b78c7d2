#pragma once

#include <string>
#include <string_view>

namespace edge_agent {
namespace ansi {

constexpr const char* kReset   = "\033[0m";
constexpr const char* kBold    = "\033[1m";
constexpr const char* kDim     = "\033[90m";
constexpr const char* kRed     = "\033[1;31m";
constexpr const char* kGreen   = "\033[1;32m";
constexpr const char* kYellow  = "\033[33m";
constexpr const char* kCyan    = "\033[36m";
constexpr const char* kBlue    = "\033[34m";
constexpr const char* kMagenta = "\033[35m";

// Wrap `text` in `code` ... kReset when `enabled`, otherwise return it as-is.
inline std::string Paint(std::string_view text, const char* code, bool enabled) {
    if (!enabled) {
        return std::string(text);
    }
    std::string out(code);
    out += text;
    out += kReset;
    return out;
}

} // namespace ansi
} // namespace edge_agent
