#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace edge_agent {

// ---------------------------------------------------------------------------
// Small string helpers shared across modules.
// ---------------------------------------------------------------------------

/// Strip ASCII whitespace from both ends.
[[nodiscard]] std::string_view Trim(std::string_view s);

/// Strip ASCII whitespace from the end only.
[[nodiscard]] std::string_view TrimRight(std::string_view s);

/// ASCII lower-casing; bytes >= 0x80 are left untouched.
[[nodiscard]] std::string ToLowerAscii(std::string_view s);

/// True when `s` is well-formed UTF-8.
[[nodiscard]] bool IsValidUtf8(std::string_view s);

/// Largest n <= max_bytes such that s[0, n) ends on a character boundary.
[[nodiscard]] std::size_t Utf8FloorBoundary(std::string_view s, std::size_t max_bytes);

/// Smallest n >= min_pos such that s[n, end) starts on a character boundary.
[[nodiscard]] std::size_t Utf8CeilBoundary(std::string_view s, std::size_t min_pos);

} // namespace edge_agent
