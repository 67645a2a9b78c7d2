#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

/// Extensions recognized when none are configured.
[[nodiscard]] const std::vector<std::string>& DefaultDetectExtensions();

/// Trim and lower-case; drop empty, non-alphanumeric and duplicate entries.
/// An explicitly empty input stays empty (detection disabled); an input whose
/// entries are all invalid falls back to the defaults.
[[nodiscard]] std::vector<std::string> NormalizeExtensions(
    const std::vector<std::string>& extensions);

/// Path-like tokens in `text` (optionally starting with "~/", "/" or "./")
/// whose extension is in `extensions` (case-insensitive) and contains a
/// letter. De-duplicated, in order of appearance.
[[nodiscard]] std::vector<std::string> DetectFilePaths(
    std::string_view text, const std::vector<std::string>& extensions);

struct DetectedPaths {
    std::vector<std::string> inputs;   // attached as file context
    std::vector<std::string> outputs;  // write targets, not loaded
};

/// Split detected paths by intent. Without write intent every path is an
/// input. With write intent a single path is an output target; with two or
/// more the first is the input and the rest are outputs.
[[nodiscard]] DetectedPaths ClassifyDetectedPaths(const std::vector<std::string>& paths,
                                                  bool write_intent);

} // namespace edge_agent
