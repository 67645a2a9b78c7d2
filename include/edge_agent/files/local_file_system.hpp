#pragma once

#include <edge_agent/agent/collaborators.hpp>
#include <edge_agent/core/result.hpp>

#include <cstddef>
#include <string>

namespace edge_agent {

constexpr std::size_t kMaxReadBytes = 1024 * 1024;

/// Expand a leading "~" or "~/" using $HOME. Other paths are returned as-is.
[[nodiscard]] std::string ExpandHome(const std::string& path);

/// True when `path` (absolute, normalized) lies in a protected system directory.
[[nodiscard]] bool IsSystemPath(const std::string& path);

// ---------------------------------------------------------------------------
// LocalFileSystem — IFileSystem backed by the real file system.
//
// Reads are limited to regular UTF-8 files of at most kMaxReadBytes. Writes
// create missing parent directories and refuse system directories.
// ---------------------------------------------------------------------------
class LocalFileSystem : public IFileSystem {
public:
    LocalFileSystem() = default;

    [[nodiscard]] Result<std::string, Error> ReadFile(const std::string& path) override;
    [[nodiscard]] Result<void, Error> WriteFile(const std::string& path,
                                                const std::string& content) override;
    [[nodiscard]] bool Exists(const std::string& path) override;
};

} // namespace edge_agent
