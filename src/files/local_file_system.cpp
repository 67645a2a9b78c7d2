#include <edge_agent/files/local_file_system.hpp>

#include <edge_agent/core/log.hpp>
#include <edge_agent/core/text.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace edge_agent {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "files";

constexpr const char* kSystemDirs[] = {
    "/etc", "/usr", "/bin", "/sbin", "/sys", "/proc",
    "/boot", "/dev", "/lib", "/lib64", "/opt", "/var",
};

Error MakeFileError(const std::string& operation,
                    const std::string& path,
                    const std::string& message) {
    Error err;
    err.operation = operation;
    err.target = path;
    err.message = message;
    err.category = ErrorCategory::FileIo;
    return err;
}

// Absolute, lexically normalized form of `path` after "~" expansion.
fs::path Resolve(const std::string& path) {
    fs::path p(ExpandHome(path));
    std::error_code ec;
    auto absolute = fs::absolute(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return absolute.lexically_normal();
}

} // anonymous namespace

std::string ExpandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        return path;  // ~user is not supported
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return path;
    }
    return std::string(home) + path.substr(1);
}

bool IsSystemPath(const std::string& path) {
    for (const std::string dir : kSystemDirs) {
        if (path == dir) {
            return true;
        }
        if (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
            path[dir.size()] == '/') {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// ReadFile
// ---------------------------------------------------------------------------
Result<std::string, Error> LocalFileSystem::ReadFile(const std::string& path) {
    using R = Result<std::string, Error>;
    const auto resolved = Resolve(path);

    std::error_code ec;
    const auto status = fs::status(resolved, ec);
    if (ec || !fs::exists(status)) {
        return R::Err(MakeFileError("ReadFile", path, "File not found: " + path));
    }
    if (fs::is_directory(status)) {
        return R::Err(MakeFileError("ReadFile", path, "Path is a directory: " + path));
    }
    const auto size = fs::file_size(resolved, ec);
    if (ec) {
        return R::Err(MakeFileError("ReadFile", path,
                                    "Cannot determine file size: " + ec.message()));
    }
    if (size > kMaxReadBytes) {
        return R::Err(MakeFileError("ReadFile", path,
                                    "File too large (" + std::to_string(size) +
                                        " bytes, limit " + std::to_string(kMaxReadBytes) +
                                        ")"));
    }

    std::ifstream ifs(resolved, std::ios::binary);
    if (!ifs) {
        return R::Err(MakeFileError("ReadFile", path, "Cannot open file: " + path));
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    auto content = ss.str();
    if (!IsValidUtf8(content)) {
        return R::Err(MakeFileError("ReadFile", path, "File is not valid UTF-8 text"));
    }
    LogDebug(kComponent, "Read " + std::to_string(content.size()) + " bytes from " +
                             resolved.string());
    return R::Ok(std::move(content));
}

// ---------------------------------------------------------------------------
// WriteFile
// ---------------------------------------------------------------------------
Result<void, Error> LocalFileSystem::WriteFile(const std::string& path,
                                               const std::string& content) {
    using R = Result<void, Error>;
    if (path.empty()) {
        return R::Err(MakeFileError("WriteFile", path, "Empty path"));
    }
    const auto resolved = Resolve(path);
    if (IsSystemPath(resolved.string())) {
        return R::Err(MakeFileError("WriteFile", path,
                                    "Refusing to write into system directory: " +
                                        resolved.string()));
    }

    std::error_code ec;
    if (fs::is_directory(resolved, ec)) {
        return R::Err(MakeFileError("WriteFile", path, "Path is a directory: " + path));
    }
    const auto parent = resolved.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return R::Err(MakeFileError("WriteFile", path,
                                        "Cannot create directory " + parent.string() +
                                            ": " + ec.message()));
        }
    }

    std::ofstream ofs(resolved, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return R::Err(MakeFileError("WriteFile", path, "Cannot open file for writing: " + path));
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
        return R::Err(MakeFileError("WriteFile", path, "Write failed: " + path));
    }
    LogInfo(kComponent, "Wrote " + std::to_string(content.size()) + " bytes to " +
                            resolved.string());
    return R::Ok();
}

bool LocalFileSystem::Exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(Resolve(path), ec);
}

} // namespace edge_agent
