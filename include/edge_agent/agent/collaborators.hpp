#pragma once

#include <edge_agent/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace edge_agent {

// Receives generated text as it is produced.
using TokenCallback = std::function<void(std::string_view)>;

// ---------------------------------------------------------------------------
// IModelRuntime — runs one completion. Implementations stream chunks through
// on_token (may be empty) and return the full generated text.
// ---------------------------------------------------------------------------
class IModelRuntime {
public:
    virtual ~IModelRuntime() = default;

    IModelRuntime(const IModelRuntime&) = delete;
    IModelRuntime& operator=(const IModelRuntime&) = delete;
    IModelRuntime(IModelRuntime&&) = delete;
    IModelRuntime& operator=(IModelRuntime&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Run(
        const std::string& prompt, const TokenCallback& on_token) = 0;

protected:
    IModelRuntime() = default;
};

// ---------------------------------------------------------------------------
// IFileSystem — the local file operations the agent may perform.
// ---------------------------------------------------------------------------
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    IFileSystem(const IFileSystem&) = delete;
    IFileSystem& operator=(const IFileSystem&) = delete;
    IFileSystem(IFileSystem&&) = delete;
    IFileSystem& operator=(IFileSystem&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> ReadFile(const std::string& path) = 0;
    [[nodiscard]] virtual Result<void, Error> WriteFile(const std::string& path,
                                                        const std::string& content) = 0;
    [[nodiscard]] virtual bool Exists(const std::string& path) = 0;

protected:
    IFileSystem() = default;
};

// ---------------------------------------------------------------------------
// IConfirmer — asks the user before destructive or requested-confirmation
// actions. Returning false means "do not proceed".
// ---------------------------------------------------------------------------
class IConfirmer {
public:
    virtual ~IConfirmer() = default;

    IConfirmer(const IConfirmer&) = delete;
    IConfirmer& operator=(const IConfirmer&) = delete;
    IConfirmer(IConfirmer&&) = delete;
    IConfirmer& operator=(IConfirmer&&) = delete;

    [[nodiscard]] virtual bool ConfirmOverwrite(const std::string& path) = 0;
    [[nodiscard]] virtual bool ConfirmWrite(const std::string& path) = 0;

protected:
    IConfirmer() = default;
};

} // namespace edge_agent
