#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace edge_agent {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Destination for log lines. Sinks are not required to be thread-safe;
// Logger serializes calls.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines for the terminal (stderr by default).
//   color:  HH:MM:SS LEVEL [component] message
//   plain:  <iso8601> [LEVEL] [component] message
// Server stderr lines (component "mcp:<name>") get a magenta tag.
class TerminalSink : public ILogSink {
public:
    explicit TerminalSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts","level","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// JSON lines into a stream the sink owns (--log-file).
class FileSink : public ILogSink {
public:
    explicit FileSink(std::unique_ptr<std::ostream> file);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<std::ostream> file_;
    JsonSink json_;
};

class TeeSink : public ILogSink {
public:
    explicit TeeSink(std::vector<std::unique_ptr<ILogSink>> sinks);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Level filter in front of a sink. Safe to share between the reader
// threads of several MCP servers.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Write(LogLevel level, std::string_view component,
               std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Discards everything until InitGlobalLogger runs.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace edge_agent
