#include <edge_agent/core/log.hpp>
#include <edge_agent/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace edge_agent {

namespace {

struct LevelStyle {
    const char* name;
    const char* padded;
    const char* color;
};

// Indexed by LogLevel.
constexpr LevelStyle kLevelStyles[] = {
    {"DEBUG", "DEBUG", ansi::kDim},
    {"INFO",  "INFO ", ansi::kCyan},
    {"WARN",  "WARN ", ansi::kYellow},
    {"ERROR", "ERROR", ansi::kRed},
};

const LevelStyle& StyleOf(LogLevel level) {
    return kLevelStyles[static_cast<int>(level)];
}

// UTC with milliseconds for plain and JSON output; local HH:MM:SS for the
// compact colored format.
std::string Timestamp(bool compact) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
    std::ostringstream oss;
    if (compact) {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }
    gmtime_r(&seconds, &parts);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalSlot() {
    static auto slot = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return slot;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (int i = 0; i < 4; ++i) {
        std::string candidate = kLevelStyles[i].name;
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lower) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// TerminalSink
// ---------------------------------------------------------------------------
TerminalSink::TerminalSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void TerminalSink::Write(LogLevel level, std::string_view component,
                         std::string_view message) {
    const auto& style = StyleOf(level);
    if (!use_color_) {
        out_ << Timestamp(false) << " [" << style.name << "] [" << component
             << "] " << message << '\n';
        return;
    }

    const bool from_server = component.substr(0, 4) == "mcp:";
    out_ << ansi::kDim << Timestamp(true) << ansi::kReset << ' '
         << style.color << style.padded << ansi::kReset << ' '
         << (from_server ? ansi::kMagenta : ansi::kDim)
         << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << style.color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink / FileSink / TeeSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json line = {
        {"ts", Timestamp(false)},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Server stderr is not guaranteed to be UTF-8.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << std::endl;
}

FileSink::FileSink(std::unique_ptr<std::ostream> file)
    : file_(std::move(file)), json_(*file_) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    json_.Write(level, component, message);
}

TeeSink::TeeSink(std::vector<std::unique_ptr<ILogSink>> sinks)
    : sinks_(std::move(sinks)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto& sink : sinks_) {
        sink->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::Enabled(LogLevel level) const {
    return level >= Level();
}

void Logger::Write(LogLevel level, std::string_view component,
                   std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Write(LogLevel::Error, component, message);
}

} // namespace edge_agent
