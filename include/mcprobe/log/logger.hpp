#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcprobe {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Wire frames
    Debug = 1,  // Skipped lines, state transitions
    Info  = 2,  // Process lifecycle, handshake
    Warn  = 3,  // Late replies, unexpected but tolerated input
    Error = 4,  // Scenario or stage failed
    Fatal = 5,  // Run aborted
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as given on the command line ("debug", "WARN", ...)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    // Push buffered records out; called before the process exits
    virtual void flush() {}

    void write(LogLevel level, std::string msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::move(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────
// The one process-wide object in the project: a sink, never run state.

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Logging macros. Arguments are a std::format format string and its values;
// nothing is formatted unless the level is enabled.

#define MCPROBE_LOG_AT(lvl, ...) \
    do { if (::mcprobe::get_logger().should_log(lvl)) \
         ::mcprobe::get_logger().write(lvl, std::format(__VA_ARGS__)); } while(false)

#define MCPROBE_LOG_TRACE(...) MCPROBE_LOG_AT(::mcprobe::LogLevel::Trace, __VA_ARGS__)
#define MCPROBE_LOG_DEBUG(...) MCPROBE_LOG_AT(::mcprobe::LogLevel::Debug, __VA_ARGS__)
#define MCPROBE_LOG_INFO(...)  MCPROBE_LOG_AT(::mcprobe::LogLevel::Info, __VA_ARGS__)
#define MCPROBE_LOG_WARN(...)  MCPROBE_LOG_AT(::mcprobe::LogLevel::Warn, __VA_ARGS__)
#define MCPROBE_LOG_ERROR(...) MCPROBE_LOG_AT(::mcprobe::LogLevel::Error, __VA_ARGS__)
#define MCPROBE_LOG_FATAL(...) MCPROBE_LOG_AT(::mcprobe::LogLevel::Fatal, __VA_ARGS__)

}  // namespace mcprobe
