#pragma once

#include "mcprobe/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mcprobe {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// The driver's stdout carries the scenario report, so diagnostics go to
// stderr (or a file), never stdout.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stderr sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Any combination of sinks
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;
    void flush() override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// Colored stderr logger
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_stderr_logger(LogLevel min_level = LogLevel::Info);

/// Append-mode file logger; throws spdlog::spdlog_ex if the file cannot be opened
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Debug
);

}  // namespace mcprobe
