#include "mcprobe/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

namespace mcprobe {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    constexpr std::array<std::pair<std::string_view, LogLevel>, 9> kNames{{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"critical", LogLevel::Fatal},
        {"off", LogLevel::Off},
    }};

    for (const auto& [candidate, level] : kNames) {
        const bool same = std::equal(
            name.begin(), name.end(), candidate.begin(), candidate.end(),
            [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == b;
            });
        if (same) {
            return level;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    const bool is_valid = (logger != nullptr);
    if (is_valid) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace mcprobe
