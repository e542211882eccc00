#include <catch2/catch_test_macros.hpp>

#include "mcprobe/log/logger.hpp"
#include "mocks/capturing_logger.hpp"

#include <chrono>
#include <string_view>

using namespace mcprobe;
using mcprobe::testing::CapturingLogger;
using mcprobe::testing::ScopedCapture;

// ─────────────────────────────────────────────────────────────────────────────
// Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts command-line spellings", "[log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Info") == LogLevel::Info);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);

    REQUIRE(parse_log_level("").has_value() == false);
    REQUIRE(parse_log_level("verbose").has_value() == false);
    REQUIRE(parse_log_level("warnings").has_value() == false);
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    // Should not crash
    logger.write(LogLevel::Error, "dropped");
}

TEST_CASE("write filters below the minimum level", "[log]") {
    CapturingLogger logger(LogLevel::Warn);

    logger.write(LogLevel::Debug, "debug message");
    logger.write(LogLevel::Info, "info message");
    logger.write(LogLevel::Warn, "warn message");
    logger.write(LogLevel::Error, "error message");

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "warn message");
    REQUIRE(records[1].level == LogLevel::Error);
}

TEST_CASE("LogRecord captures source location and timestamp", "[log]") {
    CapturingLogger logger;

    const auto before = std::chrono::system_clock::now();
    logger.write(LogLevel::Info, "test message");
    const auto after = std::chrono::system_clock::now();

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    const std::string_view filename(records[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(records[0].location.line() > 0);
    REQUIRE(records[0].timestamp >= before);
    REQUIRE(records[0].timestamp <= after);
}

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("MCPROBE_LOG macros format and filter", "[log]") {
    ScopedCapture capture(LogLevel::Debug);

    MCPROBE_LOG_TRACE("trace {}", 1);  // Filtered
    MCPROBE_LOG_DEBUG("debug {}", 2);
    MCPROBE_LOG_INFO("pid {} started", 42);
    MCPROBE_LOG_WARN("late reply to {}", "mcprobe-3");
    MCPROBE_LOG_ERROR("error");
    MCPROBE_LOG_FATAL("fatal");

    const auto records = capture.logger().records();
    REQUIRE(records.size() == 5);
    REQUIRE(records[0].message == "debug 2");
    REQUIRE(records[1].message == "pid 42 started");
    REQUIRE(records[2].message == "late reply to mcprobe-3");
    REQUIRE(records[4].level == LogLevel::Fatal);

    // The record points at the macro call site
    REQUIRE(std::string_view(records[0].location.file_name()).find("logger_test") != std::string_view::npos);
}

TEST_CASE("Disabled levels skip formatting entirely", "[log]") {
    ScopedCapture capture(LogLevel::Error);

    int evaluated = 0;
    auto count = [&evaluated] { return ++evaluated; };
    MCPROBE_LOG_DEBUG("value {}", count());

    REQUIRE(evaluated == 0);
    REQUIRE(capture.logger().records().empty());
}
