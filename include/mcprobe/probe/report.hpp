#pragma once

#include "mcprobe/client/client_error.hpp"
#include "mcprobe/probe/scenario.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mcprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Exit Codes
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr int kExitAllSucceeded = 0;
inline constexpr int kExitScenarioFailures = 1;
inline constexpr int kExitFatal = 2;
inline constexpr int kExitInterrupted = 130;

/// Exit code for a run that was aborted before producing a summary
[[nodiscard]] int exit_code_for(const ClientError& error) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Run Summary
// ═══════════════════════════════════════════════════════════════════════════

struct RunSummary {
    std::size_t total{0};
    std::size_t successes{0};
    std::size_t api_errors{0};
    std::size_t transport_failures{0};
    std::size_t expectation_mismatches{0};  // Succeeded, but with the other fetch method
    bool interrupted{false};

    void record(const ScenarioOutcome& outcome);

    [[nodiscard]] int exit_code() const noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Report Emitter
// ═══════════════════════════════════════════════════════════════════════════

enum class ReportFormat {
    Text,       // Human-readable, optionally coloured
    JsonLines   // One JSON document per line
};

[[nodiscard]] std::optional<ReportFormat> parse_report_format(std::string_view text) noexcept;

struct RunInfo {
    std::string command;
    std::vector<std::string> args;
    std::string working_directory;
    std::size_t scenario_count{0};

    /// command and args joined by single spaces
    [[nodiscard]] std::string command_line() const;
};

/// JSON document describing one outcome (the JsonLines record, minus "type")
[[nodiscard]] Json outcome_to_json(const ScenarioOutcome& outcome);

class ReportEmitter {
public:
    ReportEmitter(std::ostream& out, ReportFormat format, bool colors = false);

    void begin(const RunInfo& info);
    void emit(const ScenarioOutcome& outcome);

    /// `stage` names where the run stopped: "spawn", "handshake", "interrupted"
    void emit_fatal(std::string_view stage, const ClientError& error);

    void end(const RunSummary& summary);

    [[nodiscard]] ReportFormat format() const noexcept { return format_; }

private:
    [[nodiscard]] std::string_view paint(std::string_view code) const noexcept;
    void write_json(const Json& record);

    void emit_text(const ScenarioOutcome& outcome);
    void emit_success_text(const ScenarioOutcome& outcome, const FetchSuccess& success);
    void emit_api_failure_text(const ApiFailure& failure);
    void emit_transport_failure_text(const TransportFailure& failure);

    std::ostream& out_;
    ReportFormat format_;
    bool colors_;
    std::size_t expected_count_{0};
};

}  // namespace mcprobe
