#include "mcprobe/probe/report.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mcprobe {

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
constexpr std::string_view reset   = "\033[0m";
constexpr std::string_view bold    = "\033[1m";
constexpr std::string_view dim     = "\033[2m";
constexpr std::string_view red     = "\033[31m";
constexpr std::string_view green   = "\033[32m";
constexpr std::string_view yellow  = "\033[33m";
constexpr std::string_view cyan    = "\033[36m";
}  // namespace color

template <typename T>
Json or_null(const std::optional<T>& value) {
    if (value.has_value()) {
        return Json(*value);
    }
    return nullptr;
}

std::string dump_line(const Json& j) {
    // Captured stderr is arbitrary bytes; never let it abort the report
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::string_view expectation_label(const FetchSuccess& success, ExpectedFetch expected) {
    const auto verdict = success.matches(expected);
    if (!verdict.has_value()) {
        return "unverified";
    }
    return *verdict ? "met" : "mismatch";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Exit codes and summary
// ─────────────────────────────────────────────────────────────────────────────

int exit_code_for(const ClientError& error) noexcept {
    return error.code == ClientErrorCode::Cancelled ? kExitInterrupted : kExitFatal;
}

void RunSummary::record(const ScenarioOutcome& outcome) {
    ++total;
    if (const auto* success = std::get_if<FetchSuccess>(&outcome.detail)) {
        ++successes;
        if (success->matches(outcome.scenario.expected_fetch) == false) {
            ++expectation_mismatches;
        }
    } else if (std::holds_alternative<ApiFailure>(outcome.detail)) {
        ++api_errors;
    } else {
        ++transport_failures;
    }
}

int RunSummary::exit_code() const noexcept {
    if (interrupted) {
        return kExitInterrupted;
    }
    if (api_errors > 0 || transport_failures > 0) {
        return kExitScenarioFailures;
    }
    return kExitAllSucceeded;
}

std::optional<ReportFormat> parse_report_format(std::string_view text) noexcept {
    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "text") {
        return ReportFormat::Text;
    }
    if (lowered == "jsonl" || lowered == "json-lines" || lowered == "ndjson") {
        return ReportFormat::JsonLines;
    }
    return std::nullopt;
}

std::string RunInfo::command_line() const {
    std::string line = command;
    for (const auto& arg : args) {
        line += ' ';
        line += arg;
    }
    return line;
}

Json outcome_to_json(const ScenarioOutcome& outcome) {
    Json j = {
        {"index", outcome.index},
        {"name", outcome.scenario.name},
        {"url", outcome.scenario.target},
        {"expected_behavior", outcome.scenario.expected_behavior},
        {"expected_fetch", std::string(to_string(outcome.scenario.expected_fetch))},
        {"classification", std::string(classification(outcome.detail))},
        {"elapsed_ms", outcome.elapsed.count()}
    };
    if (!outcome.response_id.empty()) {
        j["response_id"] = outcome.response_id;
    }

    if (const auto* success = std::get_if<FetchSuccess>(&outcome.detail)) {
        const FetchedContent& content = success->content;
        j["content"] = {
            {"text_length", content.text_length},
            {"title", or_null(content.title)},
            {"url", or_null(content.url)},
            {"fetch_method", or_null(content.fetch_method_raw)},
            {"javascript_detected", or_null(content.javascript_detected)},
            {"status_code", or_null(content.status_code)},
            {"content_type", or_null(content.content_type)}
        };
        j["expectation"] = std::string(expectation_label(*success, outcome.scenario.expected_fetch));
    } else if (const auto* api = std::get_if<ApiFailure>(&outcome.detail)) {
        j["error"] = api->raw;
    } else if (const auto* failure = std::get_if<TransportFailure>(&outcome.detail)) {
        j["failure"] = {
            {"kind", std::string(to_string(failure->kind))},
            {"message", failure->message}
        };
        if (!failure->diagnostics.empty()) {
            j["failure"]["diagnostics"] = failure->diagnostics;
        }
    }
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════
// ReportEmitter
// ═══════════════════════════════════════════════════════════════════════════

ReportEmitter::ReportEmitter(std::ostream& out, ReportFormat format, bool colors)
    : out_(out)
    , format_(format)
    , colors_(colors && format == ReportFormat::Text)
{}

std::string_view ReportEmitter::paint(std::string_view code) const noexcept {
    return colors_ ? code : std::string_view{};
}

void ReportEmitter::write_json(const Json& record) {
    out_ << dump_line(record) << '\n' << std::flush;
}

void ReportEmitter::begin(const RunInfo& info) {
    expected_count_ = info.scenario_count;

    if (format_ == ReportFormat::JsonLines) {
        write_json({
            {"type", "run"},
            {"command", info.command},
            {"args", info.args},
            {"cwd", info.working_directory},
            {"scenarios", info.scenario_count}
        });
        return;
    }

    out_ << paint(color::bold) << paint(color::cyan)
         << "═══ MCP fetch probe ═══" << paint(color::reset) << "\n"
         << "Target:    " << info.command_line() << "\n";
    if (!info.working_directory.empty()) {
        out_ << "Directory: " << info.working_directory << "\n";
    }
    out_ << "Scenarios: " << info.scenario_count << "\n" << std::flush;
}

void ReportEmitter::emit(const ScenarioOutcome& outcome) {
    if (format_ == ReportFormat::JsonLines) {
        Json record = outcome_to_json(outcome);
        record["type"] = "outcome";
        write_json(record);
        return;
    }
    emit_text(outcome);
}

void ReportEmitter::emit_text(const ScenarioOutcome& outcome) {
    out_ << "\n" << paint(color::bold) << "[" << outcome.index;
    if (expected_count_ > 0) {
        out_ << "/" << expected_count_;
    }
    out_ << "] " << outcome.scenario.name << paint(color::reset) << "\n";
    out_ << "  URL:         " << outcome.scenario.target << "\n";
    if (!outcome.scenario.expected_behavior.empty()) {
        out_ << "  Expectation: " << paint(color::dim) << outcome.scenario.expected_behavior
             << paint(color::reset) << "\n";
    }

    std::string_view tint = color::red;
    if (outcome.succeeded()) {
        tint = color::green;
    } else if (std::holds_alternative<ApiFailure>(outcome.detail)) {
        tint = color::yellow;
    }
    out_ << "  Result:      " << paint(tint) << classification(outcome.detail) << paint(color::reset)
         << " (" << outcome.elapsed.count() << " ms)\n";

    if (const auto* success = std::get_if<FetchSuccess>(&outcome.detail)) {
        emit_success_text(outcome, *success);
    } else if (const auto* api = std::get_if<ApiFailure>(&outcome.detail)) {
        emit_api_failure_text(*api);
    } else if (const auto* failure = std::get_if<TransportFailure>(&outcome.detail)) {
        emit_transport_failure_text(*failure);
    }
    out_ << std::flush;
}

void ReportEmitter::emit_success_text(const ScenarioOutcome& outcome, const FetchSuccess& success) {
    const FetchedContent& content = success.content;

    out_ << "  Fetch method:        " << content.fetch_method_raw.value_or("Unknown") << "\n";
    out_ << "  JavaScript detected: ";
    if (content.javascript_detected.has_value()) {
        out_ << (*content.javascript_detected ? "yes" : "no") << "\n";
    } else {
        out_ << "Unknown\n";
    }
    out_ << "  Content length:      " << content.text_length << " characters\n";
    out_ << "  Title:               " << content.title.value_or("(none)") << "\n";
    if (content.status_code.has_value()) {
        out_ << "  HTTP status:         " << *content.status_code << "\n";
    }

    const ExpectedFetch expected = outcome.scenario.expected_fetch;
    if (expected == ExpectedFetch::Unspecified) {
        return;
    }
    const auto verdict = success.matches(expected);
    out_ << "  Fetcher check:       ";
    if (!verdict.has_value()) {
        out_ << paint(color::dim) << "unverified (no fetch method reported)" << paint(color::reset) << "\n";
    } else if (*verdict) {
        out_ << paint(color::green) << "met (" << to_string(expected) << ")" << paint(color::reset) << "\n";
    } else {
        out_ << paint(color::yellow) << "mismatch (expected " << to_string(expected) << ")"
             << paint(color::reset) << "\n";
    }
}

void ReportEmitter::emit_api_failure_text(const ApiFailure& failure) {
    out_ << "  Error code:    " << failure.error.code << "\n";
    out_ << "  Error message: " << failure.error.message << "\n";
    out_ << "  Payload:       " << paint(color::dim) << dump_line(failure.raw) << paint(color::reset) << "\n";
}

void ReportEmitter::emit_transport_failure_text(const TransportFailure& failure) {
    out_ << "  Failure:     " << to_string(failure.kind) << "\n";
    out_ << "  Message:     " << failure.message << "\n";
    if (failure.diagnostics.empty()) {
        return;
    }
    out_ << "  Diagnostics:\n";
    std::istringstream lines(failure.diagnostics);
    std::string line;
    while (std::getline(lines, line)) {
        out_ << "    " << paint(color::dim) << "| " << line << paint(color::reset) << "\n";
    }
}

void ReportEmitter::emit_fatal(std::string_view stage, const ClientError& error) {
    if (format_ == ReportFormat::JsonLines) {
        Json record = {
            {"type", "fatal"},
            {"stage", std::string(stage)},
            {"code", std::string(to_string(error.code))},
            {"message", error.message}
        };
        if (error.rpc_error.has_value()) {
            record["rpc_error"] = error.rpc_error->to_json();
        }
        if (!error.diagnostics.empty()) {
            record["diagnostics"] = error.diagnostics;
        }
        write_json(record);
        return;
    }

    out_ << "\n" << paint(color::red) << paint(color::bold) << "Run aborted during " << stage
         << paint(color::reset) << ": " << error.message << "\n";
    if (!error.diagnostics.empty()) {
        std::istringstream lines(error.diagnostics);
        std::string line;
        while (std::getline(lines, line)) {
            out_ << "    " << paint(color::dim) << "| " << line << paint(color::reset) << "\n";
        }
    }
    out_ << std::flush;
}

void ReportEmitter::end(const RunSummary& summary) {
    if (format_ == ReportFormat::JsonLines) {
        write_json({
            {"type", "summary"},
            {"total", summary.total},
            {"successes", summary.successes},
            {"api_errors", summary.api_errors},
            {"transport_failures", summary.transport_failures},
            {"expectation_mismatches", summary.expectation_mismatches},
            {"interrupted", summary.interrupted},
            {"exit_code", summary.exit_code()}
        });
        return;
    }

    out_ << "\n" << paint(color::bold) << paint(color::cyan) << "═══ Summary ═══" << paint(color::reset) << "\n";
    out_ << "  Scenarios run:       " << summary.total;
    if (expected_count_ > summary.total) {
        out_ << " of " << expected_count_;
    }
    out_ << "\n";
    out_ << "  Success:             " << paint(color::green) << summary.successes << paint(color::reset) << "\n";
    out_ << "  ApiError:            " << paint(summary.api_errors > 0 ? color::yellow : std::string_view{})
         << summary.api_errors << paint(color::reset) << "\n";
    out_ << "  TransportFailure:    " << paint(summary.transport_failures > 0 ? color::red : std::string_view{})
         << summary.transport_failures << paint(color::reset) << "\n";
    out_ << "  Fetcher mismatches:  " << summary.expectation_mismatches << "\n";
    if (summary.interrupted) {
        out_ << paint(color::red) << "  Interrupted by operator" << paint(color::reset) << "\n";
    }
    out_ << std::flush;
}

}  // namespace mcprobe
