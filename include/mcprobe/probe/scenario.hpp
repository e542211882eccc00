#pragma once

#include "mcprobe/client/client_error.hpp"
#include "mcprobe/protocol/mcp_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mcprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Scenario
// ═══════════════════════════════════════════════════════════════════════════

/// Qualitative behaviour a scenario expects from the server's fetch strategy
enum class ExpectedFetch {
    Unspecified,
    Static,   // Plain HTML, no script rendering needed
    Browser   // Single-page application shell, needs script rendering
};

[[nodiscard]] constexpr std::string_view to_string(ExpectedFetch expected) noexcept {
    switch (expected) {
        case ExpectedFetch::Unspecified: return "unspecified";
        case ExpectedFetch::Static:      return "static";
        case ExpectedFetch::Browser:     return "browser";
    }
    return "unspecified";
}

[[nodiscard]] std::optional<ExpectedFetch> parse_expected_fetch(std::string_view text) noexcept;

struct Scenario {
    std::string name;
    std::string target;              // URL handed to fetch_web_content
    std::string expected_behavior;   // Free text shown to the operator
    ExpectedFetch expected_fetch{ExpectedFetch::Unspecified};
};

// ═══════════════════════════════════════════════════════════════════════════
// Scenario Outcome
// ═══════════════════════════════════════════════════════════════════════════

/// Server answered with a result
struct FetchSuccess {
    FetchedContent content;

    /// std::nullopt when nothing was expected or the server did not report a method
    [[nodiscard]] std::optional<bool> matches(ExpectedFetch expected) const noexcept;
};

/// Server answered with an error envelope; payload kept verbatim
struct ApiFailure {
    JsonRpcError error;
    Json raw;
};

/// The exchange itself failed (timeout, closed peer, malformed line, I/O)
struct TransportFailure {
    ClientErrorCode kind;
    std::string message;
    std::string diagnostics;
};

using OutcomeDetail = std::variant<FetchSuccess, ApiFailure, TransportFailure>;

struct ScenarioOutcome {
    std::size_t index{0};   // 1-based position in the run
    Scenario scenario;
    std::string response_id;  // Empty when no response was accepted
    std::chrono::milliseconds elapsed{0};
    OutcomeDetail detail;

    [[nodiscard]] bool succeeded() const noexcept {
        return std::holds_alternative<FetchSuccess>(detail);
    }
};

[[nodiscard]] std::string_view classification(const OutcomeDetail& detail) noexcept;

}  // namespace mcprobe
