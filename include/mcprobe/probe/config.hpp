#pragma once

#include "mcprobe/probe/scenario.hpp"
#include "mcprobe/protocol/mcp_types.hpp"
#include "mcprobe/transport/process_transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Configuration Errors
// ═══════════════════════════════════════════════════════════════════════════

struct ConfigError {
    enum class Code {
        Io,       // File missing or unreadable
        Parse,    // Not valid JSON
        Schema,   // Valid JSON of the wrong shape
        Invalid   // Values out of range
    };

    Code code{Code::Invalid};
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ═══════════════════════════════════════════════════════════════════════════
// Run Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Everything one run needs. Built by the CLI (or a test) and handed to run();
// nothing in it is read from global state.

struct RunConfig {
    ProcessTransportConfig target;
    std::vector<Scenario> scenarios;
    Implementation client_info{"mcprobe", "0.1.0"};

    std::chrono::milliseconds handshake_timeout{10000};
    std::chrono::milliseconds call_timeout{30000};
    std::int64_t fetch_timeout_seconds{10};

    /// Polled during every wait; nullptr disables interruption
    const std::atomic<bool>* cancel_flag = nullptr;
};

/// The two built-in scenarios: a static HTML page and a single-page app shell
[[nodiscard]] std::vector<Scenario> default_scenarios();

/// `cargo run -- mcp` in the current directory with the built-in scenarios
[[nodiscard]] RunConfig default_run_config();

/// Reject configurations run() cannot honour (empty command, non-positive timeouts)
[[nodiscard]] ConfigResult<void> validate(const RunConfig& config);

/// "capture", "passthrough" or "discard" (case-insensitive)
[[nodiscard]] std::optional<StderrHandling> parse_stderr_handling(std::string_view text) noexcept;

/// Parse a JSON array of { "name", "url", "description"?, "expect"? }
[[nodiscard]] ConfigResult<std::vector<Scenario>> parse_scenarios(const Json& document);

/// Read and parse a scenario file
[[nodiscard]] ConfigResult<std::vector<Scenario>> load_scenarios(const std::string& path);

}  // namespace mcprobe
