#pragma once

#include "mcprobe/client/rpc_session.hpp"
#include "mcprobe/probe/scenario.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace mcprobe {

struct RunnerOptions {
    /// Wait for each tools/call response; independent of the handshake timeout
    std::chrono::milliseconds call_timeout{30000};

    /// timeout_seconds argument handed to the server; clamped to [1, 300]
    std::int64_t fetch_timeout_seconds{10};
};

[[nodiscard]] std::int64_t clamp_fetch_timeout(std::int64_t seconds) noexcept;

/// params of the tools/call request issued for `scenario`
[[nodiscard]] Json build_fetch_call(const Scenario& scenario, std::int64_t timeout_seconds);

/// Classify one call result. Must not be given a Cancelled error: an
/// interrupt ends the run rather than producing an outcome.
[[nodiscard]] OutcomeDetail classify_response(const ClientResult<JsonRpcResponse>& result);

// ═══════════════════════════════════════════════════════════════════════════
// ScenarioRunner
// ═══════════════════════════════════════════════════════════════════════════
// Walks the scenario list in order, one tools/call per scenario, producing
// outcomes lazily. A failed scenario never stops the walk; only an operator
// interrupt does. The cursor only moves forward: a second pass needs a new
// runner (and a new process).

class ScenarioRunner {
public:
    using OutcomeSink = std::function<void(const ScenarioOutcome&)>;

    ScenarioRunner(RpcSession& session, std::vector<Scenario> scenarios, RunnerOptions options = {});

    /// Run the next scenario. std::nullopt once every scenario ran.
    [[nodiscard]] ClientResult<std::optional<ScenarioOutcome>> next();

    /// Drain the remaining scenarios, handing each outcome to `sink` as soon
    /// as it is classified.
    [[nodiscard]] ClientResult<std::vector<ScenarioOutcome>> run_all(const OutcomeSink& sink = {});

    [[nodiscard]] bool done() const noexcept { return position_ >= scenarios_.size(); }
    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] std::size_t size() const noexcept { return scenarios_.size(); }

private:
    RpcSession& session_;
    std::vector<Scenario> scenarios_;
    RunnerOptions options_;
    std::size_t position_{0};
};

}  // namespace mcprobe
