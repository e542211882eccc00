#include "mcprobe/probe/scenario_runner.hpp"
#include "mcprobe/log/logger.hpp"

#include <algorithm>

namespace mcprobe {

std::int64_t clamp_fetch_timeout(std::int64_t seconds) noexcept {
    return std::clamp(seconds, kMinFetchTimeoutSeconds, kMaxFetchTimeoutSeconds);
}

Json build_fetch_call(const Scenario& scenario, std::int64_t timeout_seconds) {
    FetchArguments arguments;
    arguments.url = scenario.target;
    arguments.timeout_seconds = clamp_fetch_timeout(timeout_seconds);

    CallToolParams params;
    params.name = kFetchToolName;
    params.arguments = arguments.to_json();
    return params.to_json();
}

OutcomeDetail classify_response(const ClientResult<JsonRpcResponse>& result) {
    if (!result) {
        const ClientError& error = result.error();
        return TransportFailure{error.code, error.message, error.diagnostics};
    }

    if (result->is_error()) {
        return ApiFailure{result->error(), result->error_payload()};
    }

    auto content = FetchedContent::from_result(result->result());
    if (!content) {
        return TransportFailure{
            ClientErrorCode::ProtocolError,
            "Unexpected tool result shape: " + content.error().message,
            {}};
    }
    return FetchSuccess{std::move(*content)};
}

ScenarioRunner::ScenarioRunner(RpcSession& session, std::vector<Scenario> scenarios, RunnerOptions options)
    : session_(session)
    , scenarios_(std::move(scenarios))
    , options_(options)
{}

ClientResult<std::optional<ScenarioOutcome>> ScenarioRunner::next() {
    if (done()) {
        return std::optional<ScenarioOutcome>{};
    }

    const Scenario& scenario = scenarios_[position_];
    ++position_;

    MCPROBE_LOG_INFO("Scenario {}/{}: {} ({})", position_, scenarios_.size(), scenario.name, scenario.target);

    const auto start = Clock::now();
    auto response = session_.call(
        methods::kToolsCall,
        build_fetch_call(scenario, options_.fetch_timeout_seconds),
        options_.call_timeout);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);

    if (!response && response.error().code == ClientErrorCode::Cancelled) {
        return tl::unexpected(response.error());
    }

    ScenarioOutcome outcome;
    outcome.index = position_;
    outcome.scenario = scenario;
    outcome.elapsed = elapsed;
    if (response) {
        outcome.response_id = response->id();
    }
    outcome.detail = classify_response(response);

    if (const auto* failure = std::get_if<TransportFailure>(&outcome.detail)) {
        MCPROBE_LOG_ERROR("Scenario {} failed: {}: {}", outcome.index, to_string(failure->kind), failure->message);
    } else if (const auto* api = std::get_if<ApiFailure>(&outcome.detail)) {
        MCPROBE_LOG_WARN("Scenario {} returned API error [{}] {}", outcome.index, api->error.code, api->error.message);
    }

    return std::optional<ScenarioOutcome>{std::move(outcome)};
}

ClientResult<std::vector<ScenarioOutcome>> ScenarioRunner::run_all(const OutcomeSink& sink) {
    std::vector<ScenarioOutcome> outcomes;
    outcomes.reserve(scenarios_.size() - position_);

    while (true) {
        auto step = next();
        if (!step) {
            return tl::unexpected(step.error());
        }
        if (!step->has_value()) {
            break;
        }
        if (sink) {
            sink(**step);
        }
        outcomes.push_back(std::move(**step));
    }
    return outcomes;
}

}  // namespace mcprobe
