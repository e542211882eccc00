#include "mcprobe/probe/run.hpp"
#include "mcprobe/client/handshake.hpp"
#include "mcprobe/client/rpc_session.hpp"
#include "mcprobe/log/logger.hpp"
#include "mcprobe/probe/scenario_runner.hpp"
#include "mcprobe/transport/process_transport.hpp"

#include <exception>
#include <string>

namespace mcprobe {

namespace {

ClientResult<RunSummary> abort_run(
    ReportEmitter& emitter,
    std::string_view stage,
    ClientError error,
    ProcessTransport& transport
) {
    // Stop first so the diagnostics carry the exit status and all of stderr
    transport.stop();
    if (auto latest = transport.diagnostics(); !latest.empty()) {
        error.diagnostics = std::move(latest);
    }
    MCPROBE_LOG_ERROR("Run aborted during {}: {}", stage, error.message);
    emitter.emit_fatal(stage, error);
    return tl::unexpected(std::move(error));
}

ClientResult<RunSummary> run_checked(const RunConfig& config, ReportEmitter& emitter) {
    if (auto valid = validate(config); !valid) {
        auto error = ClientError::spawn_failed("invalid configuration: " + valid.error().message);
        MCPROBE_LOG_ERROR("Run aborted during config: {}", error.message);
        emitter.emit_fatal("config", error);
        return tl::unexpected(std::move(error));
    }

    RunInfo info;
    info.command = config.target.command;
    info.args = config.target.args;
    info.working_directory = config.target.working_directory;
    info.scenario_count = config.scenarios.size();
    emitter.begin(info);

    // Reaps the child on every return below
    ProcessTransport transport(config.target);

    if (auto started = transport.start(); !started) {
        auto error = ClientError::from_transport(started.error());
        error.code = ClientErrorCode::SpawnFailed;
        return abort_run(emitter, "spawn", std::move(error), transport);
    }

    RpcSessionConfig session_config;
    session_config.cancel_flag = config.cancel_flag;
    RpcSession session(transport, session_config);

    auto handshake = initialize(session, config.client_info, config.handshake_timeout);
    if (!handshake) {
        if (handshake.error().code != ClientErrorCode::Cancelled) {
            return abort_run(emitter, "handshake", handshake.error(), transport);
        }
        RunSummary summary;
        summary.interrupted = true;
        auto result = abort_run(emitter, "interrupted", handshake.error(), transport);
        emitter.end(summary);
        return result;
    }

    RunnerOptions options;
    options.call_timeout = config.call_timeout;
    options.fetch_timeout_seconds = config.fetch_timeout_seconds;
    ScenarioRunner runner(session, config.scenarios, options);

    RunSummary summary;
    auto outcomes = runner.run_all([&](const ScenarioOutcome& outcome) {
        summary.record(outcome);
        emitter.emit(outcome);
    });

    if (!outcomes) {
        MCPROBE_LOG_WARN("Interrupted after {} of {} scenarios", runner.position(), runner.size());
        summary.interrupted = true;
        auto result = abort_run(emitter, "interrupted", outcomes.error(), transport);
        emitter.end(summary);
        return result;
    }

    transport.stop();
    emitter.end(summary);

    MCPROBE_LOG_INFO("Run finished: {} succeeded, {} API errors, {} transport failures ({} requests)",
                     summary.successes, summary.api_errors, summary.transport_failures,
                     session.requests_sent());
    return summary;
}

}  // namespace

ClientResult<RunSummary> run(const RunConfig& config, ReportEmitter& emitter) {
    // The transport is a local of run_checked, so unwinding reaps the child
    // before we get here. The emitter may be what threw; only log.
    try {
        return run_checked(config, emitter);
    } catch (const std::exception& e) {
        MCPROBE_LOG_ERROR("Run aborted by exception: {}", e.what());
        return tl::unexpected(ClientError::internal(std::string("unexpected error: ") + e.what()));
    }
}

}  // namespace mcprobe
