#pragma once

#include "mcprobe/client/client_error.hpp"
#include "mcprobe/probe/config.hpp"
#include "mcprobe/probe/report.hpp"

namespace mcprobe {

/// Run every configured scenario against a freshly spawned target.
///
/// Spawns `config.target`, performs the handshake, runs the scenarios in
/// order and streams each outcome to `emitter`. Returns the summary once all
/// scenarios ran, whatever their classification.
///
/// Returns SpawnFailed or HandshakeFailed when the run could not start
/// (SpawnFailed also covers an invalid `config`), and Cancelled when
/// `config.cancel_flag` was raised. The failing stage is also reported
/// through `emitter`. An exception escaping the run, including one thrown by
/// `emitter`, becomes an Internal error that is only logged. The child
/// process is terminated and reaped before this function returns on every
/// path.
[[nodiscard]] ClientResult<RunSummary> run(const RunConfig& config, ReportEmitter& emitter);

}  // namespace mcprobe
