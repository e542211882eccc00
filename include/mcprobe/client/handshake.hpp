#pragma once

#include "mcprobe/client/client_error.hpp"
#include "mcprobe/client/rpc_session.hpp"
#include "mcprobe/protocol/mcp_types.hpp"

#include <chrono>

namespace mcprobe {

/// Perform the MCP initialize exchange on a fresh session.
///
/// Sends `initialize` with the supported protocol version, empty client
/// capabilities and `client_info`. Any failure (error envelope, malformed
/// result, timeout, closed stream) comes back as HandshakeFailed, except an
/// operator interrupt, which stays Cancelled. On success the session accepts
/// other methods from then on.
[[nodiscard]] ClientResult<InitializeResult> initialize(
    RpcSession& session,
    const Implementation& client_info,
    std::chrono::milliseconds timeout
);

}  // namespace mcprobe
