#include "mcprobe/client/handshake.hpp"
#include "mcprobe/log/logger.hpp"

#include <format>

namespace mcprobe {

ClientResult<InitializeResult> initialize(
    RpcSession& session,
    const Implementation& client_info,
    std::chrono::milliseconds timeout
) {
    if (session.is_initialized()) {
        return tl::unexpected(ClientError::protocol_error(
            "initialize must run exactly once per session", methods::kInitialize));
    }

    InitializeParams params;
    params.client_info = client_info;

    auto response = session.call(methods::kInitialize, params.to_json(), timeout);
    if (!response) {
        if (response.error().code == ClientErrorCode::Cancelled) {
            return tl::unexpected(response.error());
        }
        ClientError error = response.error();
        error.message = std::format("{}: {}", to_string(error.code), error.message);
        error.code = ClientErrorCode::HandshakeFailed;
        return tl::unexpected(std::move(error));
    }

    if (response->is_error()) {
        const JsonRpcError rpc = response->error();
        ClientError error = ClientError::handshake_failed(
            std::format("server rejected initialize: [{}] {}", rpc.code, rpc.message));
        error.rpc_error = rpc;
        return tl::unexpected(std::move(error));
    }

    auto parsed = InitializeResult::from_json(response->result());
    if (!parsed) {
        return tl::unexpected(ClientError::handshake_failed(
            "malformed initialize result: " + parsed.error().message));
    }

    session.mark_initialized();

    MCPROBE_LOG_INFO("Handshake complete: server '{}' {} (protocol {})",
                     parsed->server_info.name,
                     parsed->server_info.version,
                     parsed->protocol_version.empty() ? "unspecified" : parsed->protocol_version);
    if (!parsed->protocol_version.empty() && parsed->protocol_version != MCP_PROTOCOL_VERSION) {
        MCPROBE_LOG_WARN("Server answered with protocol {}, driver speaks {}",
                         parsed->protocol_version, MCP_PROTOCOL_VERSION);
    }

    return std::move(*parsed);
}

}  // namespace mcprobe
