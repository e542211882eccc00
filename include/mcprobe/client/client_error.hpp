#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Error taxonomy for everything above the transport: session calls, the
// handshake and the run entry point.

#include "mcprobe/protocol/json_rpc.hpp"
#include "mcprobe/transport.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcprobe {

enum class ClientErrorCode {
    SpawnFailed,      ///< Target process could not be launched (fatal)
    NotInitialized,   ///< Request attempted before the handshake completed
    HandshakeFailed,  ///< initialize answered with an error, garbage, or not at all (fatal)
    TransportError,   ///< Read/write failure on an open stream
    ProtocolError,    ///< Malformed line, bad envelope, or unmatched response id
    Timeout,          ///< No matching response before the deadline
    PeerClosed,       ///< Peer closed its output or exited mid-exchange
    Cancelled,        ///< Operator interrupt
    Internal          ///< Unexpected exception inside the driver (fatal)
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    switch (code) {
        case ClientErrorCode::SpawnFailed:     return "SpawnFailed";
        case ClientErrorCode::NotInitialized:  return "NotInitialized";
        case ClientErrorCode::HandshakeFailed: return "HandshakeFailed";
        case ClientErrorCode::TransportError:  return "TransportError";
        case ClientErrorCode::ProtocolError:   return "ProtocolError";
        case ClientErrorCode::Timeout:         return "Timeout";
        case ClientErrorCode::PeerClosed:      return "PeerClosed";
        case ClientErrorCode::Cancelled:       return "Cancelled";
        case ClientErrorCode::Internal:        return "Internal";
    }
    return "Unknown";
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::string method;                          ///< Request the error belongs to, if any
    std::chrono::milliseconds elapsed{0};        ///< Time spent waiting (timeouts)
    std::optional<JsonRpcError> rpc_error;       ///< Server error payload (handshake rejections)
    std::string diagnostics;                     ///< Peer stderr / exit status, if known

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static ClientError spawn_failed(std::string msg) {
        return {ClientErrorCode::SpawnFailed, std::move(msg), {}, {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError not_initialized(std::string method) {
        std::string msg = "'" + method + "' sent before the initialize handshake completed";
        return {ClientErrorCode::NotInitialized, std::move(msg), std::move(method), {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError handshake_failed(std::string msg) {
        return {ClientErrorCode::HandshakeFailed, std::move(msg), "initialize", {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg, std::string method = {}) {
        return {ClientErrorCode::ProtocolError, std::move(msg), std::move(method), {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError timeout(std::string method, std::chrono::milliseconds elapsed) {
        std::string msg = "no response to '" + method + "' within " +
                          std::to_string(elapsed.count()) + " ms";
        return {ClientErrorCode::Timeout, std::move(msg), std::move(method), elapsed, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError peer_closed(std::string msg, std::string method = {}) {
        return {ClientErrorCode::PeerClosed, std::move(msg), std::move(method), {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError cancelled(std::string method = {}) {
        return {ClientErrorCode::Cancelled, "Interrupted by operator", std::move(method), {}, std::nullopt, {}};
    }

    [[nodiscard]] static ClientError internal(std::string msg) {
        return {ClientErrorCode::Internal, std::move(msg), {}, {}, std::nullopt, {}};
    }

    /// Map a transport failure onto the client taxonomy
    [[nodiscard]] static ClientError from_transport(const TransportError& err, std::string method = {}) {
        ClientErrorCode code = ClientErrorCode::TransportError;
        switch (err.category) {
            case TransportError::Category::Spawn:    code = ClientErrorCode::SpawnFailed; break;
            case TransportError::Category::Io:       code = ClientErrorCode::TransportError; break;
            case TransportError::Category::Timeout:  code = ClientErrorCode::Timeout; break;
            case TransportError::Category::Closed:   code = ClientErrorCode::PeerClosed; break;
            case TransportError::Category::Protocol: code = ClientErrorCode::ProtocolError; break;
        }
        return {code, err.message, std::move(method), {}, std::nullopt, {}};
    }
};

/// Result type for client operations
template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace mcprobe
