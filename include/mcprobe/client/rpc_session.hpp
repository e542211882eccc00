#pragma once

#include "mcprobe/client/client_error.hpp"
#include "mcprobe/protocol/json_rpc.hpp"
#include "mcprobe/transport/line_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace mcprobe {

// ═══════════════════════════════════════════════════════════════════════════
// RPC Session Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct RpcSessionConfig {
    /// Request ids are "<id_prefix>-<n>", n counting from 1
    std::string id_prefix = "mcprobe";

    /// Longest single blocking wait; bounds how late a cancellation is noticed
    std::chrono::milliseconds poll_slice{100};

    /// Set asynchronously (e.g. from a signal handler) to abandon the current call
    const std::atomic<bool>* cancel_flag = nullptr;

    /// How many timed-out request ids to remember for discarding late replies
    std::size_t max_abandoned_ids = 32;

    /// How many skipped non-JSON stdout lines to keep for diagnostics
    std::size_t max_stray_lines = 8;
};

// ═══════════════════════════════════════════════════════════════════════════
// RPC Session
// ═══════════════════════════════════════════════════════════════════════════
// Strictly one request in flight: call() writes a request and reads lines
// until the matching response, the timeout, or the end of the stream.
//
// Usage:
//   RpcSession session(transport);
//   auto init = initialize(session, {"mcprobe", "0.1.0"}, 10s);
//   auto response = session.call("tools/call", params, 30s);
//
// A reply that arrives after its request timed out is discarded when it
// shows up during a later call. Any other id mismatch is a protocol error.
//
// Servers commonly log to stdout (tracing banners, "Handling ... request").
// A line whose first non-blank character is not '{' is therefore not a
// response attempt: it is skipped and remembered for diagnostics. A line
// that starts with '{' and fails to parse is a protocol error.

class RpcSession {
public:
    explicit RpcSession(ILineTransport& transport, RpcSessionConfig config = {});

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    /// Send `method` with `params` and wait up to `timeout` for its response
    [[nodiscard]] ClientResult<JsonRpcResponse> call(
        const std::string& method,
        const Json& params,
        std::chrono::milliseconds timeout
    );

    /// Set by the handshake stage once initialize succeeded
    void mark_initialized() noexcept { initialized_ = true; }
    [[nodiscard]] bool is_initialized() const noexcept { return initialized_; }

    /// True once the peer closed its output; later calls fail fast
    [[nodiscard]] bool peer_closed() const noexcept { return peer_closed_; }

    [[nodiscard]] std::uint64_t requests_sent() const noexcept { return requests_sent_; }

    /// Transport diagnostics plus the newest skipped stdout lines
    [[nodiscard]] std::string diagnostics();

private:
    [[nodiscard]] std::string next_request_id();
    [[nodiscard]] bool cancel_requested() const noexcept;
    void abandon(const std::string& id);
    [[nodiscard]] bool take_abandoned(const std::string& id);
    void remember_stray(const std::string& line);
    [[nodiscard]] ClientError close_session(const TransportError& err, const std::string& method);

    ILineTransport& transport_;
    RpcSessionConfig config_;
    std::uint64_t next_id_{0};
    std::uint64_t requests_sent_{0};
    bool initialized_{false};
    bool peer_closed_{false};
    std::string closed_reason_;
    std::deque<std::string> abandoned_ids_;
    std::deque<std::string> stray_lines_;
};

}  // namespace mcprobe
