#pragma once

#include "mcprobe/transport.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace mcprobe {

// ─────────────────────────────────────────────────────────────────────────────
// ILineTransport - Newline-delimited message channel
// ─────────────────────────────────────────────────────────────────────────────
// One JSON document per line in each direction. Implementations must never
// emit an embedded newline inside a document and must push every byte of a
// line to the peer before send_line() returns, because the peer reads line by
// line and blocks until the terminator arrives.
//
// The transport has no timeout policy of its own. Callers pass an absolute
// deadline to receive_line(); std::nullopt blocks until a line or EOF.

using Clock = std::chrono::steady_clock;

class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    /// Serialize `message` on a single line, append '\n' and write it out
    [[nodiscard]] virtual TransportResult<void> send_line(const Json& message) = 0;

    /// Read the next line without its terminator
    [[nodiscard]] virtual TransportResult<std::string> receive_line(
        std::optional<Clock::time_point> deadline) = 0;

    /// Whether the channel can still carry traffic
    [[nodiscard]] virtual bool is_open() const = 0;

    /// Free-form text describing the peer's state (captured stderr, exit status).
    /// Only used to enrich failure reports.
    [[nodiscard]] virtual std::string diagnostics() { return {}; }
};

}  // namespace mcprobe
