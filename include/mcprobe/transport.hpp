#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by the line transport and everything layered on it.
//
// For the child-process transport, use: #include "mcprobe/transport/process_transport.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcprobe {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,     // Child process could not be launched
        Io,        // Read/write failure on an open stream
        Timeout,   // Deadline passed before a full line arrived
        Closed,    // Peer closed its end or exited
        Protocol   // Framing violation (line too long, not running, ...)
    };

    Category category{};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:    return "Spawn";
        case TransportError::Category::Io:       return "Io";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Closed:   return "Closed";
        case TransportError::Category::Protocol: return "Protocol";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcprobe
