#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcprobe {

using Json = nlohmann::json;

/// The protocol tag every envelope carries in its "jsonrpc" member
inline constexpr std::string_view kJsonRpcVersion{"2.0"};

struct JsonError {
    enum class Code {
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidPayload,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

/// Request ids are compared in string form; integer ids from the peer are
/// rendered in decimal.
[[nodiscard]] JsonResult<std::string> id_to_string(const Json& id_node);

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, std::string id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::string& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;

private:
    std::string method_;
    std::string id_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    /// Lenient: missing code/message become 0 / ""
    static JsonRpcError from_json(const Json& payload);
};

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse - { id, result } | { id, error }
// ─────────────────────────────────────────────────────────────────────────────
// A member whose value is null counts as absent, so a peer that always
// serializes both members (one of them null) is still well formed. Both
// present or neither present is rejected.

class JsonRpcResponse {
public:
    [[nodiscard]] static JsonResult<JsonRpcResponse> from_json(const Json& payload);

    [[nodiscard]] static JsonRpcResponse success(std::string id, Json result);
    [[nodiscard]] static JsonRpcResponse failure(std::string id, Json error);

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] bool is_error() const noexcept { return is_error_; }

    /// Result payload; only meaningful when !is_error()
    [[nodiscard]] const Json& result() const noexcept { return payload_; }

    /// Raw error payload, verbatim; only meaningful when is_error()
    [[nodiscard]] const Json& error_payload() const noexcept { return payload_; }
    [[nodiscard]] JsonRpcError error() const { return JsonRpcError::from_json(payload_); }

    [[nodiscard]] Json to_json() const;

private:
    JsonRpcResponse(std::string id, bool is_error, Json payload);

    std::string id_;
    bool is_error_{false};
    Json payload_;
};

/// A peer-initiated notification: has "method", has no "id"
[[nodiscard]] bool is_notification(const Json& payload);

}  // namespace mcprobe
