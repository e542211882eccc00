#ifndef MCPROBE_PROTOCOL_MCP_TYPES_HPP
#define MCPROBE_PROTOCOL_MCP_TYPES_HPP

#include "mcprobe/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcprobe {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Method Names
// ═══════════════════════════════════════════════════════════════════════════

namespace methods {
inline constexpr const char* kInitialize = "initialize";
inline constexpr const char* kToolsCall = "tools/call";
}  // namespace methods

inline constexpr const char* kFetchToolName = "fetch_web_content";

// ═══════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        Implementation impl;
        if (j.is_object()) {
            const auto name = j.find("name");
            if (name != j.end() && name->is_string()) {
                impl.name = name->get<std::string>();
            }
            const auto version = j.find("version");
            if (version != j.end() && version->is_string()) {
                impl.version = version->get<std::string>();
            }
        }
        return impl;
    }
};

struct InitializeParams {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    Json capabilities = Json::object();
    Implementation client_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    Json capabilities = Json::object();
    Implementation server_info;

    /// The result must be an object; every member inside it is optional
    static JsonResult<InitializeResult> from_json(const Json& j) {
        if (j.is_object() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidPayload,
                "initialize result must be an object"});
        }

        InitializeResult result;
        const auto version = j.find("protocolVersion");
        if (version != j.end() && version->is_string()) {
            result.protocol_version = version->get<std::string>();
        }
        const auto caps = j.find("capabilities");
        if (caps != j.end() && caps->is_object()) {
            result.capabilities = *caps;
        }
        const auto info = j.find("serverInfo");
        if (info != j.end()) {
            result.server_info = Implementation::from_json(*info);
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// fetch_web_content
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::int64_t kMinFetchTimeoutSeconds = 1;
inline constexpr std::int64_t kMaxFetchTimeoutSeconds = 300;

struct FetchArguments {
    std::string url;
    std::int64_t timeout_seconds{10};

    [[nodiscard]] Json to_json() const {
        return {{"url", url}, {"timeout_seconds", timeout_seconds}};
    }
};

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

/// Retrieval strategy the server reports in result.content.metadata.fetch_method
enum class FetchMethod {
    Static,   // Plain HTTP fetch of the HTML
    Browser,  // Script-rendering (headless browser) fetch
    Other     // Present but unrecognized; the raw text is kept alongside
};

[[nodiscard]] constexpr std::string_view to_string(FetchMethod method) noexcept {
    switch (method) {
        case FetchMethod::Static:  return "static";
        case FetchMethod::Browser: return "browser";
        case FetchMethod::Other:   return "other";
    }
    return "other";
}

/// Case-insensitive: "Static", "static" and "STATIC" all denote the static path
[[nodiscard]] FetchMethod parse_fetch_method(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// FetchedContent - the observed part of a successful tool result
// ─────────────────────────────────────────────────────────────────────────────
// Absent or null metadata members stay std::nullopt. A member that is present
// with the wrong JSON type, or a result without a `content` object, is a
// malformed response.

struct FetchedContent {
    std::size_t text_length{0};
    std::optional<std::string> title;
    std::optional<std::string> url;
    std::optional<std::string> fetch_method_raw;
    std::optional<FetchMethod> fetch_method;
    std::optional<bool> javascript_detected;
    std::optional<std::int64_t> status_code;
    std::optional<std::string> content_type;

    static JsonResult<FetchedContent> from_result(const Json& result);
};

}  // namespace mcprobe

#endif  // MCPROBE_PROTOCOL_MCP_TYPES_HPP
