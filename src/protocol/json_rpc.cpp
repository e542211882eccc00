#include "mcprobe/protocol/json_rpc.hpp"

namespace mcprobe {
namespace {

bool has_non_null(const Json& payload, const char* key) {
    const auto it = payload.find(key);
    return (it != payload.end()) && (it->is_null() == false);
}

}  // namespace

JsonResult<std::string> id_to_string(const Json& id_node) {
    if (id_node.is_string() == true) {
        return id_node.get<std::string>();
    }
    if (id_node.is_number_integer() == true) {
        return std::to_string(id_node.get<std::int64_t>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::string id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const std::string& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);
    payload["id"] = id_;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonRpcError JsonRpcError::from_json(const Json& payload) {
    JsonRpcError err;
    if (payload.is_object() == false) {
        // Some servers answer with a bare string
        if (payload.is_string()) {
            err.message = payload.get<std::string>();
        } else {
            err.message = payload.dump();
        }
        return err;
    }

    const auto code_it = payload.find("code");
    if (code_it != payload.end() && code_it->is_number_integer()) {
        err.code = code_it->get<std::int64_t>();
    }
    const auto message_it = payload.find("message");
    if (message_it != payload.end() && message_it->is_string()) {
        err.message = message_it->get<std::string>();
    }
    if (payload.contains("data")) {
        err.data = payload.at("data");
    }
    return err;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(std::string id, bool is_error, Json payload)
    : id_(std::move(id)),
      is_error_(is_error),
      payload_(std::move(payload)) {}

JsonRpcResponse JsonRpcResponse::success(std::string id, Json result) {
    return JsonRpcResponse(std::move(id), false, std::move(result));
}

JsonRpcResponse JsonRpcResponse::failure(std::string id, Json error) {
    return JsonRpcResponse(std::move(id), true, std::move(error));
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::NotAnObject,
            "response must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    if ((version_node.is_string() == false) || (version_node.get<std::string>() != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }

    if (has_non_null(payload, "id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = id_to_string(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    const bool has_result = has_non_null(payload, "result");
    const bool has_error = has_non_null(payload, "error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidPayload,
            has_result ? "response carries both result and error"
                       : "response carries neither result nor error"});
    }

    if (has_error == true) {
        return JsonRpcResponse::failure(std::move(*parsed_id), payload.at("error"));
    }
    return JsonRpcResponse::success(std::move(*parsed_id), payload.at("result"));
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = std::string(kJsonRpcVersion);
    payload["id"] = id_;
    payload[is_error_ ? "error" : "result"] = payload_;
    return payload;
}

bool is_notification(const Json& payload) {
    return payload.is_object() && payload.contains("method") && !payload.contains("id");
}

}  // namespace mcprobe
