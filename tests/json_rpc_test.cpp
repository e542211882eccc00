#include <catch2/catch_test_macros.hpp>

#include "mcprobe/protocol/json_rpc.hpp"

using namespace mcprobe;

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest serializes envelope with params", "[json_rpc]") {
    const JsonRpcRequest request("tools/call", "mcprobe-2", Json{{"name", "fetch_web_content"}});
    const Json payload = request.to_json();

    REQUIRE(payload.at("jsonrpc") == "2.0");
    REQUIRE(payload.at("id") == "mcprobe-2");
    REQUIRE(payload.at("method") == "tools/call");
    REQUIRE(payload.at("params").at("name") == "fetch_web_content");
}

TEST_CASE("JsonRpcRequest omits absent params", "[json_rpc]") {
    const JsonRpcRequest request("ping", "7");
    REQUIRE(request.to_json().contains("params") == false);
}

TEST_CASE("Serialized request fits on one line", "[json_rpc]") {
    const JsonRpcRequest request("tools/call", "x", Json{{"url", "https://a.test/?q=line1\nline2"}});
    REQUIRE(request.to_json().dump().find('\n') == std::string::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// Ids
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("id_to_string accepts strings and integers", "[json_rpc]") {
    REQUIRE(id_to_string(Json("init")).value() == "init");
    REQUIRE(id_to_string(Json(42)).value() == "42");
    REQUIRE(id_to_string(Json(-1)).value() == "-1");

    REQUIRE(id_to_string(Json(1.5)).has_value() == false);
    REQUIRE(id_to_string(Json::array()).error().code == JsonError::Code::InvalidId);
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Response with result parses", "[json_rpc]") {
    const Json payload = {{"jsonrpc", "2.0"}, {"id", "init"}, {"result", {{"ok", true}}}};
    auto response = JsonRpcResponse::from_json(payload);

    REQUIRE(response.has_value());
    REQUIRE(response->id() == "init");
    REQUIRE(response->is_error() == false);
    REQUIRE(response->result().at("ok") == true);
}

TEST_CASE("Response with error keeps payload verbatim", "[json_rpc]") {
    const Json error = {{"code", -32603}, {"message", "Fetch failed"}, {"data", {{"retry", false}}}};
    const Json payload = {{"jsonrpc", "2.0"}, {"id", 3}, {"error", error}};
    auto response = JsonRpcResponse::from_json(payload);

    REQUIRE(response.has_value());
    REQUIRE(response->id() == "3");
    REQUIRE(response->is_error());
    REQUIRE(response->error_payload() == error);
    REQUIRE(response->error().code == -32603);
    REQUIRE(response->error().message == "Fetch failed");
    REQUIRE(response->error().data.has_value());
}

TEST_CASE("Null result or error member counts as absent", "[json_rpc]") {
    SECTION("error null, result present") {
        const Json payload = {{"jsonrpc", "2.0"}, {"id", "a"}, {"result", {{"x", 1}}}, {"error", nullptr}};
        auto response = JsonRpcResponse::from_json(payload);
        REQUIRE(response.has_value());
        REQUIRE(response->is_error() == false);
    }

    SECTION("result null, error present") {
        const Json payload = {{"jsonrpc", "2.0"}, {"id", "a"}, {"result", nullptr},
                              {"error", {{"code", 1}, {"message", "m"}}}};
        auto response = JsonRpcResponse::from_json(payload);
        REQUIRE(response.has_value());
        REQUIRE(response->is_error());
    }
}

TEST_CASE("Malformed envelopes are rejected", "[json_rpc]") {
    SECTION("not an object") {
        REQUIRE(JsonRpcResponse::from_json(Json::array()).error().code == JsonError::Code::NotAnObject);
    }

    SECTION("missing version") {
        const Json payload = {{"id", "a"}, {"result", 1}};
        REQUIRE(JsonRpcResponse::from_json(payload).error().code == JsonError::Code::MissingField);
    }

    SECTION("wrong version") {
        const Json payload = {{"jsonrpc", "1.0"}, {"id", "a"}, {"result", 1}};
        REQUIRE(JsonRpcResponse::from_json(payload).error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("null id") {
        const Json payload = {{"jsonrpc", "2.0"}, {"id", nullptr}, {"result", 1}};
        REQUIRE(JsonRpcResponse::from_json(payload).error().code == JsonError::Code::InvalidId);
    }

    SECTION("both result and error") {
        const Json payload = {{"jsonrpc", "2.0"}, {"id", "a"}, {"result", 1},
                              {"error", {{"code", 1}, {"message", "m"}}}};
        auto response = JsonRpcResponse::from_json(payload);
        REQUIRE(response.has_value() == false);
        REQUIRE(response.error().message == "response carries both result and error");
    }

    SECTION("neither result nor error") {
        const Json payload = {{"jsonrpc", "2.0"}, {"id", "a"}, {"result", nullptr}};
        auto response = JsonRpcResponse::from_json(payload);
        REQUIRE(response.has_value() == false);
        REQUIRE(response.error().message == "response carries neither result nor error");
    }
}

TEST_CASE("JsonRpcError tolerates odd payloads", "[json_rpc]") {
    REQUIRE(JsonRpcError::from_json(Json("boom")).message == "boom");

    const auto err = JsonRpcError::from_json(Json{{"message", "no code"}});
    REQUIRE(err.code == 0);
    REQUIRE(err.message == "no code");
}

TEST_CASE("is_notification recognizes id-less messages", "[json_rpc]") {
    REQUIRE(is_notification(Json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}));
    REQUIRE(is_notification(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "ping"}}) == false);
    REQUIRE(is_notification(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}}) == false);
}
