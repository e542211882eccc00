#include <catch2/catch_test_macros.hpp>

#include "mcprobe/protocol/mcp_types.hpp"

using namespace mcprobe;

namespace {

Json fetch_result(Json metadata) {
    return {
        {"content", {
            {"text_content", "Herman Melville - Moby-Dick"},
            {"title", "Moby-Dick"},
            {"url", "https://httpbin.org/html"},
            {"metadata", std::move(metadata)}
        }}
    };
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("InitializeParams serializes the handshake request", "[mcp][types]") {
    InitializeParams params;
    params.client_info = {"test-client", "1.0.0"};

    const Json j = params.to_json();
    REQUIRE(j.at("protocolVersion") == "2024-11-05");
    REQUIRE(j.at("capabilities").is_object());
    REQUIRE(j.at("capabilities").empty());
    REQUIRE(j.at("clientInfo").at("name") == "test-client");
    REQUIRE(j.at("clientInfo").at("version") == "1.0.0");
}

TEST_CASE("InitializeResult parses server identity", "[mcp][types]") {
    const Json j = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", {{"tools", Json::object()}}},
        {"serverInfo", {{"name", "rust-fetch"}, {"version", "0.3.1"}}}
    };

    auto result = InitializeResult::from_json(j);
    REQUIRE(result.has_value());
    REQUIRE(result->protocol_version == "2024-11-05");
    REQUIRE(result->server_info.name == "rust-fetch");
    REQUIRE(result->server_info.version == "0.3.1");
    REQUIRE(result->capabilities.contains("tools"));
}

TEST_CASE("InitializeResult tolerates sparse results but not non-objects", "[mcp][types]") {
    auto sparse = InitializeResult::from_json(Json::object());
    REQUIRE(sparse.has_value());
    REQUIRE(sparse->protocol_version.empty());
    REQUIRE(sparse->server_info.name.empty());

    REQUIRE(InitializeResult::from_json(Json("ok")).has_value() == false);
}

// ═══════════════════════════════════════════════════════════════════════════
// fetch_web_content
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CallToolParams carries fetch arguments", "[mcp][types]") {
    FetchArguments args;
    args.url = "https://httpbin.org/html";

    CallToolParams params;
    params.name = kFetchToolName;
    params.arguments = args.to_json();

    const Json j = params.to_json();
    REQUIRE(j.at("name") == "fetch_web_content");
    REQUIRE(j.at("arguments").at("url") == "https://httpbin.org/html");
    REQUIRE(j.at("arguments").at("timeout_seconds") == 10);
}

TEST_CASE("parse_fetch_method is case-insensitive", "[mcp][types]") {
    REQUIRE(parse_fetch_method("Static") == FetchMethod::Static);
    REQUIRE(parse_fetch_method("static") == FetchMethod::Static);
    REQUIRE(parse_fetch_method("BROWSER") == FetchMethod::Browser);
    REQUIRE(parse_fetch_method("Headless") == FetchMethod::Other);
    REQUIRE(parse_fetch_method("") == FetchMethod::Other);
}

TEST_CASE("FetchedContent extracts observed fields", "[mcp][types]") {
    auto content = FetchedContent::from_result(fetch_result({
        {"fetch_method", "Static"},
        {"javascript_detected", false},
        {"status_code", 200},
        {"content_type", "text/html; charset=utf-8"}
    }));

    REQUIRE(content.has_value());
    REQUIRE(content->text_length == std::string("Herman Melville - Moby-Dick").size());
    REQUIRE(content->title == "Moby-Dick");
    REQUIRE(content->url == "https://httpbin.org/html");
    REQUIRE(content->fetch_method == FetchMethod::Static);
    REQUIRE(content->fetch_method_raw == "Static");
    REQUIRE(content->javascript_detected == false);
    REQUIRE(content->status_code == 200);
    REQUIRE(content->content_type == "text/html; charset=utf-8");
}

TEST_CASE("Unrecognized fetch method is kept verbatim", "[mcp][types]") {
    auto content = FetchedContent::from_result(fetch_result({{"fetch_method", "Cached"}}));
    REQUIRE(content.has_value());
    REQUIRE(content->fetch_method == FetchMethod::Other);
    REQUIRE(content->fetch_method_raw == "Cached");
}

TEST_CASE("Missing or null metadata is reported as unknown", "[mcp][types]") {
    SECTION("no metadata object") {
        Json result = fetch_result(nullptr);
        result["content"].erase("metadata");
        auto content = FetchedContent::from_result(result);
        REQUIRE(content.has_value());
        REQUIRE(content->fetch_method.has_value() == false);
        REQUIRE(content->javascript_detected.has_value() == false);
    }

    SECTION("null metadata object") {
        auto content = FetchedContent::from_result(fetch_result(nullptr));
        REQUIRE(content.has_value());
        REQUIRE(content->fetch_method.has_value() == false);
    }

    SECTION("null members") {
        auto content = FetchedContent::from_result(fetch_result({
            {"fetch_method", nullptr},
            {"javascript_detected", nullptr}
        }));
        REQUIRE(content.has_value());
        REQUIRE(content->fetch_method.has_value() == false);
        REQUIRE(content->javascript_detected.has_value() == false);
    }

    SECTION("no text or title") {
        auto content = FetchedContent::from_result(Json{{"content", Json::object()}});
        REQUIRE(content.has_value());
        REQUIRE(content->text_length == 0);
        REQUIRE(content->title.has_value() == false);
    }
}

TEST_CASE("Wrongly typed fields are malformed", "[mcp][types]") {
    SECTION("content missing") {
        auto content = FetchedContent::from_result(Json{{"text", "x"}});
        REQUIRE(content.has_value() == false);
        REQUIRE(content.error().message == "result.content must be an object");
    }

    SECTION("content is a string") {
        REQUIRE(FetchedContent::from_result(Json{{"content", "x"}}).has_value() == false);
    }

    SECTION("result is not an object") {
        REQUIRE(FetchedContent::from_result(Json::array()).has_value() == false);
    }

    SECTION("fetch_method is a number") {
        auto content = FetchedContent::from_result(fetch_result({{"fetch_method", 1}}));
        REQUIRE(content.has_value() == false);
        REQUIRE(content.error().message == "metadata.fetch_method must be a string");
    }

    SECTION("javascript_detected is a string") {
        auto content = FetchedContent::from_result(fetch_result({{"javascript_detected", "yes"}}));
        REQUIRE(content.has_value() == false);
        REQUIRE(content.error().code == JsonError::Code::InvalidPayload);
    }

    SECTION("metadata is an array") {
        REQUIRE(FetchedContent::from_result(fetch_result(Json::array())).has_value() == false);
    }
}
