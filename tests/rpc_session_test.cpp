// ─────────────────────────────────────────────────────────────────────────────
// RpcSession Tests
// ─────────────────────────────────────────────────────────────────────────────
// Request/response correlation over a scripted MockLineTransport.

#include <catch2/catch_test_macros.hpp>

#include "mcprobe/client/rpc_session.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_line_transport.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace mcprobe;
using namespace mcprobe::testing;
using namespace std::chrono_literals;

namespace {

Json ok_response(const std::string& id, Json result = Json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Exchange
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("call sends a request and returns the matching response", "[session]") {
    MockLineTransport transport;
    transport.queue_json(ok_response("mcprobe-1", {{"protocolVersion", "2024-11-05"}}));

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value());
    REQUIRE(response->id() == "mcprobe-1");
    REQUIRE(response->result().at("protocolVersion") == "2024-11-05");

    REQUIRE(transport.sent().size() == 1);
    const Json& request = transport.sent()[0];
    REQUIRE(request.at("jsonrpc") == "2.0");
    REQUIRE(request.at("id") == "mcprobe-1");
    REQUIRE(request.at("method") == "initialize");
    REQUIRE(session.requests_sent() == 1);
}

TEST_CASE("Request ids are unique and increasing", "[session]") {
    MockLineTransport transport;
    transport.set_responder([](const Json& request, MockLineTransport& t) {
        t.queue_json(ok_response(request.at("id").get<std::string>()));
    });

    RpcSessionConfig config;
    config.id_prefix = "test";
    RpcSession session(transport, config);
    REQUIRE(session.call("initialize", Json::object(), 1s).has_value());
    session.mark_initialized();
    REQUIRE(session.call("tools/call", Json::object(), 1s).has_value());
    REQUIRE(session.call("tools/call", Json::object(), 1s).has_value());

    REQUIRE(transport.sent()[0].at("id") == "test-1");
    REQUIRE(transport.sent()[1].at("id") == "test-2");
    REQUIRE(transport.sent()[2].at("id") == "test-3");
}

TEST_CASE("Error envelopes are returned, not treated as failures", "[session]") {
    MockLineTransport transport;
    transport.queue_rpc_error("mcprobe-1", -32601, "Method not found");

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value());
    REQUIRE(response->is_error());
    REQUIRE(response->error().code == -32601);
}

TEST_CASE("Methods other than initialize need the handshake first", "[session]") {
    MockLineTransport transport;
    RpcSession session(transport);

    auto response = session.call("tools/call", Json::object(), 1s);
    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::NotInitialized);
    REQUIRE(transport.sent().empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Tolerated Noise
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Blank lines and notifications are skipped", "[session]") {
    ScopedCapture capture(LogLevel::Debug);

    MockLineTransport transport;
    transport.queue_line("");
    transport.queue_line("   ");
    transport.queue_json({{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}});
    transport.queue_json(ok_response("mcprobe-1"));

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value());
    REQUIRE(transport.pending() == 0);
    REQUIRE(capture.logger().contains(LogLevel::Debug, "notifications/message"));
}

TEST_CASE("Log lines on stdout are skipped", "[session]") {
    ScopedCapture capture(LogLevel::Debug);

    MockLineTransport transport;
    transport.queue_line("\x1b[2m2024-05-01T10:00:00Z\x1b[0m \x1b[32m INFO\x1b[0m runner: Starting HTML MCP Reader server");
    transport.queue_line("   Compiling fetcher v0.1.0 (/src/fetcher)");
    transport.queue_line("\x1b[32m INFO\x1b[0m runner: Handling initialize request");
    transport.queue_json(ok_response("mcprobe-1"));

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value());
    REQUIRE(response->id() == "mcprobe-1");
    REQUIRE(capture.logger().contains(LogLevel::Debug, "runner: Handling initialize request"));
}

TEST_CASE("Skipped stdout lines show up in failure diagnostics", "[session]") {
    MockLineTransport transport;
    transport.set_diagnostics("process exited with code 101");

    RpcSessionConfig config;
    config.max_stray_lines = 2;
    RpcSession session(transport, config);

    SECTION("on timeout") {
        transport.queue_line("first noise");
        transport.queue_line("\x1b[31mERROR\x1b[0m second noise");
        transport.queue_line("third noise");

        auto response = session.call("initialize", Json::object(), 100ms);
        REQUIRE(response.error().code == ClientErrorCode::Timeout);

        const std::string& diagnostics = response.error().diagnostics;
        REQUIRE(diagnostics.find("process exited with code 101") == 0);
        REQUIRE(diagnostics.find("ERROR second noise") != std::string::npos);
        REQUIRE(diagnostics.find("third noise") != std::string::npos);
        // Only the newest lines are kept
        REQUIRE(diagnostics.find("first noise") == std::string::npos);
        REQUIRE(diagnostics.find("\x1b") == std::string::npos);
    }

    SECTION("on peer exit") {
        transport.queue_line("thread 'main' panicked at src/main.rs:12");
        transport.close();

        auto response = session.call("initialize", Json::object(), 1s);
        REQUIRE(response.error().code == ClientErrorCode::PeerClosed);
        REQUIRE(response.error().diagnostics.find("panicked") != std::string::npos);
        REQUIRE(session.diagnostics() == response.error().diagnostics);
    }
}

TEST_CASE("Late reply to a timed-out request is discarded", "[session]") {
    ScopedCapture capture(LogLevel::Warn);

    MockLineTransport transport;
    RpcSession session(transport);

    auto first = session.call("initialize", Json::object(), 50ms);
    REQUIRE(first.has_value() == false);
    REQUIRE(first.error().code == ClientErrorCode::Timeout);

    // The answer to the first request finally shows up, then the second one
    transport.queue_json(ok_response("mcprobe-1"));
    transport.queue_json(ok_response("mcprobe-2", {{"second", true}}));

    auto second = session.call("initialize", Json::object(), 1s);
    REQUIRE(second.has_value());
    REQUIRE(second->id() == "mcprobe-2");
    REQUIRE(capture.logger().contains(LogLevel::Warn, "late reply"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Silent peer times out with method and elapsed time", "[session][timeout]") {
    MockLineTransport transport;
    RpcSession session(transport);

    const auto begin = Clock::now();
    auto response = session.call("initialize", Json::object(), 100ms);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::Timeout);
    REQUIRE(response.error().method == "initialize");
    REQUIRE(response.error().elapsed >= 100ms);
    REQUIRE(Clock::now() - begin >= 100ms);
}

TEST_CASE("Unparseable JSON line is a protocol error", "[session]") {
    MockLineTransport transport;
    transport.queue_line(R"({"jsonrpc":"2.0","id":"mcprobe-1","result":{"protocolVersion")");

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::ProtocolError);
    REQUIRE(response.error().message.find("protocolVersion") != std::string::npos);
}

TEST_CASE("Invalid envelope is a protocol error", "[session]") {
    MockLineTransport transport;
    transport.queue_json({{"jsonrpc", "2.0"}, {"id", "mcprobe-1"}});

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::ProtocolError);
}

TEST_CASE("Response for an unknown id is a protocol error", "[session]") {
    MockLineTransport transport;
    transport.queue_json(ok_response("someone-else"));

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::ProtocolError);
    REQUIRE(response.error().message.find("someone-else") != std::string::npos);
}

TEST_CASE("Peer closing mid-call is PeerClosed with diagnostics", "[session]") {
    MockLineTransport transport;
    transport.set_diagnostics("process exited with code 101; stderr: thread 'main' panicked");
    // The request goes out; the peer dies before answering
    transport.set_responder([](const Json&, MockLineTransport& t) { t.close(); });

    RpcSession session(transport);
    session.mark_initialized();

    auto response = session.call("tools/call", Json::object(), 1s);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::PeerClosed);
    REQUIRE(response.error().diagnostics.find("panicked") != std::string::npos);
    REQUIRE(session.peer_closed());
}

TEST_CASE("Calls after the peer closed fail fast", "[session]") {
    MockLineTransport transport;
    transport.queue_error(TransportError::Category::Closed, "Process closed its output (exited with code 1)");

    RpcSession session(transport);
    REQUIRE(session.call("initialize", Json::object(), 1s).error().code == ClientErrorCode::PeerClosed);

    const auto receives = transport.receive_calls();
    const auto begin = Clock::now();
    auto again = session.call("initialize", Json::object(), 5s);

    REQUIRE(again.error().code == ClientErrorCode::PeerClosed);
    REQUIRE(Clock::now() - begin < 1s);
    REQUIRE(transport.receive_calls() == receives);
}

TEST_CASE("Closed transport fails before anything is sent", "[session]") {
    MockLineTransport transport;
    transport.close("Process exited with code 7");

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.error().code == ClientErrorCode::PeerClosed);
    REQUIRE(transport.sent().empty());
    REQUIRE(session.requests_sent() == 0);
    REQUIRE(session.peer_closed());
}

TEST_CASE("Write failure surfaces as a transport error", "[session]") {
    MockLineTransport transport;
    transport.fail_sends(TransportError{TransportError::Category::Io, "Failed to write to process: I/O error"});

    RpcSession session(transport);
    auto response = session.call("initialize", Json::object(), 1s);

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::TransportError);
}

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Raised cancel flag aborts a waiting call within a poll slice", "[session][cancel]") {
    MockLineTransport transport;
    std::atomic<bool> cancel{false};

    RpcSessionConfig config;
    config.cancel_flag = &cancel;
    config.poll_slice = 20ms;
    RpcSession session(transport, config);

    std::thread interrupter([&cancel] {
        std::this_thread::sleep_for(100ms);
        cancel.store(true);
    });

    const auto begin = Clock::now();
    auto response = session.call("initialize", Json::object(), 10s);
    const auto took = Clock::now() - begin;
    interrupter.join();

    REQUIRE(response.has_value() == false);
    REQUIRE(response.error().code == ClientErrorCode::Cancelled);
    REQUIRE(took < 2s);
}

TEST_CASE("Cancel flag raised before the call sends nothing", "[session][cancel]") {
    MockLineTransport transport;
    std::atomic<bool> cancel{true};

    RpcSessionConfig config;
    config.cancel_flag = &cancel;
    RpcSession session(transport, config);

    auto response = session.call("initialize", Json::object(), 1s);
    REQUIRE(response.error().code == ClientErrorCode::Cancelled);
    REQUIRE(transport.sent().empty());
}
