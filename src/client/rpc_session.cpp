#include "mcprobe/client/rpc_session.hpp"
#include "mcprobe/log/logger.hpp"
#include "mcprobe/protocol/mcp_types.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace mcprobe {

namespace {

constexpr std::size_t kExcerptLength = 200;

std::string excerpt(const std::string& line) {
    if (line.size() <= kExcerptLength) {
        return line;
    }
    return line.substr(0, kExcerptLength) + "...";
}

bool is_blank_char(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), is_blank_char);
}

/// Only a line opening with '{' can be a response envelope
bool looks_like_json_object(const std::string& line) {
    const auto first = std::find_if_not(line.begin(), line.end(), is_blank_char);
    return first != line.end() && *first == '{';
}

/// Drop ANSI colour sequences (ESC '[' ... letter) so log lines read cleanly
std::string strip_ansi(const std::string& line) {
    std::string text;
    text.reserve(line.size());
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            i += 2;
            while (i < line.size() && std::isalpha(static_cast<unsigned char>(line[i])) == 0) {
                ++i;
            }
            continue;
        }
        text += line[i];
    }
    return text;
}

}  // namespace

RpcSession::RpcSession(ILineTransport& transport, RpcSessionConfig config)
    : transport_(transport)
    , config_(std::move(config))
{}

std::string RpcSession::next_request_id() {
    return config_.id_prefix + "-" + std::to_string(++next_id_);
}

bool RpcSession::cancel_requested() const noexcept {
    return (config_.cancel_flag != nullptr) && config_.cancel_flag->load();
}

void RpcSession::abandon(const std::string& id) {
    abandoned_ids_.push_back(id);
    while (abandoned_ids_.size() > config_.max_abandoned_ids) {
        abandoned_ids_.pop_front();
    }
}

bool RpcSession::take_abandoned(const std::string& id) {
    const auto it = std::find(abandoned_ids_.begin(), abandoned_ids_.end(), id);
    if (it == abandoned_ids_.end()) {
        return false;
    }
    abandoned_ids_.erase(it);
    return true;
}

void RpcSession::remember_stray(const std::string& line) {
    stray_lines_.push_back(excerpt(strip_ansi(line)));
    while (stray_lines_.size() > config_.max_stray_lines) {
        stray_lines_.pop_front();
    }
}

std::string RpcSession::diagnostics() {
    std::string text = transport_.diagnostics();
    if (stray_lines_.empty()) {
        return text;
    }
    if (!text.empty()) {
        text += "\n";
    }
    text += "stdout:";
    for (const auto& line : stray_lines_) {
        text += "\n" + line;
    }
    return text;
}

ClientError RpcSession::close_session(const TransportError& err, const std::string& method) {
    peer_closed_ = true;
    closed_reason_ = err.message;
    ClientError error = ClientError::from_transport(err, method);
    error.diagnostics = diagnostics();
    return error;
}

ClientResult<JsonRpcResponse> RpcSession::call(
    const std::string& method,
    const Json& params,
    std::chrono::milliseconds timeout
) {
    if (peer_closed_) {
        ClientError error = ClientError::peer_closed("Peer already closed: " + closed_reason_, method);
        error.diagnostics = diagnostics();
        return tl::unexpected(std::move(error));
    }
    if (!transport_.is_open()) {
        return tl::unexpected(close_session(
            TransportError{TransportError::Category::Closed, "Peer closed its output"}, method));
    }
    if (!initialized_ && method != methods::kInitialize) {
        return tl::unexpected(ClientError::not_initialized(method));
    }
    if (cancel_requested()) {
        return tl::unexpected(ClientError::cancelled(method));
    }

    const JsonRpcRequest request(method, next_request_id(), params);
    const std::string& id = request.id();
    const auto start = Clock::now();
    const auto deadline = start + timeout;

    auto sent = transport_.send_line(request.to_json());
    if (!sent) {
        if (sent.error().category == TransportError::Category::Closed) {
            return tl::unexpected(close_session(sent.error(), method));
        }
        return tl::unexpected(ClientError::from_transport(sent.error(), method));
    }
    ++requests_sent_;
    MCPROBE_LOG_DEBUG("Sent {} (id {})", method, id);

    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    };

    while (true) {
        if (cancel_requested()) {
            abandon(id);
            return tl::unexpected(ClientError::cancelled(method));
        }

        auto wait_until = deadline;
        if (config_.cancel_flag != nullptr) {
            wait_until = std::min(deadline, Clock::now() + config_.poll_slice);
        }

        auto line = transport_.receive_line(wait_until);
        if (!line) {
            const TransportError& err = line.error();
            if (err.category == TransportError::Category::Timeout) {
                if (Clock::now() >= deadline) {
                    abandon(id);
                    MCPROBE_LOG_WARN("'{}' (id {}) timed out after {} ms", method, id, elapsed().count());
                    ClientError error = ClientError::timeout(method, elapsed());
                    error.diagnostics = diagnostics();
                    return tl::unexpected(std::move(error));
                }
                continue;
            }
            if (err.category == TransportError::Category::Closed) {
                MCPROBE_LOG_ERROR("Peer closed while waiting for '{}': {}", method, err.message);
                return tl::unexpected(close_session(err, method));
            }
            abandon(id);
            return tl::unexpected(ClientError::from_transport(err, method));
        }

        if (is_blank(*line)) {
            continue;
        }
        if (!looks_like_json_object(*line)) {
            MCPROBE_LOG_DEBUG("Skipping non-JSON output: {}", excerpt(strip_ansi(*line)));
            remember_stray(*line);
            continue;
        }

        Json document;
        try {
            document = Json::parse(*line);
        } catch (const Json::parse_error& e) {
            abandon(id);
            return tl::unexpected(ClientError::protocol_error(
                std::format("Malformed response line ({}): {}", e.what(), excerpt(*line)),
                method));
        }

        if (is_notification(document)) {
            MCPROBE_LOG_DEBUG("Skipping notification '{}'", document.at("method").dump());
            continue;
        }

        auto response = JsonRpcResponse::from_json(document);
        if (!response) {
            abandon(id);
            return tl::unexpected(ClientError::protocol_error(
                std::format("Invalid response envelope ({}): {}", response.error().message, excerpt(*line)),
                method));
        }

        if (response->id() == id) {
            MCPROBE_LOG_DEBUG("Received {} for {} (id {}) after {} ms",
                              response->is_error() ? "error" : "result", method, id, elapsed().count());
            return std::move(*response);
        }

        if (take_abandoned(response->id())) {
            MCPROBE_LOG_WARN("Discarding late reply to timed-out request {}", response->id());
            continue;
        }

        abandon(id);
        return tl::unexpected(ClientError::protocol_error(
            std::format("Response id '{}' does not match pending request '{}'", response->id(), id),
            method));
    }
}

}  // namespace mcprobe
