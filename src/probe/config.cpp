#include "mcprobe/probe/config.hpp"
#include "mcprobe/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>

namespace mcprobe {

namespace {

ConfigError schema_error(std::size_t index, std::string_view what) {
    return {ConfigError::Code::Schema, std::format("scenario #{}: {}", index + 1, what)};
}

/// Optional string member; absent or null yields an empty string
tl::expected<std::string, std::string> string_member(const Json& entry, const char* key) {
    const auto it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return std::string{};
    }
    if (it->is_string() == false) {
        return tl::unexpected(std::format("'{}' must be a string", key));
    }
    return it->get<std::string>();
}

}  // namespace

std::vector<Scenario> default_scenarios() {
    return {
        Scenario{
            "Static HTML Test",
            "https://httpbin.org/html",
            "Should use static fetcher",
            ExpectedFetch::Static},
        Scenario{
            "JavaScript SPA Test",
            "https://jsonplaceholder.typicode.com/",
            "Should detect and use browser fetcher",
            ExpectedFetch::Browser},
    };
}

RunConfig default_run_config() {
    RunConfig config;
    config.target.command = "cargo";
    config.target.args = {"run", "--", "mcp"};
    config.target.working_directory = ".";
    config.scenarios = default_scenarios();
    return config;
}

ConfigResult<void> validate(const RunConfig& config) {
    if (config.target.command.empty()) {
        return tl::unexpected(ConfigError{ConfigError::Code::Invalid, "target command is empty"});
    }
    if (config.handshake_timeout.count() <= 0) {
        return tl::unexpected(ConfigError{ConfigError::Code::Invalid, "handshake timeout must be positive"});
    }
    if (config.call_timeout.count() <= 0) {
        return tl::unexpected(ConfigError{ConfigError::Code::Invalid, "call timeout must be positive"});
    }
    if (config.target.terminate_grace.count() < 0) {
        return tl::unexpected(ConfigError{ConfigError::Code::Invalid, "termination grace period must not be negative"});
    }
    if (config.fetch_timeout_seconds < kMinFetchTimeoutSeconds ||
        config.fetch_timeout_seconds > kMaxFetchTimeoutSeconds) {
        MCPROBE_LOG_WARN("fetch timeout {}s is outside [{}, {}] and will be clamped",
                         config.fetch_timeout_seconds, kMinFetchTimeoutSeconds, kMaxFetchTimeoutSeconds);
    }
    return {};
}

ConfigResult<std::vector<Scenario>> parse_scenarios(const Json& document) {
    if (document.is_array() == false) {
        return tl::unexpected(ConfigError{ConfigError::Code::Schema, "scenario file must hold a JSON array"});
    }

    std::vector<Scenario> scenarios;
    scenarios.reserve(document.size());

    for (std::size_t i = 0; i < document.size(); ++i) {
        const Json& entry = document[i];
        if (entry.is_object() == false) {
            return tl::unexpected(schema_error(i, "must be an object"));
        }

        Scenario scenario;

        auto url = string_member(entry, "url");
        if (!url) {
            return tl::unexpected(schema_error(i, url.error()));
        }
        if (url->empty()) {
            return tl::unexpected(schema_error(i, "'url' is required"));
        }
        scenario.target = std::move(*url);

        auto name = string_member(entry, "name");
        if (!name) {
            return tl::unexpected(schema_error(i, name.error()));
        }
        scenario.name = name->empty() ? std::format("Scenario {}", i + 1) : std::move(*name);

        auto description = string_member(entry, "description");
        if (!description) {
            return tl::unexpected(schema_error(i, description.error()));
        }
        scenario.expected_behavior = std::move(*description);

        auto expect = string_member(entry, "expect");
        if (!expect) {
            return tl::unexpected(schema_error(i, expect.error()));
        }
        const auto expected = parse_expected_fetch(*expect);
        if (!expected) {
            return tl::unexpected(schema_error(
                i, std::format("unknown 'expect' value '{}' (use static or browser)", *expect)));
        }
        scenario.expected_fetch = *expected;

        scenarios.push_back(std::move(scenario));
    }
    return scenarios;
}

std::optional<StderrHandling> parse_stderr_handling(std::string_view text) noexcept {
    std::string lowered(text.size(), '\0');
    std::transform(text.begin(), text.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "capture") {
        return StderrHandling::Capture;
    }
    if (lowered == "passthrough" || lowered == "inherit") {
        return StderrHandling::Passthrough;
    }
    if (lowered == "discard") {
        return StderrHandling::Discard;
    }
    return std::nullopt;
}

ConfigResult<std::vector<Scenario>> load_scenarios(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return tl::unexpected(ConfigError{ConfigError::Code::Io, "cannot open scenario file '" + path + "'"});
    }

    std::stringstream contents;
    contents << file.rdbuf();

    Json document;
    try {
        document = Json::parse(contents.str());
    } catch (const Json::parse_error& e) {
        return tl::unexpected(ConfigError{
            ConfigError::Code::Parse,
            std::format("{}: {}", path, e.what())});
    }

    auto scenarios = parse_scenarios(document);
    if (!scenarios) {
        ConfigError error = scenarios.error();
        error.message = path + ": " + error.message;
        return tl::unexpected(std::move(error));
    }

    MCPROBE_LOG_DEBUG("Loaded {} scenario(s) from {}", scenarios->size(), path);
    return scenarios;
}

}  // namespace mcprobe
