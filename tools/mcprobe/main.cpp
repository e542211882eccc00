// ─────────────────────────────────────────────────────────────────────────────
// mcprobe - MCP fetch server probe
// ─────────────────────────────────────────────────────────────────────────────
// Spawns an MCP server speaking newline-delimited JSON-RPC on stdio, performs
// the initialize handshake and calls fetch_web_content once per scenario.
//
// Usage:
//   # Built-in scenarios against `cargo run -- mcp` in the current directory
//   mcprobe
//
//   # Another server binary, scenarios from a file, machine-readable output
//   mcprobe -c ./target/release/fetcher -a mcp --scenarios sites.json --format jsonl
//
// Exit status: 0 all scenarios succeeded, 1 some scenario failed, 2 the run
// could not start, 130 interrupted.

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "mcprobe/log/logger.hpp"
#include "mcprobe/log/spdlog_logger.hpp"
#include "mcprobe/probe/config.hpp"
#include "mcprobe/probe/report.hpp"
#include "mcprobe/probe/run.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>

using namespace mcprobe;

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

void install_interrupt_handlers() {
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // No SA_RESTART: let poll() wake up
    ::sigaction(SIGINT, &action, nullptr);
    ::sigaction(SIGTERM, &action, nullptr);
}

void print_error(const std::string& msg) {
    std::cerr << "mcprobe: " << msg << "\n";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcprobe", "Integration probe for MCP fetch servers");

    options.add_options()
        // Target process
        ("c,command", "Server command (default: cargo)", cxxopts::value<std::string>())
        ("a,arg", "Server argument, repeatable (default: run -- mcp)", cxxopts::value<std::vector<std::string>>())
        ("cwd", "Working directory for the server", cxxopts::value<std::string>()->default_value("."))
        ("grace-ms", "Delay between SIGTERM and SIGKILL on shutdown", cxxopts::value<std::int64_t>()->default_value("5000"))
        ("server-stderr", "Server stderr: capture (shown on failure), passthrough or discard", cxxopts::value<std::string>()->default_value("capture"))

        // Scenarios and timing
        ("s,scenarios", "JSON file with an array of {name, url, description, expect}", cxxopts::value<std::string>())
        ("handshake-timeout-ms", "Wait for the initialize response", cxxopts::value<std::int64_t>()->default_value("10000"))
        ("call-timeout-ms", "Wait for each tools/call response", cxxopts::value<std::int64_t>()->default_value("30000"))
        ("fetch-timeout-seconds", "timeout_seconds passed to fetch_web_content (1-300)", cxxopts::value<std::int64_t>()->default_value("10"))

        // Output
        ("f,format", "Report format: text or jsonl", cxxopts::value<std::string>()->default_value("text"))
        ("no-color", "Disable colored output")
        ("l,log-level", "trace, debug, info, warn, error, critical or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Write logs to this file instead of stderr", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    RunConfig config = default_run_config();
    ReportFormat format = ReportFormat::Text;
    bool colors = true;

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Scenario file example:\n"
                      << "  [{\"name\": \"Static page\", \"url\": \"https://example.com\", \"expect\": \"static\"}]\n";
            return kExitAllSucceeded;
        }

        const auto level = parse_log_level(result["log-level"].as<std::string>());
        if (!level) {
            print_error("unknown log level '" + result["log-level"].as<std::string>() + "'");
            return kExitFatal;
        }
        try {
            if (result.count("log-file")) {
                set_logger(make_file_logger(result["log-file"].as<std::string>(), *level));
            } else {
                set_logger(make_stderr_logger(*level));
            }
        } catch (const spdlog::spdlog_ex& e) {
            print_error(std::string("cannot set up logging: ") + e.what());
            return kExitFatal;
        }

        if (result.count("command")) {
            config.target.command = result["command"].as<std::string>();
            config.target.args.clear();
        }
        if (result.count("arg")) {
            config.target.args = result["arg"].as<std::vector<std::string>>();
        }
        config.target.working_directory = result["cwd"].as<std::string>();
        config.target.terminate_grace = std::chrono::milliseconds(result["grace-ms"].as<std::int64_t>());

        const auto stderr_handling = parse_stderr_handling(result["server-stderr"].as<std::string>());
        if (!stderr_handling) {
            print_error("unknown server stderr mode '" + result["server-stderr"].as<std::string>() + "'");
            return kExitFatal;
        }
        config.target.stderr_handling = *stderr_handling;

        if (result.count("scenarios")) {
            auto loaded = load_scenarios(result["scenarios"].as<std::string>());
            if (!loaded) {
                print_error(loaded.error().message);
                return kExitFatal;
            }
            config.scenarios = std::move(*loaded);
        }

        config.handshake_timeout = std::chrono::milliseconds(result["handshake-timeout-ms"].as<std::int64_t>());
        config.call_timeout = std::chrono::milliseconds(result["call-timeout-ms"].as<std::int64_t>());
        config.fetch_timeout_seconds = result["fetch-timeout-seconds"].as<std::int64_t>();

        const auto parsed_format = parse_report_format(result["format"].as<std::string>());
        if (!parsed_format) {
            print_error("unknown report format '" + result["format"].as<std::string>() + "'");
            return kExitFatal;
        }
        format = *parsed_format;
        colors = !result.count("no-color") && ::isatty(STDOUT_FILENO) == 1;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitFatal;
    }

    if (auto valid = validate(config); !valid) {
        print_error(valid.error().message);
        return kExitFatal;
    }

    install_interrupt_handlers();
    config.cancel_flag = &g_interrupted;

    ReportEmitter emitter(std::cout, format, colors);
    ClientResult<RunSummary> summary;
    try {
        summary = run(config, emitter);
    } catch (const std::exception& e) {
        print_error(e.what());
        get_logger().flush();
        return kExitFatal;
    }

    get_logger().flush();

    if (!summary) {
        return exit_code_for(summary.error());
    }
    return summary->exit_code();
}
