#pragma once

// Platform check - ProcessTransport requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcprobe/transport/line_transport.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>  // For pid_t

namespace mcprobe {

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// How to handle stderr from the subprocess
enum class StderrHandling {
    Discard,     // Redirect to /dev/null
    Passthrough, // Let stderr go to parent's stderr
    Capture      // Capture stderr (accessible via read_stderr())
};

struct ProcessTransportConfig {
    std::string command;                        // Command to execute (resolved via PATH)
    std::vector<std::string> args;              // Command arguments
    std::string working_directory;              // Empty = inherit the driver's cwd
    std::size_t max_line_length{16 << 20};      // 16 MiB; fetched pages can be large
    StderrHandling stderr_handling{StderrHandling::Capture};
    std::size_t stderr_buffer_limit{64 << 10};  // Newest bytes kept when capturing
    std::chrono::milliseconds terminate_grace{5000};  // SIGTERM -> SIGKILL delay
    bool own_process_group{true};               // Signal the whole group on stop()
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Owns a child process and speaks newline-delimited JSON over its stdin and
// stdout.
//
// The child is reaped exactly once: stop() is idempotent and the destructor
// calls it, so letting a ProcessTransport go out of scope terminates the
// child on every exit path (return, error, exception unwind).

class ProcessTransport final : public ILineTransport {
public:
    explicit ProcessTransport(ProcessTransportConfig config);
    ~ProcessTransport() override;

    // Non-copyable, non-movable
    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    /// Spawn the subprocess. Launch failures come back as Category::Spawn.
    [[nodiscard]] TransportResult<void> start();

    /// Close the pipes, SIGTERM the child, SIGKILL it after the grace period.
    /// Never fails; safe to call repeatedly.
    void stop();

    /// Check if the transport has a started, not yet stopped child
    [[nodiscard]] bool is_running() const;

    /// Check if the child process is still alive
    [[nodiscard]] bool is_process_alive();

    /// Get the child process exit code (negative = killed by that signal)
    [[nodiscard]] std::optional<int> exit_code() const;

    /// Child pid, or -1 when nothing is running
    [[nodiscard]] pid_t pid() const;

    [[nodiscard]] const ProcessTransportConfig& config() const noexcept {
        return config_;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // ILineTransport
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] TransportResult<void> send_line(const Json& message) override;
    [[nodiscard]] TransportResult<std::string> receive_line(
        std::optional<Clock::time_point> deadline) override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] std::string diagnostics() override;

    // ─────────────────────────────────────────────────────────────────────────
    // Stderr capture
    // ─────────────────────────────────────────────────────────────────────────

    /// Read and clear captured stderr (empty unless stderr_handling == Capture)
    [[nodiscard]] std::string read_stderr();

    /// Check if there's stderr data available
    [[nodiscard]] bool has_stderr_data() const;

private:
    void stderr_reader_loop(int fd);
    /// Must be called with mutex_ held
    void check_process_status();
    /// Wait for fd to be readable until the deadline. 0 = timed out, 1 = readable, -1 = error
    [[nodiscard]] static int wait_for_readable(int fd, std::optional<Clock::time_point> deadline);
    [[nodiscard]] TransportResult<std::size_t> fill_read_buffer(std::optional<Clock::time_point> deadline);
    /// Must be called with mutex_ held
    [[nodiscard]] TransportError closed_error();

    ProcessTransportConfig config_;
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    pid_t child_pid_{-1};
    bool running_{false};
    bool started_{false};  // A ProcessTransport launches at most one child
    bool eof_{false};
    bool discarding_line_{false};  // Dropping the rest of an oversized line
    std::optional<int> exit_code_;
    mutable std::mutex mutex_;

    // Read buffer to avoid syscall-per-byte
    static constexpr std::size_t read_buffer_size = 8192;
    char read_buffer_[read_buffer_size];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
    std::string partial_line_;  // Bytes of a line interrupted by a timeout

    // Stderr capture
    std::thread stderr_thread_;
    std::atomic<bool> stderr_stop_{false};
    std::string stderr_buffer_;
    mutable std::mutex stderr_mutex_;
};

}  // namespace mcprobe
