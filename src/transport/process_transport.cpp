#include "mcprobe/transport/process_transport.hpp"
#include "mcprobe/log/logger.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <format>

namespace mcprobe {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr int kStderrPollMs = 100;
constexpr std::size_t kDiagnosticsTail = 2048;

// Codes the child writes to the status pipe before _exit(127)
enum ChildStage : int {
    kStageDup = 1,
    kStageChdir = 2,
    kStageExec = 3
};

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

std::string errno_message(int err) {
    return std::string(std::strerror(err));
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void set_cloexec(int fd) {
    const int flags = fcntl(fd, F_GETFD);
    if (flags != -1) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

// Writes to a peer that already exited must come back as EPIPE instead of
// killing the driver.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void report_child_failure(int status_fd, int stage) {
    const int payload[2] = {stage, errno};
    (void)!::write(status_fd, payload, sizeof(payload));
    _exit(127);
}

std::string describe_exit(int code) {
    if (code < 0) {
        return std::format("killed by signal {}", -code);
    }
    return std::format("exited with code {}", code);
}

}  // namespace

ProcessTransport::ProcessTransport(ProcessTransportConfig config)
    : config_(std::move(config))
{}

ProcessTransport::~ProcessTransport() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> ProcessTransport::start() {
    {
        std::lock_guard lock(mutex_);
        if (started_) {
            return tl::unexpected(make_error(
                TransportError::Category::Protocol,
                "Process already started; a transport runs a single child"
            ));
        }
        started_ = true;
    }

    if (config_.command.empty()) {
        return tl::unexpected(make_error(TransportError::Category::Spawn, "Empty command"));
    }

    ignore_sigpipe_once();

    // Pre-allocate argv BEFORE fork(): the child may only call
    // async-signal-safe functions until exec.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    const char* working_directory =
        config_.working_directory.empty() ? nullptr : config_.working_directory.c_str();
    const bool capture_stderr = (config_.stderr_handling == StderrHandling::Capture);

    int stdin_pipe[2] = {-1, -1};   // we write to stdin_pipe[1]
    int stdout_pipe[2] = {-1, -1};  // we read from stdout_pipe[0]
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // close-on-exec: EOF means exec succeeded

    auto close_all = [&] {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    const bool pipes_ok =
        (::pipe(stdin_pipe) != -1) &&
        (::pipe(stdout_pipe) != -1) &&
        (!capture_stderr || ::pipe(stderr_pipe) != -1) &&
        (::pipe(status_pipe) != -1);
    if (!pipes_ok) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Failed to create pipes: " + errno_message(err)
        ));
    }

    // Parent-side ends must not leak into this or any other child
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    if (capture_stderr) {
        set_cloexec(stderr_pipe[0]);
    }
    set_cloexec(status_pipe[0]);
    set_cloexec(status_pipe[1]);

    const pid_t pid = ::fork();

    if (pid == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            "Failed to fork: " + errno_message(err)
        ));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        if (config_.own_process_group) {
            ::setpgid(0, 0);
        }
        ::signal(SIGPIPE, SIG_DFL);

        if (::dup2(stdin_pipe[0], STDIN_FILENO) == -1 ||
            ::dup2(stdout_pipe[1], STDOUT_FILENO) == -1) {
            report_child_failure(status_pipe[1], kStageDup);
        }

        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    ::dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Passthrough:
                break;
            case StderrHandling::Capture:
                if (::dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
                    report_child_failure(status_pipe[1], kStageDup);
                }
                break;
        }

        ::close(stdin_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        ::close(stdout_pipe[1]);
        if (capture_stderr) {
            ::close(stderr_pipe[0]);
            ::close(stderr_pipe[1]);
        }
        ::close(status_pipe[0]);

        if (working_directory != nullptr && ::chdir(working_directory) != 0) {
            report_child_failure(status_pipe[1], kStageChdir);
        }

        ::execvp(argv[0], argv.data());
        report_child_failure(status_pipe[1], kStageExec);
    }

    // Parent process
    if (config_.own_process_group) {
        ::setpgid(pid, pid);  // Races the child's own call; either one wins
    }
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    int failure[2] = {0, 0};
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status_pipe[0], failure, sizeof(failure));
    } while (status_bytes == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_bytes > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {}
        close_all();

        std::string reason;
        switch (failure[0]) {
            case kStageChdir:
                reason = std::format("cannot enter working directory '{}'", config_.working_directory);
                break;
            case kStageDup:
                reason = "cannot redirect standard streams";
                break;
            default:
                reason = std::format("cannot execute '{}'", config_.command);
                break;
        }
        MCPROBE_LOG_ERROR("Spawn failed: {}: {}", reason, errno_message(failure[1]));
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            reason + ": " + errno_message(failure[1])
        ));
    }

    {
        std::lock_guard lock(mutex_);
        child_pid_ = pid;
        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];
        running_ = true;
    }

    if (capture_stderr) {
        stderr_thread_ = std::thread(&ProcessTransport::stderr_reader_loop, this, stderr_pipe[0]);
    }

    MCPROBE_LOG_INFO("Started '{}' (pid {})", config_.command, pid);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Termination
// ─────────────────────────────────────────────────────────────────────────────

void ProcessTransport::stop() {
    pid_t pid_to_terminate = -1;
    bool already_reaped = false;
    int stdin_to_close = -1;
    int stdout_to_close = -1;

    {
        std::lock_guard lock(mutex_);
        if (running_ == false) {
            return;
        }

        check_process_status();
        pid_to_terminate = child_pid_;
        already_reaped = exit_code_.has_value();
        stdin_to_close = stdin_fd_;
        stdout_to_close = stdout_fd_;

        running_ = false;
        child_pid_ = -1;
        stdin_fd_ = -1;
        stdout_fd_ = -1;
        read_buffer_pos_ = 0;
        read_buffer_len_ = 0;
        partial_line_.clear();
    }

    // Closing stdin is the polite shutdown request for line-driven servers
    close_fd(stdin_to_close);
    close_fd(stdout_to_close);

    const bool group = config_.own_process_group;
    auto signal_child = [&](int sig) {
        if (group) {
            ::kill(-pid_to_terminate, sig);
        } else {
            ::kill(pid_to_terminate, sig);
        }
    };

    std::optional<int> final_status;
    if (pid_to_terminate > 0 && already_reaped) {
        // Leader is gone; sweep anything it left behind in its group
        if (group) {
            ::kill(-pid_to_terminate, SIGKILL);
        }
    } else if (pid_to_terminate > 0) {
        signal_child(SIGTERM);

        int status = 0;
        pid_t waited = 0;
        const auto give_up = Clock::now() + config_.terminate_grace;
        while (true) {
            waited = ::waitpid(pid_to_terminate, &status, WNOHANG);
            if (waited != 0 || Clock::now() >= give_up) {
                break;
            }
            std::this_thread::sleep_for(kReapPollInterval);
        }

        if (waited == 0) {
            MCPROBE_LOG_WARN("pid {} ignored SIGTERM for {} ms, sending SIGKILL",
                             pid_to_terminate, config_.terminate_grace.count());
            signal_child(SIGKILL);
            do {
                waited = ::waitpid(pid_to_terminate, &status, 0);
            } while (waited == -1 && errno == EINTR);
        } else if (group) {
            signal_child(SIGKILL);
        }

        if (waited == pid_to_terminate) {
            if (WIFEXITED(status)) {
                final_status = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                final_status = -WTERMSIG(status);
            }
        }
    }

    if (stderr_thread_.joinable()) {
        stderr_stop_ = true;
        stderr_thread_.join();
    }

    {
        std::lock_guard lock(mutex_);
        if (final_status.has_value()) {
            exit_code_ = final_status;
        }
    }

    MCPROBE_LOG_INFO("Stopped process {}", pid_to_terminate);
}

bool ProcessTransport::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

bool ProcessTransport::is_process_alive() {
    std::lock_guard lock(mutex_);
    if (running_ == false || child_pid_ <= 0) {
        return false;
    }
    check_process_status();
    return exit_code_.has_value() == false;
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

pid_t ProcessTransport::pid() const {
    std::lock_guard lock(mutex_);
    return child_pid_;
}

void ProcessTransport::check_process_status() {
    if (child_pid_ <= 0 || exit_code_.has_value()) {
        return;
    }

    int status = 0;
    const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = -WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
    }
}

TransportError ProcessTransport::closed_error() {
    check_process_status();
    std::string msg = "Process closed its output";
    if (exit_code_.has_value()) {
        msg += " (" + describe_exit(*exit_code_) + ")";
    }
    return make_error(TransportError::Category::Closed, std::move(msg));
}

// ─────────────────────────────────────────────────────────────────────────────
// Line I/O
// ─────────────────────────────────────────────────────────────────────────────

bool ProcessTransport::is_open() const {
    std::lock_guard lock(mutex_);
    return running_ && !eof_ && !exit_code_.has_value();
}

int ProcessTransport::wait_for_readable(int fd, std::optional<Clock::time_point> deadline) {
    while (true) {
        int timeout_ms = -1;
        if (deadline.has_value()) {
            const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
            timeout_ms = static_cast<int>(std::max<std::int64_t>(remaining.count(), 0));
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        const int result = ::poll(&pfd, 1, timeout_ms);
        if (result > 0) {
            // POLLHUP without POLLIN still means read() will report EOF
            return 1;
        }
        if (result == 0) {
            return 0;
        }
        if (errno != EINTR) {
            return -1;
        }
    }
}

TransportResult<std::size_t> ProcessTransport::fill_read_buffer(std::optional<Clock::time_point> deadline) {
    const int ready = wait_for_readable(stdout_fd_, deadline);
    if (ready == 0) {
        return tl::unexpected(make_error(TransportError::Category::Timeout, "Read timeout"));
    }
    if (ready < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Io,
            "poll() on process output failed: " + errno_message(errno)
        ));
    }

    ssize_t n = 0;
    do {
        n = ::read(stdout_fd_, read_buffer_, read_buffer_size);
    } while (n == -1 && errno == EINTR);

    if (n < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Io,
            "Failed to read from process: " + errno_message(errno)
        ));
    }
    if (n == 0) {
        eof_ = true;
        return tl::unexpected(closed_error());
    }
    read_buffer_pos_ = 0;
    read_buffer_len_ = static_cast<std::size_t>(n);
    return read_buffer_len_;
}

TransportResult<void> ProcessTransport::send_line(const Json& message) {
    std::lock_guard lock(mutex_);

    if (running_ == false) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
    }

    check_process_status();
    if (exit_code_.has_value()) {
        return tl::unexpected(make_error(
            TransportError::Category::Closed,
            "Process " + describe_exit(*exit_code_)
        ));
    }

    // dump() escapes control characters, so the body never contains '\n'
    std::string data;
    try {
        data = message.dump();
    } catch (const Json::exception& e) {
        return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Cannot serialize message: " + std::string(e.what())
        ));
    }
    MCPROBE_LOG_TRACE(">> {}", data);
    data += '\n';

    // Pipe writes are unbuffered: once the loop finishes the peer can read the line
    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(stdin_fd_, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            if (err == EPIPE) {
                return tl::unexpected(closed_error());
            }
            return tl::unexpected(make_error(
                TransportError::Category::Io,
                "Failed to write to process: " + errno_message(err)
            ));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }

    return {};
}

TransportResult<std::string> ProcessTransport::receive_line(std::optional<Clock::time_point> deadline) {
    std::lock_guard lock(mutex_);

    if (running_ == false) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
    }
    if (eof_) {
        return tl::unexpected(closed_error());
    }

    while (true) {
        while (read_buffer_pos_ < read_buffer_len_) {
            const char* begin = read_buffer_ + read_buffer_pos_;
            const char* end = read_buffer_ + read_buffer_len_;
            const char* newline = std::find(begin, end, '\n');

            if (discarding_line_) {
                read_buffer_pos_ += static_cast<std::size_t>(newline - begin);
                if (newline != end) {
                    ++read_buffer_pos_;
                    discarding_line_ = false;
                }
                continue;
            }

            partial_line_.append(begin, newline);
            read_buffer_pos_ += static_cast<std::size_t>(newline - begin);

            if (partial_line_.size() > config_.max_line_length) {
                partial_line_.clear();
                discarding_line_ = (newline == end);
                if (newline != end) {
                    ++read_buffer_pos_;
                }
                return tl::unexpected(make_error(
                    TransportError::Category::Protocol,
                    std::format("Line exceeds {} bytes", config_.max_line_length)
                ));
            }

            if (newline != end) {
                ++read_buffer_pos_;
                std::string line = std::move(partial_line_);
                partial_line_.clear();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                MCPROBE_LOG_TRACE("<< {}", line);
                return line;
            }
        }

        auto filled = fill_read_buffer(deadline);
        if (!filled) {
            return tl::unexpected(filled.error());
        }
    }
}

std::string ProcessTransport::diagnostics() {
    std::string text;
    {
        std::lock_guard lock(mutex_);
        check_process_status();
        if (exit_code_.has_value()) {
            text = "process " + describe_exit(*exit_code_);
        }
    }

    std::lock_guard lock(stderr_mutex_);
    if (!stderr_buffer_.empty()) {
        if (!text.empty()) {
            text += "; ";
        }
        const std::size_t start =
            stderr_buffer_.size() > kDiagnosticsTail ? stderr_buffer_.size() - kDiagnosticsTail : 0;
        text += "stderr: " + stderr_buffer_.substr(start);
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
    }
    return text;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr capture
// ─────────────────────────────────────────────────────────────────────────────

void ProcessTransport::stderr_reader_loop(int fd) {
    char buffer[4096];
    // Poll with a short timeout so stop() can end the loop even when a
    // grandchild still holds the write end open.
    while (true) {
        // Once stopping, drain what is already buffered without waiting
        const bool stopping = stderr_stop_.load();

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, stopping ? 0 : kStderrPollMs);
        if (ready == 0) {
            if (stopping) {
                break;
            }
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        std::lock_guard lock(stderr_mutex_);
        stderr_buffer_.append(buffer, static_cast<std::size_t>(n));
        if (stderr_buffer_.size() > config_.stderr_buffer_limit) {
            stderr_buffer_.erase(0, stderr_buffer_.size() - config_.stderr_buffer_limit);
        }
    }
    ::close(fd);
}

std::string ProcessTransport::read_stderr() {
    std::lock_guard lock(stderr_mutex_);
    std::string data = std::move(stderr_buffer_);
    stderr_buffer_.clear();
    return data;
}

bool ProcessTransport::has_stderr_data() const {
    std::lock_guard lock(stderr_mutex_);
    return !stderr_buffer_.empty();
}

}  // namespace mcprobe
