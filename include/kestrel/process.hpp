#pragma once

#include <kestrel/exceptions.hpp>
#include <kestrel/logger.hpp>

#include <folly/Try.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace kestrel {

//=============================================================================
// Entry command
//=============================================================================

struct entry_command {
    std::vector<std::string> argv;

    auto executable() const -> const std::string& {
        return argv.front();
    }

    auto empty() const -> bool {
        return argv.empty();
    }

    auto to_string() const -> std::string {
        std::string text;
        for (const auto& arg : argv) {
            if (!text.empty()) {
                text += ' ';
            }
            if (arg.find(' ') != std::string::npos || arg.empty()) {
                text += '"' + arg + '"';
            } else {
                text += arg;
            }
        }
        return text;
    }

    friend auto operator==(const entry_command&, const entry_command&) -> bool = default;
};

/**
 * @brief Split a command line into argv
 *
 * Whitespace separates arguments; double quotes group an argument that
 * contains whitespace. No shell expansion of any kind is performed.
 *
 * @throws configuration_error for an empty command or an unterminated quote
 */
inline auto parse_command(std::string_view text) -> entry_command {
    entry_command command;
    std::string current;
    bool in_quotes = false;
    bool have_token = false;

    for (char c : text) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have_token = true;
        } else if (!in_quotes && (c == ' ' || c == '\t' || c == '\n' || c == '\r')) {
            if (have_token) {
                command.argv.push_back(std::move(current));
                current.clear();
                have_token = false;
            }
        } else {
            current += c;
            have_token = true;
        }
    }

    if (in_quotes) {
        throw configuration_error("Unterminated quote in command: " + std::string(text));
    }
    if (have_token) {
        command.argv.push_back(std::move(current));
    }
    if (command.argv.empty()) {
        throw configuration_error("Empty entry command");
    }
    return command;
}

namespace detail {

// Owning file descriptor
class unique_fd {
public:
    unique_fd() = default;
    explicit unique_fd(int fd) : _fd(fd) {}

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& other) noexcept : _fd(std::exchange(other._fd, -1)) {}

    unique_fd& operator=(unique_fd&& other) noexcept {
        if (this != &other) {
            reset();
            _fd = std::exchange(other._fd, -1);
        }
        return *this;
    }

    ~unique_fd() {
        reset();
    }

    auto get() const -> int { return _fd; }
    auto valid() const -> bool { return _fd >= 0; }

    auto reset() -> void {
        if (_fd >= 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

    auto release() -> int {
        return std::exchange(_fd, -1);
    }

private:
    int _fd{-1};
};

struct pipe_pair {
    unique_fd read_end;
    unique_fd write_end;
};

inline auto make_pipe() -> std::optional<pipe_pair> {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::nullopt;
    }
    return pipe_pair{unique_fd{fds[0]}, unique_fd{fds[1]}};
}

// Writing to a dead child must surface as EPIPE, not kill the whole run
inline auto ignore_sigpipe() -> void {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = SIG_IGN;
        ::sigemptyset(&action.sa_mask);
        ::sigaction(SIGPIPE, &action, nullptr);
    });
}

// Resolve argv[0] against PATH the way execvp would; empty when not found
inline auto resolve_executable(const std::string& name, const std::filesystem::path& working_dir)
    -> std::optional<std::filesystem::path> {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (name.find('/') != std::string::npos) {
        fs::path candidate(name);
        if (candidate.is_relative()) {
            candidate = working_dir / candidate;
        }
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string_view search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
    while (!search.empty()) {
        auto colon = search.find(':');
        auto entry = search.substr(0, colon);
        fs::path candidate = fs::path(entry.empty() ? "." : std::string(entry)) / name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        if (colon == std::string_view::npos) {
            break;
        }
        search.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

} // namespace detail

//=============================================================================
// Process handle
//=============================================================================

enum class read_status {
    line,
    timeout,
    end_of_stream
};

class process_registry;

/**
 * @brief A running child process and its three pipe endpoints
 *
 * Owned exclusively by whoever started it, normally through the
 * std::unique_ptr returned by process_supervisor::start. Destruction removes
 * the handle from its registry and stops the process, so every exit path of
 * the owning scope terminates the child.
 *
 * Pipe I/O (write_line, read_line) must be performed while holding
 * io_mutex(); a request and its response are one critical section.
 */
class process_handle {
public:
    static constexpr std::size_t max_captured_stderr_lines = 1000;
    static constexpr std::chrono::milliseconds default_stop_grace{2000};

    process_handle(pid_t pid,
                   detail::unique_fd stdin_fd,
                   detail::unique_fd stdout_fd,
                   detail::unique_fd stderr_fd,
                   entry_command command,
                   process_registry* registry)
        : _pid(pid)
        , _stdin(std::move(stdin_fd))
        , _stdout(std::move(stdout_fd))
        , _stderr(std::move(stderr_fd))
        , _command(std::move(command))
        , _registry(registry)
        , _start_time(std::chrono::steady_clock::now()) {}

    process_handle(const process_handle&) = delete;
    process_handle& operator=(const process_handle&) = delete;
    process_handle(process_handle&&) = delete;
    process_handle& operator=(process_handle&&) = delete;

    ~process_handle();

    auto pid() const -> pid_t { return _pid; }
    auto command() const -> const entry_command& { return _command; }
    auto start_time() const -> std::chrono::steady_clock::time_point { return _start_time; }

    // Polls the OS; a nonzero pid alone proves nothing
    auto is_alive() -> bool {
        std::lock_guard<std::mutex> lock(_state_mutex);
        reap_locked(false);
        return !_exit_status.has_value();
    }

    // Exit code, or 128 + signal number when killed by a signal
    auto exit_status() -> std::optional<int> {
        std::lock_guard<std::mutex> lock(_state_mutex);
        reap_locked(false);
        return _exit_status;
    }

    /**
     * @brief Graceful then forced termination
     *
     * Sends SIGTERM to the process group, waits up to @p grace for the child
     * to exit, then sends SIGKILL and reaps. Safe on an already-dead or
     * already-stopped handle.
     */
    auto stop(std::chrono::milliseconds grace = default_stop_grace) -> void;

    auto io_mutex() -> std::timed_mutex& {
        return _io_mutex;
    }

    // Request ids are unique per process so stale responses can be recognised
    auto next_request_id() -> std::int64_t {
        return _next_request_id.fetch_add(1);
    }

    /**
     * @brief Write one line plus the delimiter to the child's stdin
     *
     * @throws process_io_error when the pipe is closed or broken
     * @throws process_timeout_error when the child stops draining stdin
     */
    auto write_line(std::string_view line, std::chrono::steady_clock::time_point deadline) -> void {
        if (!_stdin.valid()) {
            throw process_io_error("stdin of process " + std::to_string(_pid) + " is closed");
        }

        std::string data(line);
        data += '\n';
        std::size_t written = 0;

        while (written < data.size()) {
            auto n = ::write(_stdin.get(), data.data() + written, data.size() - written);
            if (n > 0) {
                written += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                pollfd pfd{_stdin.get(), POLLOUT, 0};
                auto remaining = remaining_ms(deadline);
                if (remaining <= 0) {
                    throw process_timeout_error("Timed out writing to process " + std::to_string(_pid));
                }
                if (::poll(&pfd, 1, remaining) < 0 && errno != EINTR) {
                    throw process_io_error("poll failed on stdin: " + std::string(std::strerror(errno)));
                }
                continue;
            }
            throw process_io_error("Write to process " + std::to_string(_pid) + " failed: "
                                   + std::string(std::strerror(errno)));
        }
    }

    /**
     * @brief Read the next newline-delimited line from the child's stdout
     *
     * Standard error is drained into the captured stderr lines while waiting.
     * A timeout leaves any partial line buffered for the next call.
     *
     * @throws process_io_error when reading fails
     */
    auto read_line(std::chrono::steady_clock::time_point deadline) -> std::pair<read_status, std::string> {
        while (true) {
            if (auto line = take_buffered_line()) {
                return {read_status::line, std::move(*line)};
            }
            if (_stdout_eof) {
                return {read_status::end_of_stream, {}};
            }

            auto remaining = remaining_ms(deadline);
            if (remaining <= 0) {
                return {read_status::timeout, {}};
            }
            wait_for_output(remaining);
        }
    }

    // Drain whatever stderr output arrives within @p wait
    auto pump_stderr(std::chrono::milliseconds wait) -> void {
        std::lock_guard<std::timed_mutex> lock(_io_mutex);
        auto deadline = std::chrono::steady_clock::now() + wait;
        do {
            if (_stderr_eof) {
                return;
            }
            pollfd pfd{_stderr.get(), POLLIN, 0};
            auto ready = ::poll(&pfd, 1, std::max(0, remaining_ms(deadline)));
            if (ready <= 0) {
                return;
            }
            read_stderr();
        } while (std::chrono::steady_clock::now() < deadline);
    }

    auto stderr_lines() const -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(_stderr_mutex);
        return _stderr_lines;
    }

private:
    friend class process_registry;

    pid_t _pid;
    detail::unique_fd _stdin;
    detail::unique_fd _stdout;
    detail::unique_fd _stderr;
    entry_command _command;
    process_registry* _registry;
    std::chrono::steady_clock::time_point _start_time;

    std::timed_mutex _io_mutex;
    std::atomic<std::int64_t> _next_request_id{1};
    std::string _stdout_buffer;
    std::string _stderr_buffer;
    bool _stdout_eof{false};
    bool _stderr_eof{false};

    mutable std::mutex _stderr_mutex;
    std::vector<std::string> _stderr_lines;

    std::mutex _state_mutex;
    std::optional<int> _exit_status;
    bool _stopped{false};

    static auto remaining_ms(std::chrono::steady_clock::time_point deadline) -> int {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    // Caller holds _state_mutex
    auto reap_locked(bool block) -> void {
        if (_exit_status.has_value()) {
            return;
        }
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(_pid, &status, block ? 0 : WNOHANG);
        } while (result < 0 && errno == EINTR);

        if (result == _pid) {
            if (WIFEXITED(status)) {
                _exit_status = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                _exit_status = 128 + WTERMSIG(status);
            } else {
                _exit_status = -1;
            }
        } else if (result < 0 && errno == ECHILD) {
            // Already reaped elsewhere
            _exit_status = -1;
        }
    }

    // Sends signals and reaps; never touches the registry
    auto terminate(std::chrono::milliseconds grace) -> void {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (_stopped) {
            return;
        }
        _stopped = true;

        reap_locked(false);
        if (!_exit_status.has_value()) {
            signal_group(SIGTERM);
            auto deadline = std::chrono::steady_clock::now() + grace;
            while (!_exit_status.has_value() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
                reap_locked(false);
            }
            if (!_exit_status.has_value()) {
                signal_group(SIGKILL);
                reap_locked(true);
            }
        }
        // Grandchildren spawned by wrappers such as npm share the group
        ::kill(-_pid, SIGKILL);
    }

    // Falls back to the single pid when the group does not exist yet
    auto signal_group(int signo) -> void {
        if (::kill(-_pid, signo) != 0 && errno == ESRCH) {
            ::kill(_pid, signo);
        }
    }

    auto take_buffered_line() -> std::optional<std::string> {
        auto pos = _stdout_buffer.find('\n');
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        std::string line = _stdout_buffer.substr(0, pos);
        _stdout_buffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    auto wait_for_output(int timeout_ms) -> void {
        pollfd fds[2];
        nfds_t count = 0;
        int stdout_index = -1;
        int stderr_index = -1;

        if (!_stdout_eof) {
            stdout_index = static_cast<int>(count);
            fds[count++] = pollfd{_stdout.get(), POLLIN, 0};
        }
        if (!_stderr_eof) {
            stderr_index = static_cast<int>(count);
            fds[count++] = pollfd{_stderr.get(), POLLIN, 0};
        }

        auto ready = ::poll(fds, count, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                return;
            }
            throw process_io_error("poll failed: " + std::string(std::strerror(errno)));
        }
        if (ready == 0) {
            return;
        }

        if (stderr_index >= 0 && (fds[stderr_index].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            read_stderr();
        }
        if (stdout_index >= 0 && (fds[stdout_index].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            read_stdout();
        }
    }

    auto read_stdout() -> void {
        char buffer[8192];
        auto n = ::read(_stdout.get(), buffer, sizeof(buffer));
        if (n > 0) {
            _stdout_buffer.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            _stdout_eof = true;
            // A final unterminated line is still a line
            if (!_stdout_buffer.empty()) {
                _stdout_buffer += '\n';
            }
        } else if (errno != EINTR && errno != EAGAIN) {
            throw process_io_error("Read from process " + std::to_string(_pid) + " failed: "
                                   + std::string(std::strerror(errno)));
        }
    }

    auto read_stderr() -> void {
        char buffer[4096];
        auto n = ::read(_stderr.get(), buffer, sizeof(buffer));
        if (n > 0) {
            _stderr_buffer.append(buffer, static_cast<std::size_t>(n));
        } else if (n == 0) {
            _stderr_eof = true;
            if (!_stderr_buffer.empty()) {
                _stderr_buffer += '\n';
            }
        } else {
            // Treat a broken stderr pipe as closed; stdout is what matters
            if (errno != EINTR && errno != EAGAIN) {
                _stderr_eof = true;
            }
            return;
        }

        std::lock_guard<std::mutex> lock(_stderr_mutex);
        std::size_t pos;
        while ((pos = _stderr_buffer.find('\n')) != std::string::npos) {
            std::string line = _stderr_buffer.substr(0, pos);
            _stderr_buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!line.empty() && _stderr_lines.size() < max_captured_stderr_lines) {
                _stderr_lines.push_back(std::move(line));
            }
        }
    }
};

//=============================================================================
// Process registry
//=============================================================================

/**
 * @brief Every handle that is currently running
 *
 * Handles add themselves on start and remove themselves on stop or
 * destruction. terminate_all() is the last-resort sweep run at the end of a
 * comprehensive run; scoped handles are the primary cleanup mechanism.
 */
class process_registry {
public:
    process_registry() = default;
    process_registry(const process_registry&) = delete;
    process_registry& operator=(const process_registry&) = delete;

    auto add(process_handle* handle) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _handles.insert(handle);
    }

    auto remove(process_handle* handle) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _handles.erase(handle);
    }

    // Stops every registered process; returns how many were swept
    auto terminate_all(std::chrono::milliseconds grace) -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        auto swept = _handles.size();
        for (auto* handle : _handles) {
            handle->terminate(grace);
        }
        _handles.clear();
        return swept;
    }

    auto active_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        return _handles.size();
    }

    auto active_pids() const -> std::vector<pid_t> {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<pid_t> pids;
        pids.reserve(_handles.size());
        for (const auto* handle : _handles) {
            pids.push_back(handle->pid());
        }
        std::sort(pids.begin(), pids.end());
        return pids;
    }

private:
    mutable std::mutex _mutex;
    std::unordered_set<process_handle*> _handles;
};

// The registry lock is never taken while the handle's state lock is held
inline process_handle::~process_handle() {
    if (_registry != nullptr) {
        _registry->remove(this);
    }
    terminate(default_stop_grace);
}

inline auto process_handle::stop(std::chrono::milliseconds grace) -> void {
    terminate(grace);
    if (_registry != nullptr) {
        _registry->remove(this);
    }
}

//=============================================================================
// Process supervisor
//=============================================================================

using process_ptr = std::unique_ptr<process_handle>;

/**
 * @brief Spawns server processes and tracks them in a registry
 *
 * start() never throws past the caller: failures come back as a folly::Try
 * holding a process_start_error.
 */
template<diagnostic_logger Logger>
class process_supervisor {
public:
    process_supervisor(process_registry& registry, Logger& logger)
        : _registry(registry)
        , _logger(logger) {
        detail::ignore_sigpipe();
    }

    auto start(const std::filesystem::path& working_dir, const entry_command& command)
        -> folly::Try<process_ptr> {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (command.empty()) {
            return start_failure("Empty entry command");
        }
        if (!fs::is_directory(working_dir, ec)) {
            return start_failure("Working directory does not exist: " + working_dir.string());
        }

        auto resolved = detail::resolve_executable(command.executable(), working_dir);
        if (!resolved) {
            return start_failure("Executable not found: " + command.executable());
        }
        if (::access(resolved->c_str(), X_OK) != 0) {
            return start_failure("Permission denied: " + resolved->string());
        }

        auto in_pipe = detail::make_pipe();
        auto out_pipe = detail::make_pipe();
        auto err_pipe = detail::make_pipe();
        auto exec_pipe = detail::make_pipe();
        if (!in_pipe || !out_pipe || !err_pipe || !exec_pipe) {
            return start_failure("Failed to create pipes: " + std::string(std::strerror(errno)));
        }

        std::vector<char*> argv;
        argv.reserve(command.argv.size() + 1);
        for (const auto& arg : command.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        std::string dir = working_dir.string();
        std::string exe = resolved->string();

        pid_t pid = ::fork();
        if (pid < 0) {
            return start_failure("fork failed: " + std::string(std::strerror(errno)));
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            ::setpgid(0, 0);
            if (::dup2(in_pipe->read_end.get(), STDIN_FILENO) < 0 ||
                ::dup2(out_pipe->write_end.get(), STDOUT_FILENO) < 0 ||
                ::dup2(err_pipe->write_end.get(), STDERR_FILENO) < 0 ||
                ::chdir(dir.c_str()) != 0) {
                int err = errno;
                [[maybe_unused]] auto n = ::write(exec_pipe->write_end.get(), &err, sizeof(err));
                ::_exit(127);
            }
            ::execv(exe.c_str(), argv.data());
            int err = errno;
            [[maybe_unused]] auto n = ::write(exec_pipe->write_end.get(), &err, sizeof(err));
            ::_exit(127);
        }

        ::setpgid(pid, pid);
        in_pipe->read_end.reset();
        out_pipe->write_end.reset();
        err_pipe->write_end.reset();
        exec_pipe->write_end.reset();

        // The exec pipe is close-on-exec: EOF means exec succeeded
        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(exec_pipe->read_end.get(), &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(child_errno))) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            return start_failure("Failed to execute " + command.to_string() + ": "
                                 + std::string(std::strerror(child_errno)));
        }

        ::fcntl(in_pipe->write_end.get(), F_SETFL,
                ::fcntl(in_pipe->write_end.get(), F_GETFL) | O_NONBLOCK);

        auto handle = std::make_unique<process_handle>(
            pid,
            std::move(in_pipe->write_end),
            std::move(out_pipe->read_end),
            std::move(err_pipe->read_end),
            command,
            &_registry);
        _registry.add(handle.get());

        auto pid_text = std::to_string(pid);
        auto cmd_text = command.to_string();
        _logger.debug("Started server process", {{"pid", pid_text}, {"command", cmd_text}});
        return folly::Try<process_ptr>(std::move(handle));
    }

    auto stop(process_handle& handle, std::chrono::milliseconds grace) -> void {
        auto pid_text = std::to_string(handle.pid());
        handle.stop(grace);
        _logger.debug("Stopped server process", {{"pid", pid_text}});
    }

    auto terminate_all(std::chrono::milliseconds grace) -> std::size_t {
        auto swept = _registry.terminate_all(grace);
        if (swept > 0) {
            auto count = std::to_string(swept);
            _logger.warning("Swept leftover server processes", {{"count", count}});
        }
        return swept;
    }

    auto registry() -> process_registry& {
        return _registry;
    }

private:
    process_registry& _registry;
    Logger& _logger;

    auto start_failure(const std::string& message) -> folly::Try<process_ptr> {
        _logger.warning("Server process could not be started", {{"reason", message}});
        return folly::Try<process_ptr>(folly::make_exception_wrapper<process_start_error>(message));
    }
};

} // namespace kestrel
