#include "runtime/subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace turnloom::runtime {

using core::errors::EngineError;
using core::errors::ErrorCategory;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

int decode_wait_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

pid_t wait_blocking(const pid_t pid, int& status) {
    while (true) {
        const pid_t waited = waitpid(pid, &status, 0);
        if (waited == -1 && errno == EINTR) {
            continue;
        }
        return waited;
    }
}

// Child side of spawn. Only async-signal-safe calls past this point.
[[noreturn]] void exec_child(const SpawnOptions& options, char* const* argv, const int stdin_read,
                             const int stdout_write, const int status_write) {
    static_cast<void>(setpgid(0, 0));

    const int devnull = open("/dev/null", O_RDWR);
    static_cast<void>(dup2(options.pipe_stdin ? stdin_read : devnull, STDIN_FILENO));
    static_cast<void>(dup2(stdout_write, STDOUT_FILENO));
    static_cast<void>(dup2(devnull, STDERR_FILENO));

    if (chdir(options.working_directory.c_str()) != 0) {
        const int err = errno;
        static_cast<void>(write(status_write, &err, sizeof(err)));
        _exit(126);
    }
    execvp(argv[0], argv);
    const int err = errno;
    static_cast<void>(write(status_write, &err, sizeof(err)));
    _exit(127);
}

}  // namespace

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_fd(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        return;
    }
}

std::vector<std::string> take_complete_lines(std::string& buffer) {
    std::vector<std::string> lines;
    std::size_t begin = 0;
    while (true) {
        const std::size_t newline = buffer.find('\n', begin);
        if (newline == std::string::npos) {
            break;
        }
        std::string line = buffer.substr(begin, newline - begin);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        begin = newline + 1;
    }
    buffer.erase(0, begin);
    return lines;
}

core::errors::Result<ChildProcess> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        return EngineError{ErrorCategory::Input, "Cannot spawn an empty command line.",
                           core::errors::codes::kInvalidArgument};
    }
    ignore_sigpipe();

    std::vector<std::string> args = options.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return EngineError{ErrorCategory::Process, "Failed to create process pipes.",
                           core::errors::codes::kProcessSpawnFailed};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* fds : {stdin_pipe, stdout_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return EngineError{ErrorCategory::Process, "Failed to fork process.",
                           core::errors::codes::kProcessSpawnFailed};
    }
    if (pid == 0) {
        exec_child(options, argv.data(), stdin_pipe[0], stdout_pipe[1], status_pipe[1]);
    }

    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);
    if (!options.pipe_stdin) {
        close_fd(stdin_pipe[1]);
    }

    // The status pipe closes on a successful exec; otherwise the child reports errno.
    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (got == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    ChildProcess child(pid, stdin_pipe[1], stdout_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        child.terminate();
        return EngineError{ErrorCategory::Process,
                           "Failed to launch " + options.argv.front() + ": " +
                               std::strerror(child_errno),
                           core::errors::codes::kProcessSpawnFailed,
                           "Check the configured agent binary and working directory."};
    }
    TURNLOOM_LOG_DEBUG("Subprocess: spawned " + options.argv.front() + " pid " +
                       std::to_string(pid));
    return std::move(child);
}

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdin_fd_(std::exchange(other.stdin_fd_, -1)),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      reaped_(other.reaped_),
      exit_code_(other.exit_code_) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        terminate();
        pid_ = std::exchange(other.pid_, -1);
        stdin_fd_ = std::exchange(other.stdin_fd_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    terminate();
}

core::errors::Status ChildProcess::write_stdin(const std::string& data) {
    if (stdin_fd_ < 0) {
        return EngineError{ErrorCategory::Process, "Process stdin is not open.",
                           core::errors::codes::kProcessIoFailed};
    }
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return EngineError{ErrorCategory::Process,
                           std::string("Failed to write to process stdin: ") +
                               std::strerror(errno),
                           core::errors::codes::kProcessIoFailed};
    }
    return core::errors::ok();
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

void ChildProcess::record_status(const int status) {
    reaped_ = true;
    exit_code_ = decode_wait_status(status);
}

bool ChildProcess::is_alive() {
    if (pid_ <= 0 || reaped_) {
        return false;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        record_status(status);
        return false;
    }
    if (waited == -1 && errno == ECHILD) {
        reaped_ = true;
        return false;
    }
    return true;
}

void ChildProcess::kill_group() {
    if (pid_ > 0 && !reaped_) {
        static_cast<void>(kill(-pid_, SIGKILL));
        static_cast<void>(kill(pid_, SIGKILL));
    }
}

void ChildProcess::terminate() {
    if (pid_ > 0 && !reaped_) {
        kill_group();
        int status = 0;
        if (wait_blocking(pid_, status) == pid_) {
            record_status(status);
        } else {
            reaped_ = true;
        }
    }
    close_fds();
}

int ChildProcess::wait() {
    if (pid_ > 0 && !reaped_) {
        int status = 0;
        if (wait_blocking(pid_, status) == pid_) {
            record_status(status);
        } else {
            reaped_ = true;
        }
    }
    return exit_code_;
}

std::optional<int> ChildProcess::exit_code() const {
    if (!reaped_) {
        return std::nullopt;
    }
    return exit_code_;
}

void ChildProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
}

core::errors::Result<LineCommandOutcome> run_line_command(const LineCommandRequest& request,
                                                          const LineHandler& on_line) {
    LineCommandOutcome outcome;
    if (request.cancel_token && request.cancel_token->load()) {
        outcome.cancelled = true;
        return outcome;
    }

    SpawnOptions spawn = request.spawn;
    spawn.pipe_stdin = false;
    const auto started = std::chrono::steady_clock::now();
    auto spawned = ChildProcess::spawn(spawn);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    ChildProcess child = core::errors::take_value(spawned);
    set_nonblocking(child.stdout_fd());

    std::string pending;
    bool stdout_open = true;
    bool killed = false;
    while (stdout_open) {
        if (request.cancel_token && request.cancel_token->load()) {
            outcome.cancelled = true;
            killed = true;
            break;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (request.timeout_ms > 0 && elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            outcome.timed_out = true;
            killed = true;
            break;
        }

        pollfd fds[1];
        fds[0].fd = child.stdout_fd();
        fds[0].events = POLLIN;
        static_cast<void>(poll(fds, 1, 50));

        drain_fd(child.stdout_fd(), stdout_open, pending);
        for (const auto& line : take_complete_lines(pending)) {
            if (!on_line(line)) {
                outcome.stopped = true;
                killed = true;
                break;
            }
        }
        if (killed) {
            break;
        }
    }

    if (killed) {
        child.terminate();
    } else {
        if (!pending.empty()) {
            if (pending.back() == '\r') {
                pending.pop_back();
            }
            if (!on_line(pending)) {
                outcome.stopped = true;
            }
        }
        static_cast<void>(child.wait());
    }
    outcome.exit_code = child.exit_code().value_or(-1);
    outcome.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    return outcome;
}

}  // namespace turnloom::runtime
