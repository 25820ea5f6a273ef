#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/errors/engine_errors.hpp"

namespace turnloom::runtime {

struct SpawnOptions {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    bool pipe_stdin = false;
};

// A child process running in its own process group, stderr discarded.
// Terminated (whole group) and reaped on destruction.
class ChildProcess {
public:
    static core::errors::Result<ChildProcess> spawn(const SpawnOptions& options);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }

    core::errors::Status write_stdin(const std::string& data);
    void close_stdin();

    // Reaps without blocking. False once the child has exited.
    bool is_alive();

    // SIGKILL to the process group without reaping or closing pipes.
    void kill_group();

    // SIGKILL to the process group, then a blocking reap.
    void terminate();

    // Blocks until the child exits.
    int wait();

    std::optional<int> exit_code() const;

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd);
    void record_status(int status);
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
};

void set_nonblocking(int fd);

// Reads what is available from a non-blocking fd. Clears is_open on EOF or error.
void drain_fd(int fd, bool& is_open, std::string& out);

// Pops complete newline-terminated lines (without the newline, CR stripped) from buffer.
std::vector<std::string> take_complete_lines(std::string& buffer);

struct LineCommandRequest {
    SpawnOptions spawn;
    std::uint32_t timeout_ms = 0;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct LineCommandOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool stopped = false;
    double duration_ms = 0.0;
};

// Called once per stdout line as it arrives. Returning false kills the child.
using LineHandler = std::function<bool(const std::string& line)>;

core::errors::Result<LineCommandOutcome> run_line_command(const LineCommandRequest& request,
                                                          const LineHandler& on_line);

void ignore_sigpipe();

}  // namespace turnloom::runtime
