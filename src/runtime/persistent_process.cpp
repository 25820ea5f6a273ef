#include "runtime/persistent_process.hpp"

#include <poll.h>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace turnloom::runtime {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::ThreadEvent;

core::errors::Result<std::unique_ptr<PersistentProcess>> PersistentProcess::start(
    const protocol::ThreadKey& key, const SpawnOptions& options) {
    SpawnOptions spawn = options;
    spawn.pipe_stdin = true;
    auto spawned = ChildProcess::spawn(spawn);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    ChildProcess child = core::errors::take_value(spawned);
    set_nonblocking(child.stdout_fd());
    TURNLOOM_LOG_INFO("PersistentProcess: started pid " + std::to_string(child.pid()) + " for " +
                      protocol::to_string(key));
    return std::unique_ptr<PersistentProcess>(new PersistentProcess(key, std::move(child)));
}

PersistentProcess::PersistentProcess(protocol::ThreadKey key, ChildProcess child)
    : key_(std::move(key)), child_(std::move(child)) {
    reader_ = std::thread([this]() { reader_loop(); });
}

PersistentProcess::~PersistentProcess() {
    shutdown();
}

core::errors::Status PersistentProcess::send_prompt(const std::string& prompt) {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.clear();
        turn_completed_ = false;
        protocol_error_.reset();
    }

    const nlohmann::json message = {
        {"type", "user"},
        {"message", {{"role", "user"}, {"content", prompt}}},
    };
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_.write_stdin(message.dump() + "\n");
}

PollResult PersistentProcess::poll() {
    PollResult result;
    // Sampled before draining: the reader queues every line before it flags EOF.
    const bool reader_done = stdout_closed_.load();
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        result.events.assign(std::make_move_iterator(events_.begin()),
                             std::make_move_iterator(events_.end()));
        events_.clear();
        result.turn_completed = turn_completed_;
        result.protocol_error = protocol_error_;
    }
    result.alive = !reader_done;
    if (reader_done) {
        std::lock_guard<std::mutex> lock(child_mutex_);
        static_cast<void>(child_.is_alive());
    }
    return result;
}

bool PersistentProcess::is_alive() {
    if (stdout_closed_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_.is_alive();
}

void PersistentProcess::shutdown() {
    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        child_.kill_group();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    std::lock_guard<std::mutex> lock(child_mutex_);
    child_.terminate();
}

void PersistentProcess::reader_loop() {
    // The fd stays open until shutdown() has joined this thread.
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        fd = child_.stdout_fd();
    }

    std::string pending;
    bool open = fd >= 0;
    while (open && !stopping_.load()) {
        pollfd fds[1];
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        static_cast<void>(::poll(fds, 1, 50));
        if (stopping_.load()) {
            break;
        }
        drain_fd(fd, open, pending);
        for (const auto& line : take_complete_lines(pending)) {
            handle_line(line);
        }
    }
    if (!stopping_.load()) {
        TURNLOOM_LOG_WARN("PersistentProcess: stdout closed for " + protocol::to_string(key_));
    }
    stdout_closed_.store(true);
}

void PersistentProcess::handle_line(const std::string& line) {
    auto parsed = protocol::parse_event_line(line);
    std::lock_guard<std::mutex> lock(events_mutex_);
    if (core::errors::is_error(parsed)) {
        const auto& error = core::errors::get_error(parsed);
        TURNLOOM_LOG_WARN("PersistentProcess: " + error.message);
        if (!protocol_error_.has_value()) {
            protocol_error_ = error;
        }
        turn_completed_ = true;
        return;
    }
    auto event = core::errors::take_value(parsed);
    if (!event.has_value()) {
        return;
    }
    if (std::holds_alternative<protocol::TurnCompleted>(*event) ||
        std::holds_alternative<protocol::TurnFailed>(*event)) {
        turn_completed_ = true;
    }
    events_.push_back(std::move(*event));
}

}  // namespace turnloom::runtime
