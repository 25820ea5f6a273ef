#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "protocol/thread_events.hpp"
#include "protocol/thread_key.hpp"
#include "runtime/subprocess.hpp"

namespace turnloom::runtime {

struct PollResult {
    std::vector<protocol::ThreadEvent> events;
    bool turn_completed = false;
    bool alive = true;
    // Set when the agent wrote a line that is not a valid event; the turn is over.
    std::optional<core::errors::EngineError> protocol_error;
};

// A long-lived agent process that takes one prompt line per turn on stdin and
// streams thread events on stdout. A reader thread queues parsed events until polled.
class PersistentProcess {
public:
    static core::errors::Result<std::unique_ptr<PersistentProcess>> start(
        const protocol::ThreadKey& key, const SpawnOptions& options);

    PersistentProcess(const PersistentProcess&) = delete;
    PersistentProcess& operator=(const PersistentProcess&) = delete;
    ~PersistentProcess();

    // Starts a new turn: drops events and the completion flag left by the previous one.
    core::errors::Status send_prompt(const std::string& prompt);

    PollResult poll();

    bool is_alive();

    void shutdown();

private:
    PersistentProcess(protocol::ThreadKey key, ChildProcess child);
    void reader_loop();
    void handle_line(const std::string& line);

    protocol::ThreadKey key_;

    std::mutex child_mutex_;
    ChildProcess child_;

    std::mutex events_mutex_;
    std::deque<protocol::ThreadEvent> events_;
    bool turn_completed_ = false;
    std::optional<core::errors::EngineError> protocol_error_;

    std::atomic_bool stopping_{false};
    std::atomic_bool stdout_closed_{false};
    std::thread reader_;
};

}  // namespace turnloom::runtime
