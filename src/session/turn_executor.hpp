#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "protocol/run_config.hpp"
#include "protocol/thread_events.hpp"
#include "protocol/thread_key.hpp"
#include "runtime/turn_runner.hpp"
#include "session/thread_state_machine.hpp"

namespace turnloom::session {

struct TurnLaunch {
    protocol::ThreadKey key;
    std::uint64_t run_id = 0;
    protocol::QueuedPrompt prompt;
    std::filesystem::path worktree_path;
    std::optional<std::string> remote_thread_id;
    std::vector<std::string> extra_dirs;
};

using TurnEventSink = std::function<void(const protocol::ThreadEvent&)>;
using TurnFinishSink = std::function<void(const TurnFinish&)>;

// Runs turns on behalf of the orchestrator. Implementations report every event and
// exactly one finish signal per launch, from any thread.
class TurnExecutor {
public:
    virtual ~TurnExecutor() = default;

    virtual void start(const TurnLaunch& launch, std::shared_ptr<std::atomic_bool> cancel,
                       TurnEventSink on_event, TurnFinishSink on_finish) = 0;

    // Blocks until every started turn, including turns started meanwhile, has finished.
    virtual void wait_idle() = 0;
};

// Runs each turn through TurnRunner on its own thread.
class RunnerTurnExecutor : public TurnExecutor {
public:
    explicit RunnerTurnExecutor(runtime::TurnRunner& runner);
    ~RunnerTurnExecutor() override;

    void start(const TurnLaunch& launch, std::shared_ptr<std::atomic_bool> cancel,
               TurnEventSink on_event, TurnFinishSink on_finish) override;
    void wait_idle() override;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    void join_finished_locked();

    runtime::TurnRunner& runner_;
    std::mutex mutex_;
    std::vector<Worker> workers_;
};

}  // namespace turnloom::session
