#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_events.hpp"
#include "protocol/thread_key.hpp"
#include "session/thread_state_machine.hpp"
#include "session/turn_executor.hpp"
#include "store/conversation_store.hpp"

namespace turnloom::session {

struct SubmitRequest {
    std::filesystem::path worktree_path;
    std::string text;
    std::vector<protocol::AttachmentRef> attachments;
    protocol::AgentRunConfig run_config;
    std::vector<std::string> extra_dirs;
};

// Point-in-time copy of one thread's orchestration state.
struct ThreadView {
    ThreadPhase phase = ThreadPhase::Idle;
    std::optional<std::uint64_t> active_run_id;
    std::vector<protocol::QueuedPrompt> queue;
    std::vector<protocol::ConversationEntry> entries;
};

// Receives every non-stale event, synchronously on the thread that produced it.
using TurnObserver = std::function<void(const protocol::ThreadKey& key, std::uint64_t run_id,
                                        const protocol::ThreadEvent& event)>;

// Owns one state machine per thread and carries out their effects: queue persistence
// through the store and turn launches through the executor.
class TurnOrchestrator {
public:
    TurnOrchestrator(store::ConversationStore& store, TurnExecutor& executor);
    ~TurnOrchestrator();

    TurnOrchestrator(const TurnOrchestrator&) = delete;
    TurnOrchestrator& operator=(const TurnOrchestrator&) = delete;

    void set_observer(TurnObserver observer);

    core::errors::Status submit(const protocol::ThreadKey& key, SubmitRequest request);

    // Cancels the active run, if any. Returns false when nothing was running.
    core::errors::Result<bool> cancel(const protocol::ThreadKey& key);
    core::errors::Result<bool> cancel_run(const protocol::ThreadKey& key, std::uint64_t run_id);

    core::errors::Status resume(const protocol::ThreadKey& key);
    core::errors::Status remove_queued(const protocol::ThreadKey& key, std::uint64_t prompt_id);
    core::errors::Status update_queued(const protocol::ThreadKey& key, std::uint64_t prompt_id,
                                       std::string text);
    core::errors::Status move_queued(const protocol::ThreadKey& key, std::uint64_t prompt_id,
                                     std::size_t index);
    core::errors::Status clear_queue(const protocol::ThreadKey& key);

    // Reloads the durable snapshot and reconciles local entries against it.
    core::errors::Result<bool> refresh(const protocol::ThreadKey& key);

    core::errors::Result<ThreadView> view(const protocol::ThreadKey& key);

    void wait_idle();

private:
    struct ThreadSlot {
        explicit ThreadSlot(const protocol::ThreadKey& key) : machine(key) {}

        ThreadStateMachine machine;
        std::filesystem::path worktree_path;
        std::vector<std::string> extra_dirs;
        std::shared_ptr<std::atomic_bool> cancel_flag;
        // Bumped for every queue snapshot taken; only newer snapshots reach the store.
        std::uint64_t queue_version = 0;
    };

    struct PendingLaunch {
        TurnLaunch launch;
        std::shared_ptr<std::atomic_bool> cancel;
    };

    struct PendingPersist {
        protocol::ThreadKey key;
        std::uint64_t version = 0;
        store::QueueState state;
    };

    // Collected under the lock, carried out after it is released.
    struct PendingWork {
        std::vector<PendingPersist> persists;
        std::vector<PendingLaunch> launches;
    };

    // Expects `lock` held. Loading a thread for the first time releases it around the
    // store round trip.
    core::errors::Result<ThreadSlot*> slot_for(const protocol::ThreadKey& key,
                                               std::unique_lock<std::mutex>& lock,
                                               PendingWork& work);
    void apply_effects_locked(ThreadSlot& slot, const Effects& effects, PendingWork& work);
    core::errors::Status finish_work(PendingWork& work);

    void on_turn_event(const protocol::ThreadKey& key, std::uint64_t run_id,
                       const protocol::ThreadEvent& event);
    void on_turn_finish(const protocol::ThreadKey& key, std::uint64_t run_id,
                        const TurnFinish& finish);

    // Runs fn against the thread's machine under the lock, then performs the effects.
    core::errors::Status mutate(const protocol::ThreadKey& key,
                                const std::function<core::errors::Result<Effects>(
                                    ThreadStateMachine&)>& fn);

    store::ConversationStore& store_;
    TurnExecutor& executor_;

    std::mutex mutex_;
    std::unordered_map<protocol::ThreadKey, std::unique_ptr<ThreadSlot>, protocol::ThreadKeyHash>
        threads_;

    // Serializes queue writes; versions already written per thread.
    std::mutex persist_mutex_;
    std::unordered_map<protocol::ThreadKey, std::uint64_t, protocol::ThreadKeyHash>
        persisted_versions_;

    std::mutex observer_mutex_;
    TurnObserver observer_;
};

}  // namespace turnloom::session
