#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_events.hpp"
#include "protocol/thread_key.hpp"
#include "store/store_types.hpp"

namespace turnloom::session {

enum class ThreadPhase {
    Idle,
    Running,
    QueuePaused
};

std::string to_string(ThreadPhase phase);

// Effects are descriptions of work for the caller; the machine itself performs no I/O.
struct StartTurn {
    std::uint64_t run_id = 0;
    protocol::QueuedPrompt prompt;
};

struct CancelTurn {
    std::uint64_t run_id = 0;
};

struct PersistQueue {};

using Effect = std::variant<StartTurn, CancelTurn, PersistQueue>;
using Effects = std::vector<Effect>;

enum class FinishKind {
    Completed,
    Failed,
    Canceled
};

struct TurnFinish {
    FinishKind kind = FinishKind::Completed;
    std::string message;
};

// Queue and run state of one thread. At most one run is active; events and finish
// signals carrying any other run id are dropped.
class ThreadStateMachine {
public:
    explicit ThreadStateMachine(protocol::ThreadKey key);

    // Seeds queue, pause flag and entries from the durable snapshot. A run the
    // snapshot still shows as in flight was interrupted and pauses the queue.
    Effects restore(const store::ConversationSnapshot& snapshot);

    Effects submit(std::string text, std::vector<protocol::AttachmentRef> attachments,
                   protocol::AgentRunConfig run_config);
    Effects apply_event(std::uint64_t run_id, const protocol::ThreadEvent& event);
    Effects finish(std::uint64_t run_id, const TurnFinish& finish);
    Effects cancel(std::uint64_t run_id);
    Effects resume();

    core::errors::Result<Effects> remove_queued(std::uint64_t prompt_id);
    core::errors::Result<Effects> update_queued(std::uint64_t prompt_id, std::string text);
    core::errors::Result<Effects> move_queued(std::uint64_t prompt_id, std::size_t index);
    Effects clear_queue();

    // Adopts an authoritative entry list when it strictly extends the local one.
    // Returns true when local entries were replaced.
    bool reconcile(const std::vector<protocol::ConversationEntry>& snapshot_entries);

    const protocol::ThreadKey& key() const { return key_; }
    ThreadPhase phase() const;
    bool is_running() const { return active_run_id_.has_value(); }
    bool is_paused() const { return paused_; }
    bool is_active_run(std::uint64_t run_id) const;
    const std::optional<std::uint64_t>& active_run_id() const { return active_run_id_; }
    const std::deque<protocol::QueuedPrompt>& queue() const { return queue_; }
    const std::vector<protocol::ConversationEntry>& entries() const { return entries_; }
    const std::optional<std::string>& remote_thread_id() const { return remote_thread_id_; }
    std::uint64_t next_prompt_id() const { return next_prompt_id_; }

    store::QueueState queue_state() const;

private:
    Effects start_prompt(protocol::QueuedPrompt prompt);
    Effects start_front_if_ready();
    Effects fail_active(const std::string& message);
    void end_active_run();
    void add_entry(protocol::ConversationEntry entry);
    void log_transition(ThreadPhase before, const std::string& reason) const;
    core::errors::Result<std::deque<protocol::QueuedPrompt>::iterator> find_queued(
        std::uint64_t prompt_id);

    protocol::ThreadKey key_;
    std::optional<std::uint64_t> active_run_id_;
    std::uint64_t next_run_id_ = 1;
    bool paused_ = false;
    std::deque<protocol::QueuedPrompt> queue_;
    std::uint64_t next_prompt_id_ = 1;
    std::vector<protocol::ConversationEntry> entries_;
    std::optional<std::string> remote_thread_id_;
    std::optional<std::int64_t> run_started_at_unix_ms_;
    std::optional<std::int64_t> run_finished_at_unix_ms_;
};

// Prefix / suffix tests under entry_is_same.
bool entries_is_prefix(const std::vector<protocol::ConversationEntry>& prefix,
                       const std::vector<protocol::ConversationEntry>& full);
bool entries_is_suffix(const std::vector<protocol::ConversationEntry>& suffix,
                       const std::vector<protocol::ConversationEntry>& full);

}  // namespace turnloom::session
