#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_key.hpp"

namespace turnloom::store {

    // One page of history. `start` is the sequence number just before the first entry,
    // so entries hold sequences start+1 .. start+entries.size().
    struct EntryPage {
        std::vector<protocol::ConversationEntry> entries;
        std::uint64_t total = 0;
        std::uint64_t start = 0;
    };

    struct QueueState {
        bool paused = false;
        std::optional<std::int64_t> run_started_at_unix_ms;
        std::optional<std::int64_t> run_finished_at_unix_ms;
        std::vector<protocol::QueuedPrompt> prompts;
        std::uint64_t next_prompt_id = 1;
    };

    struct ConversationSnapshot {
        protocol::ThreadKey key;
        std::optional<std::string> title;
        std::optional<std::string> remote_thread_id;
        protocol::TaskStatus task_status = protocol::TaskStatus::Backlog;
        std::optional<protocol::AgentRunConfig> run_config;
        std::vector<protocol::ConversationEntry> entries;
        QueueState queue;
        std::int64_t created_at = 0;
        std::int64_t updated_at = 0;
    };

    enum class TurnStatus {
        Idle,
        Running,
        Awaiting,
        Paused
    };

    enum class TurnResult {
        Completed,
        Failed
    };

    struct ThreadSummary {
        std::uint64_t thread_local_id = 0;
        std::optional<std::string> remote_thread_id;
        std::optional<std::string> title;
        protocol::TaskStatus task_status = protocol::TaskStatus::Backlog;
        std::int64_t updated_at = 0;
        std::size_t queued_prompt_count = 0;
        TurnStatus turn_status = TurnStatus::Idle;
        std::optional<TurnResult> last_turn_result;
    };

    inline std::string to_string(const TurnStatus status) {
        switch (status) {
            case TurnStatus::Idle:
                return "idle";
            case TurnStatus::Running:
                return "running";
            case TurnStatus::Awaiting:
                return "awaiting";
            case TurnStatus::Paused:
                return "paused";
            default:
                return "unknown";
        }
    }

    inline std::string to_string(const TurnResult result) {
        switch (result) {
            case TurnResult::Completed:
                return "completed";
            case TurnResult::Failed:
                return "failed";
            default:
                return "unknown";
        }
    }

} // namespace turnloom::store
