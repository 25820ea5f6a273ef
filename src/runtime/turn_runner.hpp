#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_events.hpp"
#include "protocol/thread_key.hpp"
#include "runtime/agent_launch.hpp"
#include "runtime/process_pool.hpp"
#include "store/conversation_store.hpp"

namespace turnloom::runtime {

struct TurnRequest {
    protocol::ThreadKey key;
    std::filesystem::path worktree_path;
    std::string prompt;
    std::vector<protocol::AttachmentRef> attachments;
    // Resolved from the blob directory when left empty.
    std::vector<PromptAttachment> resolved_attachments;
    protocol::AgentRunConfig run_config;
    std::optional<std::string> remote_thread_id;
    std::vector<std::string> extra_dirs;
};

enum class TurnOutcome {
    Completed,
    Canceled
};

std::string to_string(TurnOutcome outcome);

using TurnEventCallback = std::function<void(const protocol::ThreadEvent&)>;

// Runs one agent turn end to end and records it in the conversation log. Every
// failure is written as a turn_error entry before it is returned.
class TurnRunner {
public:
    TurnRunner(store::ConversationStore& store, ProcessPool& pool,
               core::config::EngineConfig config);

    core::errors::Result<TurnOutcome> run(const TurnRequest& request,
                                          const std::shared_ptr<std::atomic_bool>& cancel,
                                          const TurnEventCallback& on_event);

private:
    struct TurnState;

    core::errors::Result<TurnOutcome> run_turn(const TurnRequest& request,
                                               const std::shared_ptr<std::atomic_bool>& cancel,
                                               TurnState& state);
    core::errors::Status run_persistent(const TurnRequest& request, const std::string& prompt,
                                        const std::optional<std::string>& resume_id,
                                        const std::shared_ptr<std::atomic_bool>& cancel,
                                        TurnState& state);
    core::errors::Status run_one_shot(const TurnRequest& request,
                                      const core::config::LaunchProfile& profile,
                                      const std::string& prompt,
                                      const std::optional<std::string>& resume_id,
                                      const std::shared_ptr<std::atomic_bool>& cancel,
                                      TurnState& state);

    core::errors::Status handle_event(const protocol::ThreadKey& key, protocol::ThreadEvent event,
                                      TurnState& state);
    core::errors::Status record_duration(const protocol::ThreadKey& key, TurnState& state);
    core::errors::Status append(const protocol::ThreadKey& key, protocol::AgentEvent event);

    store::ConversationStore& store_;
    ProcessPool& pool_;
    core::config::EngineConfig config_;
};

}  // namespace turnloom::runtime
