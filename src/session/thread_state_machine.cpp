#include "session/thread_state_machine.hpp"

#include <algorithm>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace turnloom::session {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::ConversationEntry;

std::string to_string(const ThreadPhase phase) {
    switch (phase) {
        case ThreadPhase::Idle:
            return "idle";
        case ThreadPhase::Running:
            return "running";
        case ThreadPhase::QueuePaused:
            return "queue_paused";
        default:
            return "unknown";
    }
}

bool entries_is_prefix(const std::vector<ConversationEntry>& prefix,
                       const std::vector<ConversationEntry>& full) {
    if (prefix.size() > full.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), full.begin(), protocol::entry_is_same);
}

bool entries_is_suffix(const std::vector<ConversationEntry>& suffix,
                       const std::vector<ConversationEntry>& full) {
    if (suffix.size() > full.size()) {
        return false;
    }
    const auto offset = static_cast<std::ptrdiff_t>(full.size() - suffix.size());
    return std::equal(suffix.begin(), suffix.end(), full.begin() + offset,
                      protocol::entry_is_same);
}

ThreadStateMachine::ThreadStateMachine(protocol::ThreadKey key) : key_(std::move(key)) {}

ThreadPhase ThreadStateMachine::phase() const {
    if (active_run_id_.has_value()) {
        return ThreadPhase::Running;
    }
    return paused_ ? ThreadPhase::QueuePaused : ThreadPhase::Idle;
}

bool ThreadStateMachine::is_active_run(const std::uint64_t run_id) const {
    return active_run_id_.has_value() && *active_run_id_ == run_id;
}

void ThreadStateMachine::log_transition(const ThreadPhase before, const std::string& reason) const {
    const ThreadPhase after = phase();
    if (before == after && reason.empty()) {
        return;
    }
    TURNLOOM_LOG_INFO("ThreadState: " + protocol::to_string(key_) + " transition " +
                      to_string(before) + " -> " + to_string(after) +
                      (reason.empty() ? "" : " (" + reason + ")"));
}

Effects ThreadStateMachine::restore(const store::ConversationSnapshot& snapshot) {
    const ThreadPhase before = phase();
    queue_.assign(snapshot.queue.prompts.begin(), snapshot.queue.prompts.end());
    paused_ = snapshot.queue.paused;
    next_prompt_id_ = std::max<std::uint64_t>(next_prompt_id_, snapshot.queue.next_prompt_id);
    for (const auto& prompt : queue_) {
        next_prompt_id_ = std::max(next_prompt_id_, prompt.id + 1);
    }
    run_started_at_unix_ms_ = snapshot.queue.run_started_at_unix_ms;
    run_finished_at_unix_ms_ = snapshot.queue.run_finished_at_unix_ms;
    if (!remote_thread_id_.has_value()) {
        remote_thread_id_ = snapshot.remote_thread_id;
    }
    reconcile(snapshot.entries);

    Effects effects;
    const bool interrupted =
        run_started_at_unix_ms_.has_value() &&
        (!run_finished_at_unix_ms_.has_value() ||
         *run_finished_at_unix_ms_ < *run_started_at_unix_ms_);
    if (interrupted && !active_run_id_.has_value()) {
        paused_ = true;
        run_finished_at_unix_ms_ = core::config::now_unix_ms();
        effects.push_back(PersistQueue{});
        log_transition(before, "interrupted run");
    }
    return effects;
}

Effects ThreadStateMachine::start_prompt(protocol::QueuedPrompt prompt) {
    const ThreadPhase before = phase();
    const std::uint64_t run_id = next_run_id_++;
    active_run_id_ = run_id;
    run_started_at_unix_ms_ = core::config::now_unix_ms();
    run_finished_at_unix_ms_.reset();
    add_entry(protocol::make_user_entry(prompt.text, prompt.attachments));
    log_transition(before, "run " + std::to_string(run_id));
    return {StartTurn{run_id, std::move(prompt)}};
}

Effects ThreadStateMachine::start_front_if_ready() {
    if (active_run_id_.has_value() || paused_ || queue_.empty()) {
        return {};
    }
    protocol::QueuedPrompt next = std::move(queue_.front());
    queue_.pop_front();
    return start_prompt(std::move(next));
}

Effects ThreadStateMachine::submit(std::string text,
                                   std::vector<protocol::AttachmentRef> attachments,
                                   protocol::AgentRunConfig run_config) {
    protocol::QueuedPrompt prompt{next_prompt_id_++, std::move(text), std::move(attachments),
                                  std::move(run_config)};

    Effects effects;
    if (active_run_id_.has_value()) {
        queue_.push_back(std::move(prompt));
        effects.push_back(PersistQueue{});
        return effects;
    }

    if (queue_.empty()) {
        paused_ = false;
        effects = start_prompt(std::move(prompt));
        effects.push_back(PersistQueue{});
        return effects;
    }

    // Older queued prompts run first; the new one waits at the tail.
    queue_.push_back(std::move(prompt));
    effects = start_front_if_ready();
    effects.push_back(PersistQueue{});
    return effects;
}

void ThreadStateMachine::add_entry(ConversationEntry entry) {
    const auto* agent = std::get_if<protocol::AgentEntry>(&entry);
    const bool is_item = agent != nullptr &&
                         (std::holds_alternative<protocol::AgentItemRecord>(agent->event) ||
                          std::holds_alternative<protocol::AgentMessage>(agent->event));
    if (is_item) {
        const auto index = protocol::entry_index(entry);
        for (const auto& existing : entries_) {
            const auto existing_index = protocol::entry_index(existing);
            if (existing_index.kind == index.kind && existing_index.item_id == index.item_id) {
                return;
            }
        }
    }
    entries_.push_back(std::move(entry));
}

void ThreadStateMachine::end_active_run() {
    active_run_id_.reset();
    run_finished_at_unix_ms_ = core::config::now_unix_ms();
}

Effects ThreadStateMachine::fail_active(const std::string& message) {
    const ThreadPhase before = phase();
    add_entry(protocol::make_agent_entry(protocol::TurnErrorRecord{message}));
    end_active_run();
    paused_ = true;
    log_transition(before, "turn failed: " + message);
    return {PersistQueue{}};
}

Effects ThreadStateMachine::apply_event(const std::uint64_t run_id,
                                        const protocol::ThreadEvent& event) {
    if (!is_active_run(run_id)) {
        TURNLOOM_LOG_DEBUG("ThreadState: " + protocol::to_string(key_) + " dropped stale " +
                           protocol::event_type(event) + " from run " + std::to_string(run_id));
        return {};
    }

    if (const auto* started = std::get_if<protocol::ThreadStarted>(&event)) {
        if (!remote_thread_id_.has_value()) {
            remote_thread_id_ = started->thread_id;
        }
        return {};
    }
    if (const auto* completed = std::get_if<protocol::ItemCompleted>(&event)) {
        add_entry(protocol::make_item_entry(completed->item));
        return {};
    }
    if (const auto* usage = std::get_if<protocol::TurnCompleted>(&event)) {
        add_entry(protocol::make_agent_entry(protocol::TurnUsageRecord{usage->usage}));
        return {};
    }
    if (const auto* duration = std::get_if<protocol::TurnDuration>(&event)) {
        add_entry(protocol::make_agent_entry(protocol::TurnDurationRecord{duration->duration_ms}));
        return {};
    }
    if (const auto* failed = std::get_if<protocol::TurnFailed>(&event)) {
        return fail_active(failed->message);
    }
    if (const auto* error = std::get_if<protocol::StreamError>(&event)) {
        return fail_active(error->message);
    }
    return {};
}

Effects ThreadStateMachine::finish(const std::uint64_t run_id, const TurnFinish& finish) {
    if (!is_active_run(run_id)) {
        TURNLOOM_LOG_DEBUG("ThreadState: " + protocol::to_string(key_) +
                           " dropped stale finish of run " + std::to_string(run_id));
        return {};
    }

    switch (finish.kind) {
        case FinishKind::Failed:
            return fail_active(finish.message);
        case FinishKind::Canceled: {
            const ThreadPhase before = phase();
            add_entry(protocol::make_agent_entry(protocol::TurnCanceledRecord{}));
            end_active_run();
            paused_ = true;
            log_transition(before, "turn canceled");
            return {PersistQueue{}};
        }
        case FinishKind::Completed:
        default: {
            const ThreadPhase before = phase();
            end_active_run();
            log_transition(before, "turn completed");
            Effects effects = start_front_if_ready();
            effects.push_back(PersistQueue{});
            return effects;
        }
    }
}

Effects ThreadStateMachine::cancel(const std::uint64_t run_id) {
    if (!is_active_run(run_id)) {
        TURNLOOM_LOG_DEBUG("ThreadState: " + protocol::to_string(key_) +
                           " ignored cancel of inactive run " + std::to_string(run_id));
        return {};
    }
    const ThreadPhase before = phase();
    add_entry(protocol::make_agent_entry(protocol::TurnCanceledRecord{}));
    end_active_run();
    paused_ = true;
    log_transition(before, "canceled run " + std::to_string(run_id));
    return {CancelTurn{run_id}, PersistQueue{}};
}

Effects ThreadStateMachine::resume() {
    const ThreadPhase before = phase();
    paused_ = false;
    Effects effects = start_front_if_ready();
    log_transition(before, "resumed");
    effects.push_back(PersistQueue{});
    return effects;
}

core::errors::Result<std::deque<protocol::QueuedPrompt>::iterator>
ThreadStateMachine::find_queued(const std::uint64_t prompt_id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [prompt_id](const auto& prompt) { return prompt.id == prompt_id; });
    if (it == queue_.end()) {
        return EngineError{ErrorCategory::Input,
                           "No queued prompt " + std::to_string(prompt_id) + " on " +
                               protocol::to_string(key_) + ".",
                           core::errors::codes::kInvalidArgument};
    }
    return it;
}

core::errors::Result<Effects> ThreadStateMachine::remove_queued(const std::uint64_t prompt_id) {
    auto found = find_queued(prompt_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    queue_.erase(core::errors::get_value(found));
    return Effects{PersistQueue{}};
}

core::errors::Result<Effects> ThreadStateMachine::update_queued(const std::uint64_t prompt_id,
                                                                std::string text) {
    auto found = find_queued(prompt_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    core::errors::get_value(found)->text = std::move(text);
    return Effects{PersistQueue{}};
}

core::errors::Result<Effects> ThreadStateMachine::move_queued(const std::uint64_t prompt_id,
                                                              const std::size_t index) {
    auto found = find_queued(prompt_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    protocol::QueuedPrompt prompt = std::move(*core::errors::get_value(found));
    queue_.erase(core::errors::get_value(found));
    const std::size_t target = std::min(index, queue_.size());
    queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(target), std::move(prompt));
    return Effects{PersistQueue{}};
}

Effects ThreadStateMachine::clear_queue() {
    queue_.clear();
    return {PersistQueue{}};
}

bool ThreadStateMachine::reconcile(const std::vector<ConversationEntry>& snapshot_entries) {
    if (entries_.empty()) {
        entries_ = snapshot_entries;
        return !snapshot_entries.empty();
    }

    const bool snapshot_is_newer = entries_is_prefix(entries_, snapshot_entries) ||
                                   entries_is_suffix(entries_, snapshot_entries);
    const bool local_is_newer = entries_is_prefix(snapshot_entries, entries_) ||
                                entries_is_suffix(snapshot_entries, entries_);
    if (snapshot_is_newer && !local_is_newer) {
        entries_ = snapshot_entries;
        return true;
    }
    if (!snapshot_is_newer && !local_is_newer) {
        TURNLOOM_LOG_WARN("ThreadState: " + protocol::to_string(key_) +
                          " snapshot diverges from local entries, keeping local");
    }
    return false;
}

store::QueueState ThreadStateMachine::queue_state() const {
    store::QueueState state;
    state.paused = paused_;
    state.run_started_at_unix_ms = run_started_at_unix_ms_;
    state.run_finished_at_unix_ms = run_finished_at_unix_ms_;
    state.prompts.assign(queue_.begin(), queue_.end());
    state.next_prompt_id = next_prompt_id_;
    return state;
}

}  // namespace turnloom::session
