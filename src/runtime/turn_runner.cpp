#include "runtime/turn_runner.hpp"

#include <chrono>
#include <thread>
#include <unordered_set>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "runtime/subprocess.hpp"
#include "runtime/turn_scope.hpp"

namespace turnloom::runtime {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using core::errors::get_error;
using core::errors::is_error;
using protocol::ThreadEvent;
using protocol::ThreadKey;

struct TurnRunner::TurnState {
    std::string scope_id;
    std::chrono::steady_clock::time_point started;
    const TurnEventCallback* on_event = nullptr;
    bool duration_recorded = false;
    bool error_recorded = false;
    bool saw_agent_message = false;
    bool stop = false;
    std::optional<std::string> turn_error;
    std::uint64_t transient_errors = 0;
    std::unordered_set<std::string> recorded_items;
};

std::string to_string(const TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Completed:
            return "completed";
        case TurnOutcome::Canceled:
            return "canceled";
        default:
            return "unknown";
    }
}

TurnRunner::TurnRunner(store::ConversationStore& store, ProcessPool& pool,
                       core::config::EngineConfig config)
    : store_(store), pool_(pool), config_(std::move(config)) {}

core::errors::Result<TurnOutcome> TurnRunner::run(const TurnRequest& request,
                                                  const std::shared_ptr<std::atomic_bool>& cancel,
                                                  const TurnEventCallback& on_event) {
    TurnState state;
    state.scope_id = core::config::generate_turn_scope_id();
    state.started = std::chrono::steady_clock::now();
    state.on_event = &on_event;

    auto result = run_turn(request, cancel, state);
    if (is_error(result)) {
        const auto& error = get_error(result);
        TURNLOOM_LOG_ERROR("TurnRunner: " + protocol::to_string(request.key) + " turn " +
                           state.scope_id + " failed [" + error.code + "]: " + error.message);
        if (!state.error_recorded) {
            auto duration = record_duration(request.key, state);
            if (is_error(duration)) {
                TURNLOOM_LOG_WARN("TurnRunner: unable to record turn duration: " +
                                  get_error(duration).message);
            }
            auto recorded = append(request.key, protocol::TurnErrorRecord{error.message});
            if (is_error(recorded)) {
                TURNLOOM_LOG_WARN("TurnRunner: unable to record turn error: " +
                                  get_error(recorded).message);
            }
        }
        return result;
    }
    TURNLOOM_LOG_INFO("TurnRunner: " + protocol::to_string(request.key) + " turn " +
                      state.scope_id + " " + to_string(core::errors::get_value(result)));
    return result;
}

core::errors::Result<TurnOutcome> TurnRunner::run_turn(
    const TurnRequest& request, const std::shared_ptr<std::atomic_bool>& cancel,
    TurnState& state) {
    const ThreadKey& key = request.key;

    auto ensured = store_.ensure_thread(key);
    if (is_error(ensured)) {
        return get_error(ensured);
    }

    std::optional<std::string> resume_id = request.remote_thread_id;
    if (!resume_id.has_value()) {
        auto stored = store_.get_remote_thread_id(key);
        if (is_error(stored)) {
            return get_error(stored);
        }
        resume_id = core::errors::get_value(stored);
    }

    auto appended = store_.append_entries(
        key, {protocol::make_user_entry(request.prompt, request.attachments)});
    if (is_error(appended)) {
        return get_error(appended);
    }

    const protocol::AgentRunnerKind runner = effective_runner(config_, request.run_config);
    const auto attachments = request.resolved_attachments.empty()
                                 ? resolve_prompt_attachments(config_.blobs_dir, request.attachments)
                                 : request.resolved_attachments;
    const std::string prompt = format_prompt(request.prompt, attachments, runner);
    const core::config::LaunchProfile& profile = launch_profile(config_, runner);

    TURNLOOM_LOG_INFO("TurnRunner: " + protocol::to_string(key) + " turn " + state.scope_id +
                      " started with " + protocol::to_string(runner) +
                      (resume_id.has_value() ? " resuming " + *resume_id : std::string()));

    auto ran = profile.reuse_process
                   ? run_persistent(request, prompt, resume_id, cancel, state)
                   : run_one_shot(request, profile, prompt, resume_id, cancel, state);
    if (is_error(ran)) {
        return get_error(ran);
    }

    if (cancel && cancel->load()) {
        auto duration = record_duration(key, state);
        if (is_error(duration)) {
            return get_error(duration);
        }
        auto canceled = append(key, protocol::TurnCanceledRecord{});
        if (is_error(canceled)) {
            return get_error(canceled);
        }
        return TurnOutcome::Canceled;
    }

    if (state.turn_error.has_value()) {
        return EngineError{ErrorCategory::Vendor, *state.turn_error,
                           core::errors::codes::kTurnFailed};
    }
    if (!state.saw_agent_message) {
        return EngineError{ErrorCategory::Vendor, "agent finished without a final message",
                           core::errors::codes::kNoAgentMessage};
    }

    auto duration = record_duration(key, state);
    if (is_error(duration)) {
        return get_error(duration);
    }
    return TurnOutcome::Completed;
}

core::errors::Status TurnRunner::run_persistent(const TurnRequest& request,
                                                const std::string& prompt,
                                                const std::optional<std::string>& resume_id,
                                                const std::shared_ptr<std::atomic_bool>& cancel,
                                                TurnState& state) {
    const ThreadKey& key = request.key;
    auto ensured = pool_.ensure(key, request.worktree_path, resume_id, request.extra_dirs);
    if (is_error(ensured)) {
        return ensured;
    }
    auto sent = pool_.send(key, prompt);
    if (is_error(sent)) {
        return sent;
    }

    const auto deadline = state.started + std::chrono::milliseconds(config_.turn_timeout_ms);
    while (true) {
        if (cancel && cancel->load()) {
            // The process stays in the pool; late output is drained by the next poll.
            return core::errors::ok();
        }
        if (std::chrono::steady_clock::now() > deadline) {
            pool_.shutdown(key);
            return EngineError{ErrorCategory::Process,
                               "agent turn timed out after " +
                                   std::to_string(config_.turn_timeout_ms) + " ms",
                               core::errors::codes::kTurnTimeout};
        }

        auto polled = pool_.poll(key);
        if (is_error(polled)) {
            return get_error(polled);
        }
        PollResult poll = core::errors::take_value(polled);
        for (auto& event : poll.events) {
            auto handled = handle_event(key, std::move(event), state);
            if (is_error(handled)) {
                return handled;
            }
            if (state.stop) {
                return core::errors::ok();
            }
        }
        if (poll.protocol_error.has_value()) {
            return *poll.protocol_error;
        }
        if (poll.turn_completed) {
            return core::errors::ok();
        }
        if (!poll.alive) {
            pool_.shutdown(key);
            return EngineError{ErrorCategory::Process,
                               "agent process exited before the turn completed",
                               core::errors::codes::kProcessIoFailed};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
    }
}

core::errors::Status TurnRunner::run_one_shot(const TurnRequest& request,
                                              const core::config::LaunchProfile& profile,
                                              const std::string& prompt,
                                              const std::optional<std::string>& resume_id,
                                              const std::shared_ptr<std::atomic_bool>& cancel,
                                              TurnState& state) {
    LineCommandRequest command;
    command.spawn.argv = build_one_shot_argv(profile, request.run_config, resume_id, prompt);
    command.spawn.working_directory = request.worktree_path;
    command.timeout_ms = config_.turn_timeout_ms;
    command.cancel_token = cancel;

    std::optional<EngineError> failure;
    auto ran = run_line_command(command, [&](const std::string& line) {
        auto parsed = protocol::parse_event_line(line);
        if (is_error(parsed)) {
            failure = get_error(parsed);
            return false;
        }
        auto event = core::errors::take_value(parsed);
        if (!event.has_value()) {
            return true;
        }
        auto handled = handle_event(request.key, std::move(*event), state);
        if (is_error(handled)) {
            failure = get_error(handled);
            return false;
        }
        return !state.stop;
    });
    if (is_error(ran)) {
        return get_error(ran);
    }
    if (failure.has_value()) {
        return *failure;
    }

    const LineCommandOutcome& outcome = core::errors::get_value(ran);
    if (outcome.timed_out) {
        return EngineError{ErrorCategory::Process,
                           "agent turn timed out after " +
                               std::to_string(config_.turn_timeout_ms) + " ms",
                           core::errors::codes::kTurnTimeout};
    }
    if (outcome.exit_code != 0 && !outcome.cancelled && !outcome.stopped) {
        TURNLOOM_LOG_WARN("TurnRunner: " + protocol::to_string(request.key) +
                          " agent exited with code " + std::to_string(outcome.exit_code));
    }
    return core::errors::ok();
}

core::errors::Status TurnRunner::handle_event(const ThreadKey& key, ThreadEvent event,
                                              TurnState& state) {
    if (const auto* error = std::get_if<protocol::StreamError>(&event)) {
        if (is_transient_reconnect_notice(error->message)) {
            ++state.transient_errors;
            const std::string message = error->message;
            event = protocol::ItemCompleted{protocol::ErrorItem{
                "transient-error-" + std::to_string(state.transient_errors), message}};
        }
    }
    event = qualify_event(state.scope_id, std::move(event));

    (*state.on_event)(event);

    if (const protocol::AgentItem* item = protocol::event_item(event)) {
        if (protocol::is_agent_message(*item)) {
            state.saw_agent_message = true;
        }
    }

    if (const auto* started = std::get_if<protocol::ThreadStarted>(&event)) {
        auto stored = store_.set_remote_thread_id(key, started->thread_id);
        if (is_error(stored)) {
            return get_error(stored);
        }
        return core::errors::ok();
    }
    if (const auto* completed = std::get_if<protocol::ItemCompleted>(&event)) {
        if (!state.recorded_items.insert(protocol::item_id(completed->item)).second) {
            return core::errors::ok();
        }
        auto appended = store_.append_entries(key, {protocol::make_item_entry(completed->item)});
        if (is_error(appended)) {
            return get_error(appended);
        }
        return core::errors::ok();
    }
    if (const auto* turn = std::get_if<protocol::TurnCompleted>(&event)) {
        auto usage = append(key, protocol::TurnUsageRecord{turn->usage});
        if (is_error(usage)) {
            return usage;
        }
        return record_duration(key, state);
    }

    std::optional<std::string> failure;
    if (const auto* failed = std::get_if<protocol::TurnFailed>(&event)) {
        failure = failed->message;
    } else if (const auto* error = std::get_if<protocol::StreamError>(&event)) {
        failure = error->message;
    }
    if (!failure.has_value()) {
        return core::errors::ok();
    }

    if (!state.turn_error.has_value()) {
        state.turn_error = *failure;
    }
    state.stop = true;
    auto recorded = append(key, protocol::TurnErrorRecord{*failure});
    if (is_error(recorded)) {
        return recorded;
    }
    state.error_recorded = true;
    return record_duration(key, state);
}

core::errors::Status TurnRunner::record_duration(const ThreadKey& key, TurnState& state) {
    if (state.duration_recorded) {
        return core::errors::ok();
    }
    state.duration_recorded = true;
    const auto duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - state.started)
            .count());
    auto appended = append(key, protocol::TurnDurationRecord{duration_ms});
    if (is_error(appended)) {
        return appended;
    }
    (*state.on_event)(protocol::TurnDuration{duration_ms});
    return core::errors::ok();
}

core::errors::Status TurnRunner::append(const ThreadKey& key, protocol::AgentEvent event) {
    auto appended = store_.append_entries(key, {protocol::make_agent_entry(std::move(event))});
    if (is_error(appended)) {
        return get_error(appended);
    }
    return core::errors::ok();
}

}  // namespace turnloom::runtime
