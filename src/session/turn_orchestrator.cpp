#include "session/turn_orchestrator.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/overloaded.hpp"

namespace turnloom::session {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using core::errors::get_error;
using core::errors::is_error;
using protocol::ThreadKey;

TurnOrchestrator::TurnOrchestrator(store::ConversationStore& store, TurnExecutor& executor)
    : store_(store), executor_(executor) {}

TurnOrchestrator::~TurnOrchestrator() {
    executor_.wait_idle();
}

void TurnOrchestrator::set_observer(TurnObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

core::errors::Result<TurnOrchestrator::ThreadSlot*> TurnOrchestrator::slot_for(
    const ThreadKey& key, std::unique_lock<std::mutex>& lock, PendingWork& work) {
    auto it = threads_.find(key);
    if (it != threads_.end()) {
        return it->second.get();
    }

    lock.unlock();
    auto ensured = store_.ensure_thread(key);
    auto loaded = is_error(ensured)
                      ? core::errors::Result<store::ConversationSnapshot>(get_error(ensured))
                      : store_.load_conversation(key);
    lock.lock();
    if (is_error(loaded)) {
        return get_error(loaded);
    }

    // Another caller may have loaded the thread while the lock was released.
    it = threads_.find(key);
    if (it != threads_.end()) {
        return it->second.get();
    }
    auto slot = std::make_unique<ThreadSlot>(key);
    const Effects restored = slot->machine.restore(core::errors::get_value(loaded));
    TURNLOOM_LOG_DEBUG("Orchestrator: loaded " + protocol::to_string(key) + " with " +
                       std::to_string(slot->machine.queue().size()) + " queued prompts");
    ThreadSlot* raw = slot.get();
    threads_.emplace(key, std::move(slot));
    apply_effects_locked(*raw, restored, work);
    return raw;
}

void TurnOrchestrator::apply_effects_locked(ThreadSlot& slot, const Effects& effects,
                                            PendingWork& work) {
    const ThreadKey& key = slot.machine.key();
    for (const auto& effect : effects) {
        std::visit(
            protocol::overloaded{
                [&](const StartTurn& start) {
                    slot.cancel_flag = std::make_shared<std::atomic_bool>(false);
                    TurnLaunch launch;
                    launch.key = key;
                    launch.run_id = start.run_id;
                    launch.prompt = start.prompt;
                    launch.worktree_path = slot.worktree_path;
                    launch.remote_thread_id = slot.machine.remote_thread_id();
                    launch.extra_dirs = slot.extra_dirs;
                    work.launches.push_back(PendingLaunch{std::move(launch), slot.cancel_flag});
                },
                [&](const CancelTurn& cancel) {
                    if (slot.cancel_flag) {
                        slot.cancel_flag->store(true);
                        slot.cancel_flag.reset();
                    }
                    TURNLOOM_LOG_INFO("Orchestrator: cancel requested for run " +
                                      std::to_string(cancel.run_id) + " of " +
                                      protocol::to_string(key));
                },
                [&](const PersistQueue&) {
                    work.persists.push_back(PendingPersist{key, ++slot.queue_version,
                                                           slot.machine.queue_state()});
                },
            },
            effect);
    }
}

core::errors::Status TurnOrchestrator::finish_work(PendingWork& work) {
    std::optional<EngineError> persist_error;
    if (!work.persists.empty()) {
        std::lock_guard<std::mutex> lock(persist_mutex_);
        for (const auto& pending : work.persists) {
            std::uint64_t& written = persisted_versions_[pending.key];
            if (pending.version <= written) {
                continue;
            }
            auto saved = store_.save_queue_state(pending.key, pending.state);
            if (is_error(saved)) {
                const auto& error = get_error(saved);
                TURNLOOM_LOG_ERROR("Orchestrator: unable to persist queue of " +
                                   protocol::to_string(pending.key) + " [" + error.code +
                                   "]: " + error.message);
                persist_error = error;
                continue;
            }
            written = pending.version;
        }
    }

    for (auto& pending : work.launches) {
        const ThreadKey key = pending.launch.key;
        const std::uint64_t run_id = pending.launch.run_id;
        TURNLOOM_LOG_INFO("Orchestrator: starting run " + std::to_string(run_id) + " of " +
                          protocol::to_string(key));
        executor_.start(
            pending.launch, pending.cancel,
            [this, key, run_id](const protocol::ThreadEvent& event) {
                on_turn_event(key, run_id, event);
            },
            [this, key, run_id](const TurnFinish& finish) { on_turn_finish(key, run_id, finish); });
    }
    if (persist_error.has_value()) {
        return *persist_error;
    }
    return core::errors::ok();
}

core::errors::Status TurnOrchestrator::mutate(
    const ThreadKey& key,
    const std::function<core::errors::Result<Effects>(ThreadStateMachine&)>& fn) {
    PendingWork work;
    std::optional<EngineError> failure;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = slot_for(key, lock, work);
        if (is_error(slot)) {
            failure = get_error(slot);
        } else {
            ThreadSlot& target = *core::errors::get_value(slot);
            auto effects = fn(target.machine);
            if (is_error(effects)) {
                failure = get_error(effects);
            } else {
                apply_effects_locked(target, core::errors::get_value(effects), work);
            }
        }
    }
    auto finished = finish_work(work);
    if (failure.has_value()) {
        return *failure;
    }
    return finished;
}

core::errors::Status TurnOrchestrator::submit(const ThreadKey& key, SubmitRequest request) {
    if (request.text.empty() && request.attachments.empty()) {
        return EngineError{ErrorCategory::Input, "Cannot submit an empty prompt.",
                           core::errors::codes::kInvalidArgument};
    }

    PendingWork work;
    const protocol::AgentRunConfig run_config = request.run_config;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = slot_for(key, lock, work);
        if (is_error(slot)) {
            lock.unlock();
            static_cast<void>(finish_work(work));
            return get_error(slot);
        }
        ThreadSlot& target = *core::errors::get_value(slot);
        target.worktree_path = std::move(request.worktree_path);
        target.extra_dirs = std::move(request.extra_dirs);
        const Effects effects =
            target.machine.submit(std::move(request.text), std::move(request.attachments),
                                  std::move(request.run_config));
        apply_effects_locked(target, effects, work);
    }

    // The thread row exists once slot_for succeeded.
    auto saved = store_.save_run_config(key, run_config);
    auto finished = finish_work(work);
    if (is_error(saved)) {
        TURNLOOM_LOG_ERROR("Orchestrator: unable to save run config of " +
                           protocol::to_string(key) + ": " + get_error(saved).message);
        return saved;
    }
    return finished;
}

core::errors::Result<bool> TurnOrchestrator::cancel(const ThreadKey& key) {
    bool canceled = false;
    auto done = mutate(key, [&canceled](ThreadStateMachine& machine) -> core::errors::Result<Effects> {
        if (!machine.active_run_id().has_value()) {
            return Effects{};
        }
        canceled = true;
        return machine.cancel(*machine.active_run_id());
    });
    if (is_error(done)) {
        return get_error(done);
    }
    return canceled;
}

core::errors::Result<bool> TurnOrchestrator::cancel_run(const ThreadKey& key,
                                                        const std::uint64_t run_id) {
    bool canceled = false;
    auto done = mutate(key, [&canceled, run_id](ThreadStateMachine& machine)
                                -> core::errors::Result<Effects> {
        canceled = machine.is_active_run(run_id);
        return machine.cancel(run_id);
    });
    if (is_error(done)) {
        return get_error(done);
    }
    return canceled;
}

core::errors::Status TurnOrchestrator::resume(const ThreadKey& key) {
    return mutate(key, [](ThreadStateMachine& machine) -> core::errors::Result<Effects> {
        return machine.resume();
    });
}

core::errors::Status TurnOrchestrator::remove_queued(const ThreadKey& key,
                                                     const std::uint64_t prompt_id) {
    return mutate(key, [prompt_id](ThreadStateMachine& machine) {
        return machine.remove_queued(prompt_id);
    });
}

core::errors::Status TurnOrchestrator::update_queued(const ThreadKey& key,
                                                     const std::uint64_t prompt_id,
                                                     std::string text) {
    return mutate(key, [prompt_id, &text](ThreadStateMachine& machine) {
        return machine.update_queued(prompt_id, std::move(text));
    });
}

core::errors::Status TurnOrchestrator::move_queued(const ThreadKey& key,
                                                   const std::uint64_t prompt_id,
                                                   const std::size_t index) {
    return mutate(key, [prompt_id, index](ThreadStateMachine& machine) {
        return machine.move_queued(prompt_id, index);
    });
}

core::errors::Status TurnOrchestrator::clear_queue(const ThreadKey& key) {
    return mutate(key, [](ThreadStateMachine& machine) -> core::errors::Result<Effects> {
        return machine.clear_queue();
    });
}

core::errors::Result<bool> TurnOrchestrator::refresh(const ThreadKey& key) {
    PendingWork work;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = slot_for(key, lock, work);
        if (is_error(slot)) {
            lock.unlock();
            static_cast<void>(finish_work(work));
            return get_error(slot);
        }
    }
    static_cast<void>(finish_work(work));

    auto loaded = store_.load_conversation(key);
    if (is_error(loaded)) {
        return get_error(loaded);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.at(key)->machine.reconcile(core::errors::get_value(loaded).entries);
}

core::errors::Result<ThreadView> TurnOrchestrator::view(const ThreadKey& key) {
    PendingWork work;
    ThreadView view;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto slot = slot_for(key, lock, work);
        if (is_error(slot)) {
            lock.unlock();
            static_cast<void>(finish_work(work));
            return get_error(slot);
        }
        const ThreadStateMachine& machine = core::errors::get_value(slot)->machine;
        view.phase = machine.phase();
        view.active_run_id = machine.active_run_id();
        view.queue.assign(machine.queue().begin(), machine.queue().end());
        view.entries = machine.entries();
    }
    // A restored interrupted run leaves a paused queue to persist.
    static_cast<void>(finish_work(work));
    return view;
}

void TurnOrchestrator::wait_idle() {
    executor_.wait_idle();
}

void TurnOrchestrator::on_turn_event(const ThreadKey& key, const std::uint64_t run_id,
                                     const protocol::ThreadEvent& event) {
    PendingWork work;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = threads_.find(key);
        if (it == threads_.end() || !it->second->machine.is_active_run(run_id)) {
            TURNLOOM_LOG_DEBUG("Orchestrator: dropped stale " + protocol::event_type(event) +
                               " from run " + std::to_string(run_id) + " of " +
                               protocol::to_string(key));
            return;
        }
        ThreadSlot& slot = *it->second;
        apply_effects_locked(slot, slot.machine.apply_event(run_id, event), work);
    }

    TurnObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(key, run_id, event);
    }
    static_cast<void>(finish_work(work));
}

void TurnOrchestrator::on_turn_finish(const ThreadKey& key, const std::uint64_t run_id,
                                      const TurnFinish& finish) {
    PendingWork work;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = threads_.find(key);
        if (it == threads_.end()) {
            return;
        }
        ThreadSlot& slot = *it->second;
        if (slot.machine.is_active_run(run_id)) {
            slot.cancel_flag.reset();
        }
        apply_effects_locked(slot, slot.machine.finish(run_id, finish), work);
    }
    // Persistence failures were already logged where they happened.
    static_cast<void>(finish_work(work));
}

}  // namespace turnloom::session
