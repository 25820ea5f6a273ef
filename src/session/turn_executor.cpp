#include "session/turn_executor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace turnloom::session {

RunnerTurnExecutor::RunnerTurnExecutor(runtime::TurnRunner& runner) : runner_(runner) {}

RunnerTurnExecutor::~RunnerTurnExecutor() {
    wait_idle();
}

void RunnerTurnExecutor::start(const TurnLaunch& launch, std::shared_ptr<std::atomic_bool> cancel,
                               TurnEventSink on_event, TurnFinishSink on_finish) {
    runtime::TurnRequest request;
    request.key = launch.key;
    request.worktree_path = launch.worktree_path;
    request.prompt = launch.prompt.text;
    request.attachments = launch.prompt.attachments;
    request.run_config = launch.prompt.run_config;
    request.remote_thread_id = launch.remote_thread_id;
    request.extra_dirs = launch.extra_dirs;

    auto done = std::make_shared<std::atomic_bool>(false);
    std::lock_guard<std::mutex> lock(mutex_);
    join_finished_locked();
    std::thread thread([this, request = std::move(request), cancel = std::move(cancel),
                        on_event = std::move(on_event), on_finish = std::move(on_finish),
                        done]() {
        auto result = runner_.run(request, cancel, on_event);
        TurnFinish finish;
        if (core::errors::is_error(result)) {
            finish.kind = FinishKind::Failed;
            finish.message = core::errors::get_error(result).message;
        } else if (core::errors::get_value(result) == runtime::TurnOutcome::Canceled) {
            finish.kind = FinishKind::Canceled;
        }
        on_finish(finish);
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
}

void RunnerTurnExecutor::join_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load() && it->thread.joinable()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void RunnerTurnExecutor::wait_idle() {
    while (true) {
        Worker worker;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (workers_.empty()) {
                return;
            }
            worker = std::move(workers_.front());
            workers_.erase(workers_.begin());
        }
        if (worker.thread.joinable()) {
            if (worker.thread.get_id() == std::this_thread::get_id()) {
                TURNLOOM_LOG_WARN("TurnExecutor: wait_idle called from a turn thread");
                worker.thread.detach();
                continue;
            }
            worker.thread.join();
        }
    }
}

}  // namespace turnloom::session
