#include "runtime/process_pool.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/agent_launch.hpp"

namespace turnloom::runtime {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using protocol::ThreadKey;

namespace {

EngineError process_not_found(const ThreadKey& key) {
    return EngineError{ErrorCategory::Process,
                       "No agent process for " + protocol::to_string(key) + ".",
                       core::errors::codes::kProcessNotFound,
                       "Call ensure() before sending a prompt."};
}

}  // namespace

ProcessPool::ProcessPool(core::config::LaunchProfile profile) : profile_(std::move(profile)) {}

ProcessPool::~ProcessPool() {
    shutdown_all();
}

core::errors::Result<std::shared_ptr<PersistentProcess>> ProcessPool::spawn(
    const ThreadKey& key, const SpawnParams& params) const {
    SpawnOptions options;
    options.argv = build_persistent_argv(profile_, params.resume_id, params.extra_dirs);
    options.working_directory = params.workdir;
    auto started = PersistentProcess::start(key, options);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    return std::shared_ptr<PersistentProcess>(core::errors::take_value(started));
}

core::errors::Result<std::shared_ptr<PersistentProcess>> ProcessPool::respawn(
    const ThreadKey& key, const std::shared_ptr<PersistentProcess>& dead,
    const SpawnParams& params) {
    TURNLOOM_LOG_WARN("ProcessPool: process for " + protocol::to_string(key) +
                      " exited, respawning once" +
                      (params.resume_id.has_value() ? " resuming " + *params.resume_id
                                                    : std::string()));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(key);
        if (it != processes_.end() && it->second.process == dead) {
            processes_.erase(it);
        }
    }
    dead->shutdown();

    auto spawned = spawn(key, params);
    if (core::errors::is_error(spawned)) {
        TURNLOOM_LOG_ERROR("ProcessPool: respawn for " + protocol::to_string(key) + " failed: " +
                           core::errors::get_error(spawned).message);
        return core::errors::get_error(spawned);
    }
    auto process = core::errors::get_value(spawned);
    std::lock_guard<std::mutex> lock(mutex_);
    processes_[key] = Entry{process, params};
    return process;
}

core::errors::Status ProcessPool::ensure(const ThreadKey& key,
                                         const std::filesystem::path& workdir,
                                         const std::optional<std::string>& resume_id,
                                         const std::vector<std::string>& extra_dirs) {
    const SpawnParams params{workdir, resume_id, extra_dirs};
    std::shared_ptr<PersistentProcess> existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(key);
        if (it != processes_.end()) {
            existing = it->second.process;
            // A later respawn from send() launches with the latest arguments.
            it->second.params = params;
        }
    }

    if (existing) {
        if (existing->is_alive()) {
            return core::errors::ok();
        }
        auto recovered = respawn(key, existing, params);
        if (core::errors::is_error(recovered)) {
            return core::errors::get_error(recovered);
        }
        return core::errors::ok();
    }

    auto spawned = spawn(key, params);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }

    std::shared_ptr<PersistentProcess> redundant;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto inserted = processes_.emplace(key, Entry{core::errors::get_value(spawned), params});
        if (!inserted.second) {
            // Another caller won the race; keep its process.
            redundant = core::errors::get_value(spawned);
        }
    }
    if (redundant) {
        redundant->shutdown();
    }
    return core::errors::ok();
}

core::errors::Status ProcessPool::send(const ThreadKey& key, const std::string& prompt) {
    std::optional<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(key);
        if (it != processes_.end()) {
            entry = it->second;
        }
    }
    if (!entry.has_value()) {
        return process_not_found(key);
    }

    std::shared_ptr<PersistentProcess> process = entry->process;
    if (!process->is_alive()) {
        auto recovered = respawn(key, process, entry->params);
        if (core::errors::is_error(recovered)) {
            return core::errors::get_error(recovered);
        }
        process = core::errors::get_value(recovered);
    }
    return process->send_prompt(prompt);
}

core::errors::Result<PollResult> ProcessPool::poll(const ThreadKey& key) {
    std::shared_ptr<PersistentProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(key);
        if (it == processes_.end()) {
            return process_not_found(key);
        }
        process = it->second.process;
    }
    return process->poll();
}

void ProcessPool::shutdown(const ThreadKey& key) {
    std::shared_ptr<PersistentProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = processes_.find(key);
        if (it == processes_.end()) {
            return;
        }
        process = std::move(it->second.process);
        processes_.erase(it);
    }
    process->shutdown();
    TURNLOOM_LOG_INFO("ProcessPool: shut down process for " + protocol::to_string(key));
}

void ProcessPool::shutdown_all_for(const std::string& project_slug,
                                   const std::string& workspace_name) {
    std::vector<std::shared_ptr<PersistentProcess>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = processes_.begin(); it != processes_.end();) {
            if (it->first.project_slug == project_slug &&
                it->first.workspace_name == workspace_name) {
                victims.push_back(std::move(it->second.process));
                it = processes_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& process : victims) {
        process->shutdown();
    }
    if (!victims.empty()) {
        TURNLOOM_LOG_INFO("ProcessPool: shut down " + std::to_string(victims.size()) +
                          " processes of " + project_slug + "/" + workspace_name);
    }
}

void ProcessPool::shutdown_all() {
    std::vector<std::shared_ptr<PersistentProcess>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : processes_) {
            victims.push_back(std::move(entry.second.process));
        }
        processes_.clear();
    }
    for (auto& process : victims) {
        process->shutdown();
    }
}

bool ProcessPool::contains(const ThreadKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.find(key) != processes_.end();
}

std::size_t ProcessPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return processes_.size();
}

}  // namespace turnloom::runtime
