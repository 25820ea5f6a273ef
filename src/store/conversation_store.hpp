#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sqlite3.h>
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_key.hpp"
#include "store/store_types.hpp"

namespace turnloom::store {

// Durable conversation log. A single worker thread owns the SQLite connection;
// every public call is queued to it and blocks until the worker replies.
class ConversationStore {
public:
    static core::errors::Result<std::unique_ptr<ConversationStore>> open(const std::string& path);

    ConversationStore(const ConversationStore&) = delete;
    ConversationStore& operator=(const ConversationStore&) = delete;
    ~ConversationStore();

    // Runs queued commands to completion, then closes the connection. Later calls
    // fail with store_closed.
    void close();

    const std::string& path() const { return path_; }

    core::errors::Result<bool> ensure_thread(const protocol::ThreadKey& key);
    core::errors::Result<std::size_t> append_entries(
        const protocol::ThreadKey& key, std::vector<protocol::ConversationEntry> entries);
    core::errors::Status replace_entries(const protocol::ThreadKey& key,
                                         std::vector<protocol::ConversationEntry> entries);
    core::errors::Result<EntryPage> load_page(const protocol::ThreadKey& key,
                                              std::optional<std::uint64_t> before_seq,
                                              std::uint64_t limit);
    core::errors::Result<ConversationSnapshot> load_conversation(const protocol::ThreadKey& key);
    core::errors::Result<bool> update_title_if_matches(const protocol::ThreadKey& key,
                                                       std::string expected_current,
                                                       std::string new_title);
    core::errors::Result<std::optional<std::string>> get_remote_thread_id(
        const protocol::ThreadKey& key);
    core::errors::Result<bool> set_remote_thread_id(const protocol::ThreadKey& key,
                                                    std::string remote_thread_id);
    core::errors::Status save_queue_state(const protocol::ThreadKey& key, QueueState state);
    core::errors::Result<QueueState> load_queue_state(const protocol::ThreadKey& key);
    core::errors::Status save_run_config(const protocol::ThreadKey& key,
                                         protocol::AgentRunConfig config);
    core::errors::Result<bool> set_task_status(const protocol::ThreadKey& key,
                                               protocol::TaskStatus status);
    core::errors::Result<std::vector<ThreadSummary>> list_threads(std::string project_slug,
                                                                  std::string workspace_name);
    core::errors::Result<std::size_t> delete_workspace(std::string project_slug,
                                                       std::string workspace_name);

private:
    ConversationStore(sqlite3* db, std::string path);

    template <typename T>
    core::errors::Result<T> submit(std::function<core::errors::Result<T>(sqlite3*)> command);

    void worker_loop();

    sqlite3* db_ = nullptr;
    std::string path_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> commands_;
    bool closing_ = false;
    std::thread worker_;
};

template <typename T>
core::errors::Result<T> ConversationStore::submit(
    std::function<core::errors::Result<T>(sqlite3*)> command) {
    auto reply = std::make_shared<std::promise<core::errors::Result<T>>>();
    auto future = reply->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return core::errors::EngineError{core::errors::ErrorCategory::Storage,
                                             "Conversation store is closed.",
                                             core::errors::codes::kStoreClosed};
        }
        commands_.emplace_back([this, reply, command = std::move(command)]() {
            reply->set_value(command(db_));
        });
    }
    cv_.notify_one();
    return future.get();
}

}  // namespace turnloom::store
