#include "store/conversation_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "store/conversation_queries.hpp"
#include "store/schema_migrations.hpp"
#include "store/sqlite_support.hpp"

namespace turnloom::store {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using core::errors::is_error;
using core::errors::Result;
using core::errors::Status;
using protocol::ThreadKey;

namespace {

constexpr const char* kConnectionPragmas =
    "PRAGMA journal_mode=WAL;"
    "PRAGMA synchronous=NORMAL;"
    "PRAGMA foreign_keys=ON;"
    "PRAGMA busy_timeout=5000;";

}  // namespace

Result<std::unique_ptr<ConversationStore>> ConversationStore::open(const std::string& path) {
    const std::filesystem::path db_path(path);
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            return EngineError{ErrorCategory::Storage,
                               "Unable to create database directory: " + ec.message(),
                               core::errors::codes::kSqliteError,
                               db_path.parent_path().string()};
        }
    }

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        EngineError error = sqlite_error(db, "Unable to open database " + path);
        sqlite3_close(db);
        return error;
    }

    auto configured = exec_sql(db, kConnectionPragmas);
    if (is_error(configured)) {
        sqlite3_close(db);
        return core::errors::get_error(configured);
    }
    auto migrated = migrate(db);
    if (is_error(migrated)) {
        sqlite3_close(db);
        return core::errors::get_error(migrated);
    }

    TURNLOOM_LOG_INFO("Store: opened " + path);
    return std::unique_ptr<ConversationStore>(new ConversationStore(db, path));
}

ConversationStore::ConversationStore(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {
    worker_ = std::thread([this]() { worker_loop(); });
}

ConversationStore::~ConversationStore() {
    close();
}

void ConversationStore::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (db_ != nullptr) {
        if (sqlite3_close(db_) != SQLITE_OK) {
            TURNLOOM_LOG_WARN("Store: close reported " + std::string(sqlite3_errmsg(db_)));
        }
        db_ = nullptr;
    }
    TURNLOOM_LOG_DEBUG("Store: closed " + path_);
}

void ConversationStore::worker_loop() {
    while (true) {
        std::function<void()> command;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return closing_ || !commands_.empty(); });
            if (commands_.empty()) {
                return;
            }
            command = std::move(commands_.front());
            commands_.pop_front();
        }
        command();
    }
}

Result<bool> ConversationStore::ensure_thread(const ThreadKey& key) {
    return submit<bool>([key](sqlite3* db) { return queries::ensure_thread(db, key); });
}

Result<std::size_t> ConversationStore::append_entries(
    const ThreadKey& key, std::vector<protocol::ConversationEntry> entries) {
    return submit<std::size_t>([key, entries = std::move(entries)](sqlite3* db) {
        return queries::append_entries(db, key, entries);
    });
}

Status ConversationStore::replace_entries(const ThreadKey& key,
                                          std::vector<protocol::ConversationEntry> entries) {
    return submit<std::monostate>([key, entries = std::move(entries)](sqlite3* db) {
        return queries::replace_entries(db, key, entries);
    });
}

Result<EntryPage> ConversationStore::load_page(const ThreadKey& key,
                                               std::optional<std::uint64_t> before_seq,
                                               std::uint64_t limit) {
    return submit<EntryPage>([key, before_seq, limit](sqlite3* db) {
        return queries::load_page(db, key, before_seq, limit);
    });
}

Result<ConversationSnapshot> ConversationStore::load_conversation(const ThreadKey& key) {
    return submit<ConversationSnapshot>(
        [key](sqlite3* db) { return queries::load_conversation(db, key); });
}

Result<bool> ConversationStore::update_title_if_matches(const ThreadKey& key,
                                                        std::string expected_current,
                                                        std::string new_title) {
    return submit<bool>([key, expected = std::move(expected_current),
                         title = std::move(new_title)](sqlite3* db) {
        return queries::update_title_if_matches(db, key, expected, title);
    });
}

Result<std::optional<std::string>> ConversationStore::get_remote_thread_id(const ThreadKey& key) {
    return submit<std::optional<std::string>>(
        [key](sqlite3* db) { return queries::get_remote_thread_id(db, key); });
}

Result<bool> ConversationStore::set_remote_thread_id(const ThreadKey& key,
                                                     std::string remote_thread_id) {
    return submit<bool>([key, id = std::move(remote_thread_id)](sqlite3* db) {
        return queries::set_remote_thread_id(db, key, id);
    });
}

Status ConversationStore::save_queue_state(const ThreadKey& key, QueueState state) {
    return submit<std::monostate>([key, state = std::move(state)](sqlite3* db) {
        return queries::save_queue_state(db, key, state);
    });
}

Result<QueueState> ConversationStore::load_queue_state(const ThreadKey& key) {
    return submit<QueueState>([key](sqlite3* db) { return queries::load_queue_state(db, key); });
}

Status ConversationStore::save_run_config(const ThreadKey& key, protocol::AgentRunConfig config) {
    return submit<std::monostate>([key, config = std::move(config)](sqlite3* db) {
        return queries::save_run_config(db, key, config);
    });
}

Result<bool> ConversationStore::set_task_status(const ThreadKey& key,
                                                const protocol::TaskStatus status) {
    return submit<bool>(
        [key, status](sqlite3* db) { return queries::set_task_status(db, key, status); });
}

Result<std::vector<ThreadSummary>> ConversationStore::list_threads(std::string project_slug,
                                                                   std::string workspace_name) {
    return submit<std::vector<ThreadSummary>>(
        [project = std::move(project_slug), workspace = std::move(workspace_name)](sqlite3* db) {
            return queries::list_threads(db, project, workspace);
        });
}

Result<std::size_t> ConversationStore::delete_workspace(std::string project_slug,
                                                        std::string workspace_name) {
    return submit<std::size_t>(
        [project = std::move(project_slug), workspace = std::move(workspace_name)](sqlite3* db) {
            return queries::delete_workspace(db, project, workspace);
        });
}

}  // namespace turnloom::store
