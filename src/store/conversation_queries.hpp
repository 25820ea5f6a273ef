#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "core/errors/engine_errors.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"
#include "protocol/thread_key.hpp"
#include "store/store_types.hpp"

// Statements against an open connection. Called only from the store's worker thread.
namespace turnloom::store::queries {

    core::errors::Result<bool> ensure_thread(sqlite3* db, const protocol::ThreadKey& key);

    core::errors::Result<std::size_t> append_entries(
        sqlite3* db, const protocol::ThreadKey& key,
        const std::vector<protocol::ConversationEntry>& entries);

    core::errors::Status replace_entries(sqlite3* db, const protocol::ThreadKey& key,
                                         const std::vector<protocol::ConversationEntry>& entries);

    core::errors::Result<EntryPage> load_page(sqlite3* db, const protocol::ThreadKey& key,
                                              std::optional<std::uint64_t> before_seq,
                                              std::uint64_t limit);

    core::errors::Result<ConversationSnapshot> load_conversation(sqlite3* db,
                                                                 const protocol::ThreadKey& key);

    core::errors::Result<bool> update_title_if_matches(sqlite3* db, const protocol::ThreadKey& key,
                                                       const std::string& expected_current,
                                                       const std::string& new_title);

    core::errors::Result<std::optional<std::string>> get_remote_thread_id(
        sqlite3* db, const protocol::ThreadKey& key);

    core::errors::Result<bool> set_remote_thread_id(sqlite3* db, const protocol::ThreadKey& key,
                                                    const std::string& remote_thread_id);

    core::errors::Status save_queue_state(sqlite3* db, const protocol::ThreadKey& key,
                                          const QueueState& state);

    core::errors::Result<QueueState> load_queue_state(sqlite3* db, const protocol::ThreadKey& key);

    core::errors::Status save_run_config(sqlite3* db, const protocol::ThreadKey& key,
                                         const protocol::AgentRunConfig& config);

    core::errors::Result<bool> set_task_status(sqlite3* db, const protocol::ThreadKey& key,
                                               protocol::TaskStatus status);

    core::errors::Result<std::vector<ThreadSummary>> list_threads(sqlite3* db,
                                                                  const std::string& project_slug,
                                                                  const std::string& workspace_name);

    core::errors::Result<std::size_t> delete_workspace(sqlite3* db,
                                                       const std::string& project_slug,
                                                       const std::string& workspace_name);

} // namespace turnloom::store::queries
