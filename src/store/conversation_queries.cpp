#include "store/conversation_queries.hpp"

#include <algorithm>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "store/sqlite_support.hpp"

namespace turnloom::store::queries {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using core::errors::get_error;
using core::errors::get_value;
using core::errors::is_error;
using core::errors::take_value;
using nlohmann::json;
using protocol::ConversationEntry;
using protocol::ThreadKey;

namespace {

const std::string kKeyWhere =
    " project_slug = ?1 AND workspace_name = ?2 AND thread_local_id = ?3";

EngineError not_found(const ThreadKey& key) {
    return EngineError{ErrorCategory::Input, "Conversation not found: " + protocol::to_string(key),
                       core::errors::codes::kConversationNotFound};
}

core::errors::Result<Statement> prepare_for_key(sqlite3* db, const std::string& sql,
                                                const ThreadKey& key) {
    auto prepared = Statement::prepare(db, sql);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(1, key.project_slug);
    stmt.bind_text(2, key.workspace_name);
    stmt.bind_int64(3, static_cast<std::int64_t>(key.thread_local_id));
    return std::move(stmt);
}

// Single-row, single-column integer query.
core::errors::Result<std::int64_t> query_int64(sqlite3* db, const std::string& sql,
                                               const ThreadKey& key) {
    auto prepared = prepare_for_key(db, sql, key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    auto stepped = stmt.step();
    if (is_error(stepped)) {
        return get_error(stepped);
    }
    if (!get_value(stepped)) {
        return std::int64_t{0};
    }
    return stmt.column_int64(0);
}

core::errors::Result<bool> thread_exists(sqlite3* db, const ThreadKey& key) {
    auto count = query_int64(db, "SELECT COUNT(*) FROM conversations WHERE" + kKeyWhere, key);
    if (is_error(count)) {
        return get_error(count);
    }
    return get_value(count) > 0;
}

core::errors::Status require_thread(sqlite3* db, const ThreadKey& key) {
    auto exists = thread_exists(db, key);
    if (is_error(exists)) {
        return get_error(exists);
    }
    if (!get_value(exists)) {
        return not_found(key);
    }
    return core::errors::ok();
}

core::errors::Status touch_thread(sqlite3* db, const ThreadKey& key) {
    auto prepared =
        prepare_for_key(db, "UPDATE conversations SET updated_at = ?4 WHERE" + kKeyWhere, key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_int64(4, core::config::now_unix_seconds());
    return stmt.run();
}

core::errors::Result<ConversationEntry> decode_entry(const std::string& payload_json) {
    const json parsed = json::parse(payload_json, nullptr, false);
    if (parsed.is_discarded()) {
        return EngineError{ErrorCategory::Storage, "Stored conversation entry is not valid JSON.",
                           core::errors::codes::kMalformedEntry};
    }
    return protocol::entry_from_json(parsed);
}

// Reads column 0 of every row as an entry payload.
core::errors::Result<std::vector<ConversationEntry>> read_entries(Statement& stmt) {
    std::vector<ConversationEntry> entries;
    while (true) {
        auto stepped = stmt.step();
        if (is_error(stepped)) {
            return get_error(stepped);
        }
        if (!get_value(stepped)) {
            break;
        }
        auto entry = decode_entry(stmt.column_text(0));
        if (is_error(entry)) {
            return get_error(entry);
        }
        entries.push_back(take_value(entry));
    }
    return entries;
}

// Next "e_<n>" id, n >= candidate, not yet used in the thread. Rows kept by
// replace_entries hold their ids, so the id matching the next seq may already be taken.
core::errors::Result<std::string> next_free_entry_id(Statement& lookup, const ThreadKey& key,
                                                     std::int64_t& candidate) {
    while (true) {
        const std::string id = "e_" + std::to_string(candidate);
        lookup.reset();
        lookup.bind_text(1, key.project_slug);
        lookup.bind_text(2, key.workspace_name);
        lookup.bind_int64(3, static_cast<std::int64_t>(key.thread_local_id));
        lookup.bind_text(4, id);
        auto taken = lookup.step();
        if (is_error(taken)) {
            return get_error(taken);
        }
        ++candidate;
        if (!get_value(taken)) {
            return id;
        }
    }
}

// Inserts entries after the current tail. Entries whose (kind, item_id) or caller-supplied
// entry_id already exist are skipped without consuming a sequence number. Caller holds a
// transaction.
core::errors::Result<std::size_t> insert_entries(sqlite3* db, const ThreadKey& key,
                                                 const std::vector<ConversationEntry>& entries) {
    auto max_seq = query_int64(
        db, "SELECT COALESCE(MAX(seq), 0) FROM conversation_entries WHERE" + kKeyWhere, key);
    if (is_error(max_seq)) {
        return get_error(max_seq);
    }
    std::int64_t next_seq = get_value(max_seq) + 1;

    auto placeholder = query_int64(
        db,
        "SELECT COUNT(*) FROM conversations WHERE" + kKeyWhere +
            " AND (title IS NULL OR title LIKE 'Thread %')",
        key);
    if (is_error(placeholder)) {
        return get_error(placeholder);
    }
    bool title_is_placeholder = get_value(placeholder) > 0;

    auto prepared_insert = prepare_for_key(
        db,
        "INSERT OR IGNORE INTO conversation_entries (project_slug, workspace_name, "
        "thread_local_id, seq, entry_id, kind, item_id, payload_json, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)",
        key);
    if (is_error(prepared_insert)) {
        return get_error(prepared_insert);
    }
    Statement insert = take_value(prepared_insert);

    auto prepared_lookup = prepare_for_key(
        db, "SELECT 1 FROM conversation_entries WHERE" + kKeyWhere + " AND entry_id = ?4", key);
    if (is_error(prepared_lookup)) {
        return get_error(prepared_lookup);
    }
    Statement lookup = take_value(prepared_lookup);
    std::int64_t id_candidate = next_seq;

    const std::int64_t now = core::config::now_unix_seconds();
    std::size_t inserted = 0;
    for (const auto& original : entries) {
        ConversationEntry entry = original;
        if (protocol::entry_id(entry).empty()) {
            id_candidate = std::max(id_candidate, next_seq);
            auto generated = next_free_entry_id(lookup, key, id_candidate);
            if (is_error(generated)) {
                return get_error(generated);
            }
            protocol::set_entry_id(entry, take_value(generated));
        }
        const auto index = protocol::entry_index(entry);

        // reset() clears bindings, so the key is rebound on every row.
        insert.reset();
        insert.bind_text(1, key.project_slug);
        insert.bind_text(2, key.workspace_name);
        insert.bind_int64(3, static_cast<std::int64_t>(key.thread_local_id));
        insert.bind_int64(4, next_seq);
        insert.bind_text(5, protocol::entry_id(entry));
        insert.bind_text(6, index.kind);
        insert.bind_optional_text(7, index.item_id);
        insert.bind_text(8, protocol::entry_to_json(entry).dump());
        insert.bind_int64(9, now);
        auto done = insert.run();
        if (is_error(done)) {
            return get_error(done);
        }
        if (sqlite3_changes(db) == 0) {
            TURNLOOM_LOG_DEBUG("Store: skipped duplicate " + index.kind + " entry for " +
                               protocol::to_string(key));
            continue;
        }
        ++inserted;
        ++next_seq;

        const auto* user = std::get_if<protocol::UserEntry>(&entry);
        if (user == nullptr || !title_is_placeholder) {
            continue;
        }
        const std::string title = protocol::derive_thread_title(user->event.text);
        if (title.empty()) {
            continue;
        }
        auto prepared_title = prepare_for_key(
            db, "UPDATE conversations SET title = ?4 WHERE" + kKeyWhere, key);
        if (is_error(prepared_title)) {
            return get_error(prepared_title);
        }
        Statement update_title = take_value(prepared_title);
        update_title.bind_text(4, title);
        auto titled = update_title.run();
        if (is_error(titled)) {
            return get_error(titled);
        }
        title_is_placeholder = false;
    }
    return inserted;
}

// Caller holds a transaction.
core::errors::Result<bool> insert_thread_if_absent(sqlite3* db, const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db,
        "INSERT OR IGNORE INTO conversations (project_slug, workspace_name, thread_local_id, "
        "title, created_at, updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?5)",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(4, "Thread " + std::to_string(key.thread_local_id));
    stmt.bind_int64(5, core::config::now_unix_seconds());
    auto done = stmt.run();
    if (is_error(done)) {
        return get_error(done);
    }
    if (sqlite3_changes(db) == 0) {
        return false;
    }

    auto created = insert_entries(
        db, key,
        {protocol::make_system_entry("sys_1", core::config::now_unix_ms(), protocol::TaskCreated{})});
    if (is_error(created)) {
        return get_error(created);
    }
    TURNLOOM_LOG_INFO("Store: created conversation " + protocol::to_string(key));
    return true;
}

core::errors::Result<std::vector<protocol::QueuedPrompt>> read_queued_prompts(
    sqlite3* db, const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db,
        "SELECT payload_json FROM conversation_queued_prompts WHERE" + kKeyWhere +
            " ORDER BY seq ASC",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);

    std::vector<protocol::QueuedPrompt> prompts;
    while (true) {
        auto stepped = stmt.step();
        if (is_error(stepped)) {
            return get_error(stepped);
        }
        if (!get_value(stepped)) {
            break;
        }
        const json parsed = json::parse(stmt.column_text(0), nullptr, false);
        if (parsed.is_discarded()) {
            return EngineError{ErrorCategory::Storage, "Stored queued prompt is not valid JSON.",
                               core::errors::codes::kMalformedEntry};
        }
        auto prompt = protocol::queued_prompt_from_json(parsed);
        if (is_error(prompt)) {
            return get_error(prompt);
        }
        prompts.push_back(take_value(prompt));
    }
    return prompts;
}

std::optional<store::TurnResult> derive_last_turn_result(const std::vector<std::string>& kinds) {
    bool completed = false;
    for (const auto& kind : kinds) {
        if (kind == protocol::entry_kinds::kTurnError ||
            kind == protocol::entry_kinds::kTurnCanceled) {
            return TurnResult::Failed;
        }
        if (kind == protocol::entry_kinds::kTurnDuration) {
            completed = true;
        }
    }
    if (completed) {
        return TurnResult::Completed;
    }
    return std::nullopt;
}

core::errors::Result<std::optional<TurnResult>> last_turn_result(sqlite3* db,
                                                                 const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db,
        "SELECT kind FROM conversation_entries WHERE" + kKeyWhere +
            " AND seq > COALESCE((SELECT MAX(seq) FROM conversation_entries WHERE" + kKeyWhere +
            " AND kind = 'user_message'), 0)"
            " AND kind IN ('turn_duration', 'turn_error', 'turn_canceled') ORDER BY seq ASC",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    std::vector<std::string> kinds;
    while (true) {
        auto stepped = stmt.step();
        if (is_error(stepped)) {
            return get_error(stepped);
        }
        if (!get_value(stepped)) {
            break;
        }
        kinds.push_back(stmt.column_text(0));
    }
    return derive_last_turn_result(kinds);
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

core::errors::Result<bool> ensure_thread(sqlite3* db, const ThreadKey& key) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);
    auto created = insert_thread_if_absent(db, key);
    if (is_error(created)) {
        return get_error(created);
    }
    auto committed = tx.commit();
    if (is_error(committed)) {
        return get_error(committed);
    }
    return get_value(created);
}

core::errors::Result<std::size_t> append_entries(sqlite3* db, const ThreadKey& key,
                                                 const std::vector<ConversationEntry>& entries) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);

    auto created = insert_thread_if_absent(db, key);
    if (is_error(created)) {
        return get_error(created);
    }
    auto inserted = insert_entries(db, key, entries);
    if (is_error(inserted)) {
        return get_error(inserted);
    }
    auto touched = touch_thread(db, key);
    if (is_error(touched)) {
        return get_error(touched);
    }
    auto committed = tx.commit();
    if (is_error(committed)) {
        return get_error(committed);
    }
    return get_value(inserted);
}

core::errors::Status replace_entries(sqlite3* db, const ThreadKey& key,
                                     const std::vector<ConversationEntry>& entries) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);

    auto exists = require_thread(db, key);
    if (is_error(exists)) {
        return exists;
    }
    auto prepared =
        prepare_for_key(db, "DELETE FROM conversation_entries WHERE" + kKeyWhere, key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement clear = take_value(prepared);
    auto cleared = clear.run();
    if (is_error(cleared)) {
        return cleared;
    }
    auto inserted = insert_entries(db, key, entries);
    if (is_error(inserted)) {
        return get_error(inserted);
    }
    auto touched = touch_thread(db, key);
    if (is_error(touched)) {
        return touched;
    }
    return tx.commit();
}

core::errors::Result<EntryPage> load_page(sqlite3* db, const ThreadKey& key,
                                          const std::optional<std::uint64_t> before_seq,
                                          const std::uint64_t limit) {
    auto exists = require_thread(db, key);
    if (is_error(exists)) {
        return get_error(exists);
    }
    auto counted =
        query_int64(db, "SELECT COUNT(*) FROM conversation_entries WHERE" + kKeyWhere, key);
    if (is_error(counted)) {
        return get_error(counted);
    }

    EntryPage page;
    page.total = static_cast<std::uint64_t>(get_value(counted));
    const std::uint64_t end = std::min(before_seq.value_or(page.total), page.total);
    page.start = end > limit ? end - limit : 0;

    auto prepared = prepare_for_key(
        db,
        "SELECT payload_json FROM conversation_entries WHERE" + kKeyWhere +
            " AND seq > ?4 AND seq <= ?5 ORDER BY seq ASC",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_int64(4, static_cast<std::int64_t>(page.start));
    stmt.bind_int64(5, static_cast<std::int64_t>(end));
    auto entries = read_entries(stmt);
    if (is_error(entries)) {
        return get_error(entries);
    }
    page.entries = take_value(entries);
    return page;
}

core::errors::Result<ConversationSnapshot> load_conversation(sqlite3* db, const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db,
        "SELECT title, remote_thread_id, task_status, agent_runner, agent_model_id, "
        "thinking_effort, amp_mode, created_at, updated_at FROM conversations WHERE" +
            kKeyWhere,
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement meta = take_value(prepared);
    auto stepped = meta.step();
    if (is_error(stepped)) {
        return get_error(stepped);
    }
    if (!get_value(stepped)) {
        return not_found(key);
    }

    ConversationSnapshot snapshot;
    snapshot.key = key;
    snapshot.title = meta.column_optional_text(0);
    snapshot.remote_thread_id = meta.column_optional_text(1);
    snapshot.task_status =
        protocol::parse_task_status(meta.column_text(2)).value_or(protocol::TaskStatus::Backlog);
    if (const auto runner = meta.column_optional_text(3)) {
        protocol::AgentRunConfig config;
        config.runner = protocol::parse_runner_kind(*runner).value_or(protocol::AgentRunnerKind::Codex);
        config.model_id = meta.column_text(4);
        config.thinking_effort = protocol::parse_thinking_effort(meta.column_text(5))
                                     .value_or(protocol::ThinkingEffort::Medium);
        config.amp_mode = meta.column_optional_text(6);
        snapshot.run_config = config;
    }
    snapshot.created_at = meta.column_int64(7);
    snapshot.updated_at = meta.column_int64(8);

    auto prepared_entries = prepare_for_key(
        db, "SELECT payload_json FROM conversation_entries WHERE" + kKeyWhere + " ORDER BY seq ASC",
        key);
    if (is_error(prepared_entries)) {
        return get_error(prepared_entries);
    }
    Statement rows = take_value(prepared_entries);
    auto entries = read_entries(rows);
    if (is_error(entries)) {
        return get_error(entries);
    }
    snapshot.entries = take_value(entries);

    auto queue = load_queue_state(db, key);
    if (is_error(queue)) {
        return get_error(queue);
    }
    snapshot.queue = take_value(queue);
    return snapshot;
}

core::errors::Result<bool> update_title_if_matches(sqlite3* db, const ThreadKey& key,
                                                   const std::string& expected_current,
                                                   const std::string& new_title) {
    const std::string title = trim(new_title);
    if (title.empty()) {
        return false;
    }
    auto exists = require_thread(db, key);
    if (is_error(exists)) {
        return get_error(exists);
    }

    auto prepared = prepare_for_key(
        db,
        "UPDATE conversations SET title = ?4, updated_at = ?6 WHERE" + kKeyWhere +
            " AND (title IS NULL OR title LIKE 'Thread %' OR title = ?5)"
            " AND COALESCE(title, '') <> ?4",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(4, title);
    stmt.bind_text(5, expected_current);
    stmt.bind_int64(6, core::config::now_unix_seconds());
    auto done = stmt.run();
    if (is_error(done)) {
        return get_error(done);
    }
    return sqlite3_changes(db) > 0;
}

core::errors::Result<std::optional<std::string>> get_remote_thread_id(sqlite3* db,
                                                                      const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db, "SELECT remote_thread_id FROM conversations WHERE" + kKeyWhere, key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    auto stepped = stmt.step();
    if (is_error(stepped)) {
        return get_error(stepped);
    }
    if (!get_value(stepped)) {
        return not_found(key);
    }
    return stmt.column_optional_text(0);
}

core::errors::Result<bool> set_remote_thread_id(sqlite3* db, const ThreadKey& key,
                                                const std::string& remote_thread_id) {
    auto prepared = prepare_for_key(
        db,
        "UPDATE conversations SET remote_thread_id = ?4 WHERE" + kKeyWhere +
            " AND remote_thread_id IS NULL",
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(4, remote_thread_id);
    auto done = stmt.run();
    if (is_error(done)) {
        return get_error(done);
    }
    if (sqlite3_changes(db) > 0) {
        return true;
    }
    auto exists = require_thread(db, key);
    if (is_error(exists)) {
        return get_error(exists);
    }
    return false;
}

core::errors::Status save_queue_state(sqlite3* db, const ThreadKey& key,
                                      const QueueState& state) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);

    auto stored_next = query_int64(
        db, "SELECT next_queued_prompt_id FROM conversations WHERE" + kKeyWhere, key);
    if (is_error(stored_next)) {
        return get_error(stored_next);
    }
    auto exists = require_thread(db, key);
    if (is_error(exists)) {
        return exists;
    }

    auto prepared_clear =
        prepare_for_key(db, "DELETE FROM conversation_queued_prompts WHERE" + kKeyWhere, key);
    if (is_error(prepared_clear)) {
        return get_error(prepared_clear);
    }
    Statement clear = take_value(prepared_clear);
    auto cleared = clear.run();
    if (is_error(cleared)) {
        return cleared;
    }

    auto prepared_insert = Statement::prepare(
        db,
        "INSERT INTO conversation_queued_prompts (project_slug, workspace_name, "
        "thread_local_id, prompt_id, seq, payload_json, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    if (is_error(prepared_insert)) {
        return get_error(prepared_insert);
    }
    Statement insert = take_value(prepared_insert);

    // Ids are never reused, so the counter only moves forward.
    std::uint64_t next_id = std::max<std::uint64_t>(
        state.next_prompt_id, static_cast<std::uint64_t>(get_value(stored_next)));
    const std::int64_t now = core::config::now_unix_seconds();
    std::int64_t seq = 1;
    for (const auto& prompt : state.prompts) {
        insert.reset();
        insert.bind_text(1, key.project_slug);
        insert.bind_text(2, key.workspace_name);
        insert.bind_int64(3, static_cast<std::int64_t>(key.thread_local_id));
        insert.bind_int64(4, static_cast<std::int64_t>(prompt.id));
        insert.bind_int64(5, seq++);
        insert.bind_text(6, protocol::queued_prompt_to_json(prompt).dump());
        insert.bind_int64(7, now);
        auto done = insert.run();
        if (is_error(done)) {
            return done;
        }
        next_id = std::max(next_id, prompt.id + 1);
    }

    auto prepared_meta = prepare_for_key(
        db,
        "UPDATE conversations SET queue_paused = ?4, next_queued_prompt_id = ?5, "
        "run_started_at_unix_ms = ?6, run_finished_at_unix_ms = ?7, updated_at = ?8 WHERE" +
            kKeyWhere,
        key);
    if (is_error(prepared_meta)) {
        return get_error(prepared_meta);
    }
    Statement meta = take_value(prepared_meta);
    meta.bind_int64(4, state.paused ? 1 : 0);
    meta.bind_int64(5, static_cast<std::int64_t>(next_id));
    meta.bind_optional_int64(6, state.run_started_at_unix_ms);
    meta.bind_optional_int64(7, state.run_finished_at_unix_ms);
    meta.bind_int64(8, now);
    auto updated = meta.run();
    if (is_error(updated)) {
        return updated;
    }
    return tx.commit();
}

core::errors::Result<QueueState> load_queue_state(sqlite3* db, const ThreadKey& key) {
    auto prepared = prepare_for_key(
        db,
        "SELECT queue_paused, next_queued_prompt_id, run_started_at_unix_ms, "
        "run_finished_at_unix_ms FROM conversations WHERE" +
            kKeyWhere,
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    auto stepped = stmt.step();
    if (is_error(stepped)) {
        return get_error(stepped);
    }
    if (!get_value(stepped)) {
        return not_found(key);
    }

    QueueState state;
    state.paused = stmt.column_int64(0) != 0;
    state.next_prompt_id = static_cast<std::uint64_t>(stmt.column_int64(1));
    state.run_started_at_unix_ms = stmt.column_optional_int64(2);
    state.run_finished_at_unix_ms = stmt.column_optional_int64(3);

    auto prompts = read_queued_prompts(db, key);
    if (is_error(prompts)) {
        return get_error(prompts);
    }
    state.prompts = take_value(prompts);
    return state;
}

core::errors::Status save_run_config(sqlite3* db, const ThreadKey& key,
                                     const protocol::AgentRunConfig& config) {
    auto prepared = prepare_for_key(
        db,
        "UPDATE conversations SET agent_runner = ?4, agent_model_id = ?5, thinking_effort = ?6, "
        "amp_mode = ?7 WHERE" +
            kKeyWhere,
        key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(4, protocol::to_string(config.runner));
    stmt.bind_text(5, config.model_id);
    stmt.bind_text(6, protocol::to_string(config.thinking_effort));
    stmt.bind_optional_text(7, config.amp_mode);
    auto done = stmt.run();
    if (is_error(done)) {
        return done;
    }
    if (sqlite3_changes(db) == 0) {
        return not_found(key);
    }
    return core::errors::ok();
}

core::errors::Result<bool> set_task_status(sqlite3* db, const ThreadKey& key,
                                           const protocol::TaskStatus status) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);

    auto prepared =
        prepare_for_key(db, "SELECT task_status FROM conversations WHERE" + kKeyWhere, key);
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement select = take_value(prepared);
    auto stepped = select.step();
    if (is_error(stepped)) {
        return get_error(stepped);
    }
    if (!get_value(stepped)) {
        return not_found(key);
    }
    const auto previous =
        protocol::parse_task_status(select.column_text(0)).value_or(protocol::TaskStatus::Backlog);
    if (previous == status) {
        return false;
    }

    auto prepared_update = prepare_for_key(
        db, "UPDATE conversations SET task_status = ?4, updated_at = ?5 WHERE" + kKeyWhere, key);
    if (is_error(prepared_update)) {
        return get_error(prepared_update);
    }
    Statement update = take_value(prepared_update);
    update.bind_text(4, protocol::to_string(status));
    update.bind_int64(5, core::config::now_unix_seconds());
    auto updated = update.run();
    if (is_error(updated)) {
        return get_error(updated);
    }

    auto recorded = insert_entries(
        db, key,
        {protocol::make_system_entry("", core::config::now_unix_ms(),
                                     protocol::TaskStatusChanged{previous, status})});
    if (is_error(recorded)) {
        return get_error(recorded);
    }
    auto committed = tx.commit();
    if (is_error(committed)) {
        return get_error(committed);
    }
    TURNLOOM_LOG_INFO("Store: " + protocol::to_string(key) + " task status transition " +
                      protocol::to_string(previous) + " -> " + protocol::to_string(status));
    return true;
}

core::errors::Result<std::vector<ThreadSummary>> list_threads(sqlite3* db,
                                                              const std::string& project_slug,
                                                              const std::string& workspace_name) {
    auto prepared = Statement::prepare(
        db,
        "SELECT c.thread_local_id, c.remote_thread_id, c.title, c.task_status, c.updated_at, "
        "c.queue_paused, c.run_started_at_unix_ms, c.run_finished_at_unix_ms, "
        "(SELECT COUNT(*) FROM conversation_queued_prompts q WHERE q.project_slug = "
        "c.project_slug AND q.workspace_name = c.workspace_name AND q.thread_local_id = "
        "c.thread_local_id) "
        "FROM conversations c WHERE c.project_slug = ?1 AND c.workspace_name = ?2 "
        "ORDER BY c.thread_local_id ASC");
    if (is_error(prepared)) {
        return get_error(prepared);
    }
    Statement stmt = take_value(prepared);
    stmt.bind_text(1, project_slug);
    stmt.bind_text(2, workspace_name);

    std::vector<ThreadSummary> threads;
    while (true) {
        auto stepped = stmt.step();
        if (is_error(stepped)) {
            return get_error(stepped);
        }
        if (!get_value(stepped)) {
            break;
        }
        ThreadSummary summary;
        summary.thread_local_id = static_cast<std::uint64_t>(stmt.column_int64(0));
        summary.remote_thread_id = stmt.column_optional_text(1);
        summary.title = stmt.column_optional_text(2);
        summary.task_status = protocol::parse_task_status(stmt.column_text(3))
                                  .value_or(protocol::TaskStatus::Backlog);
        summary.updated_at = stmt.column_int64(4);
        const bool paused = stmt.column_int64(5) != 0;
        const auto started = stmt.column_optional_int64(6);
        const auto finished = stmt.column_optional_int64(7);
        summary.queued_prompt_count = static_cast<std::size_t>(stmt.column_int64(8));

        const bool running =
            started.has_value() && (!finished.has_value() || *finished < *started);
        if (running) {
            summary.turn_status = TurnStatus::Running;
        } else if (summary.queued_prompt_count > 0) {
            summary.turn_status = paused ? TurnStatus::Paused : TurnStatus::Awaiting;
        } else {
            summary.turn_status = TurnStatus::Idle;
        }
        threads.push_back(std::move(summary));
    }

    for (auto& summary : threads) {
        const ThreadKey key{project_slug, workspace_name, summary.thread_local_id};
        auto result = last_turn_result(db, key);
        if (is_error(result)) {
            return get_error(result);
        }
        summary.last_turn_result = get_value(result);
    }
    return threads;
}

core::errors::Result<std::size_t> delete_workspace(sqlite3* db, const std::string& project_slug,
                                                   const std::string& workspace_name) {
    auto begun = Transaction::begin(db);
    if (is_error(begun)) {
        return get_error(begun);
    }
    Transaction tx = take_value(begun);

    std::size_t deleted_threads = 0;
    const char* statements[] = {
        "DELETE FROM conversation_entries WHERE project_slug = ?1 AND workspace_name = ?2",
        "DELETE FROM conversation_queued_prompts WHERE project_slug = ?1 AND workspace_name = ?2",
        "DELETE FROM conversations WHERE project_slug = ?1 AND workspace_name = ?2",
    };
    for (const char* sql : statements) {
        auto prepared = Statement::prepare(db, sql);
        if (is_error(prepared)) {
            return get_error(prepared);
        }
        Statement stmt = take_value(prepared);
        stmt.bind_text(1, project_slug);
        stmt.bind_text(2, workspace_name);
        auto done = stmt.run();
        if (is_error(done)) {
            return get_error(done);
        }
        deleted_threads = static_cast<std::size_t>(sqlite3_changes(db));
    }

    auto committed = tx.commit();
    if (is_error(committed)) {
        return get_error(committed);
    }
    TURNLOOM_LOG_INFO("Store: deleted " + std::to_string(deleted_threads) +
                      " conversations of " + project_slug + "/" + workspace_name);
    return deleted_threads;
}

} // namespace turnloom::store::queries
