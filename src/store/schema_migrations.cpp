#include "store/schema_migrations.hpp"

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "protocol/conversation_entry.hpp"
#include "store/sqlite_support.hpp"

namespace turnloom::store {

using core::errors::EngineError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

struct Migration {
    int version;
    const char* sql;
};

const Migration kMigrations[] = {
    {1, R"SQL(
CREATE TABLE IF NOT EXISTS conversations (
    project_slug TEXT NOT NULL,
    workspace_name TEXT NOT NULL,
    thread_local_id INTEGER NOT NULL,
    remote_thread_id TEXT,
    title TEXT,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (project_slug, workspace_name, thread_local_id)
);

CREATE TABLE IF NOT EXISTS conversation_entries (
    project_slug TEXT NOT NULL,
    workspace_name TEXT NOT NULL,
    thread_local_id INTEGER NOT NULL,
    seq INTEGER NOT NULL,
    entry_id TEXT NOT NULL,
    kind TEXT NOT NULL,
    item_id TEXT,
    payload_json TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    PRIMARY KEY (project_slug, workspace_name, thread_local_id, seq),
    FOREIGN KEY (project_slug, workspace_name, thread_local_id)
        REFERENCES conversations (project_slug, workspace_name, thread_local_id)
        ON DELETE CASCADE
);

CREATE UNIQUE INDEX IF NOT EXISTS conversation_entries_item_idx
    ON conversation_entries (project_slug, workspace_name, thread_local_id, kind, item_id);

CREATE UNIQUE INDEX IF NOT EXISTS conversation_entries_entry_id_idx
    ON conversation_entries (project_slug, workspace_name, thread_local_id, entry_id);
)SQL"},
    {2, R"SQL(
ALTER TABLE conversations ADD COLUMN queue_paused INTEGER NOT NULL DEFAULT 0;
ALTER TABLE conversations ADD COLUMN next_queued_prompt_id INTEGER NOT NULL DEFAULT 1;
ALTER TABLE conversations ADD COLUMN run_started_at_unix_ms INTEGER;
ALTER TABLE conversations ADD COLUMN run_finished_at_unix_ms INTEGER;

CREATE TABLE IF NOT EXISTS conversation_queued_prompts (
    project_slug TEXT NOT NULL,
    workspace_name TEXT NOT NULL,
    thread_local_id INTEGER NOT NULL,
    prompt_id INTEGER NOT NULL,
    seq INTEGER NOT NULL,
    payload_json TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    PRIMARY KEY (project_slug, workspace_name, thread_local_id, prompt_id),
    FOREIGN KEY (project_slug, workspace_name, thread_local_id)
        REFERENCES conversations (project_slug, workspace_name, thread_local_id)
        ON DELETE CASCADE
);
)SQL"},
    {3, R"SQL(
ALTER TABLE conversations ADD COLUMN task_status TEXT NOT NULL DEFAULT 'backlog';
ALTER TABLE conversations ADD COLUMN agent_runner TEXT;
ALTER TABLE conversations ADD COLUMN agent_model_id TEXT;
ALTER TABLE conversations ADD COLUMN thinking_effort TEXT;
ALTER TABLE conversations ADD COLUMN amp_mode TEXT;
)SQL"},
    {4, ""},
};

EngineError migration_error(const std::string& message) {
    return EngineError{ErrorCategory::Storage, message, core::errors::codes::kMigrationFailed};
}

// Maps one legacy flat payload to the tagged shape.
core::errors::Result<protocol::ConversationEntry> legacy_to_tagged(const json& legacy,
                                                                   const std::string& type,
                                                                   const std::string& entry_id) {
    json tagged;
    if (type == "user_message") {
        tagged = json{{"type", "user_event"},
                      {"entry_id", entry_id},
                      {"event",
                       json{{"type", "message"},
                            {"text", legacy.value("text", std::string())},
                            {"attachments", legacy.value("attachments", json::array())}}}};
    } else if (type == "agent_item") {
        const json item = legacy.value("item", json());
        json event;
        if (item.is_object() && item.value("type", std::string()) == "agent_message") {
            event = json{{"type", "message"},
                         {"id", item.value("id", std::string())},
                         {"text", item.value("text", std::string())}};
        } else {
            event = json{{"type", "item"}, {"item", item}};
        }
        tagged = json{{"type", "agent_event"}, {"entry_id", entry_id}, {"event", event}};
    } else if (type == "turn_usage") {
        tagged = json{{"type", "agent_event"},
                      {"entry_id", entry_id},
                      {"event", json{{"type", "turn_usage"}, {"usage", legacy.value("usage", json())}}}};
    } else if (type == "turn_duration") {
        tagged = json{{"type", "agent_event"},
                      {"entry_id", entry_id},
                      {"event",
                       json{{"type", "turn_duration"},
                            {"duration_ms", legacy.value("duration_ms", std::uint64_t{0})}}}};
    } else if (type == "turn_canceled") {
        tagged = json{{"type", "agent_event"},
                      {"entry_id", entry_id},
                      {"event", json{{"type", "turn_canceled"}}}};
    } else if (type == "turn_error") {
        tagged = json{{"type", "agent_event"},
                      {"entry_id", entry_id},
                      {"event",
                       json{{"type", "turn_error"}, {"message", legacy.value("message", std::string())}}}};
    } else {
        return migration_error("unknown conversation entry type '" + type + "'");
    }
    return protocol::entry_from_json(tagged);
}

core::errors::Status rewrite_legacy_entries(sqlite3* db) {
    auto select = Statement::prepare(
        db, "SELECT rowid, entry_id, payload_json FROM conversation_entries");
    if (core::errors::is_error(select)) {
        return core::errors::get_error(select);
    }
    Statement rows = core::errors::take_value(select);

    std::vector<std::pair<std::int64_t, std::string>> updates;
    while (true) {
        auto stepped = rows.step();
        if (core::errors::is_error(stepped)) {
            return core::errors::get_error(stepped);
        }
        if (!core::errors::get_value(stepped)) {
            break;
        }
        const std::int64_t row_id = rows.column_int64(0);
        const std::string entry_id = rows.column_text(1);
        const json parsed = json::parse(rows.column_text(2), nullptr, false);
        if (parsed.is_discarded()) {
            return migration_error("invalid conversation entry json (rowid=" +
                                   std::to_string(row_id) + ")");
        }
        if (!parsed.is_object() || !parsed.contains("type") || !parsed.at("type").is_string()) {
            return migration_error("conversation entry missing type tag (rowid=" +
                                   std::to_string(row_id) + ")");
        }
        const std::string type = parsed.at("type").get<std::string>();
        if (type == "system_event" || type == "user_event" || type == "agent_event") {
            continue;
        }

        auto migrated = legacy_to_tagged(parsed, type, entry_id);
        if (core::errors::is_error(migrated)) {
            return migration_error(core::errors::get_error(migrated).message + " (rowid=" +
                                   std::to_string(row_id) + ")");
        }
        updates.emplace_back(row_id,
                             protocol::entry_to_json(core::errors::get_value(migrated)).dump());
    }

    if (updates.empty()) {
        return core::errors::ok();
    }

    auto prepared =
        Statement::prepare(db, "UPDATE conversation_entries SET payload_json = ?1 WHERE rowid = ?2");
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }
    Statement update = core::errors::take_value(prepared);
    for (const auto& [row_id, payload_json] : updates) {
        update.reset();
        update.bind_text(1, payload_json);
        update.bind_int64(2, row_id);
        auto done = update.run();
        if (core::errors::is_error(done)) {
            return done;
        }
    }
    TURNLOOM_LOG_INFO("Schema: rewrote " + std::to_string(updates.size()) +
                      " legacy conversation entries");
    return core::errors::ok();
}

}  // namespace

core::errors::Result<int> read_schema_version(sqlite3* db) {
    auto prepared = Statement::prepare(db, "PRAGMA user_version;");
    if (core::errors::is_error(prepared)) {
        return core::errors::get_error(prepared);
    }
    Statement stmt = core::errors::take_value(prepared);
    auto stepped = stmt.step();
    if (core::errors::is_error(stepped)) {
        return core::errors::get_error(stepped);
    }
    if (!core::errors::get_value(stepped)) {
        return 0;
    }
    return static_cast<int>(stmt.column_int64(0));
}

core::errors::Status migrate(sqlite3* db, const int target_version) {
    auto version = read_schema_version(db);
    if (core::errors::is_error(version)) {
        return core::errors::get_error(version);
    }
    int current = core::errors::get_value(version);

    if (current > kLatestSchemaVersion) {
        return EngineError{ErrorCategory::Storage,
                           "sqlite schema version is newer than this build (db=" +
                               std::to_string(current) + ", build=" +
                               std::to_string(kLatestSchemaVersion) + ")",
                           core::errors::codes::kSchemaTooNew,
                           "Upgrade turnloom before opening this database."};
    }
    if (current >= target_version) {
        return core::errors::ok();
    }

    auto begun = Transaction::begin(db);
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    Transaction tx = core::errors::take_value(begun);

    for (const auto& migration : kMigrations) {
        if (migration.version <= current || migration.version > target_version) {
            continue;
        }
        auto applied = exec_sql(db, migration.sql);
        if (core::errors::is_error(applied)) {
            return migration_error("failed to apply migration v" +
                                   std::to_string(migration.version) + ": " +
                                   core::errors::get_error(applied).message);
        }
        if (migration.version == kTaggedEntriesSchemaVersion) {
            auto rewritten = rewrite_legacy_entries(db);
            if (core::errors::is_error(rewritten)) {
                return rewritten;
            }
        }
        auto bumped =
            exec_sql(db, "PRAGMA user_version = " + std::to_string(migration.version) + ";");
        if (core::errors::is_error(bumped)) {
            return bumped;
        }
        TURNLOOM_LOG_INFO("Schema: migration v" + std::to_string(current) + " -> v" +
                          std::to_string(migration.version));
        current = migration.version;
    }

    return tx.commit();
}

} // namespace turnloom::store
