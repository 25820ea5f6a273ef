#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include "store/schema_migrations.hpp"
#include "store/sqlite_support.hpp"
#include "test_support.hpp"

namespace {

using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;
using turnloom::core::errors::take_value;
using turnloom::store::exec_sql;
using turnloom::store::kLatestSchemaVersion;
using turnloom::store::migrate;
using turnloom::store::read_schema_version;
using turnloom::store::Statement;
using turnloom::testing::TempWorkspace;

// Raw connection without the store's worker so tests can seed old shapes.
class RawDb {
public:
    explicit RawDb(const std::string& path) {
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            ADD_FAILURE() << "cannot open " << path;
        }
    }
    ~RawDb() { sqlite3_close(db_); }

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

void seed_legacy_row(sqlite3* db, int seq, const std::string& entry_id, const std::string& kind,
                     const std::string& payload) {
    auto prepared = Statement::prepare(
        db,
        "INSERT INTO conversation_entries (project_slug, workspace_name, thread_local_id, seq, "
        "entry_id, kind, item_id, payload_json, created_at) VALUES ('p', 'w', 1, ?1, ?2, ?3, "
        "NULL, ?4, 0)");
    ASSERT_FALSE(is_error(prepared));
    Statement stmt = take_value(prepared);
    stmt.bind_int64(1, seq);
    stmt.bind_text(2, entry_id);
    stmt.bind_text(3, kind);
    stmt.bind_text(4, payload);
    ASSERT_FALSE(is_error(stmt.run()));
}

nlohmann::json payload_at(sqlite3* db, int seq) {
    auto prepared = Statement::prepare(
        db, "SELECT payload_json FROM conversation_entries WHERE seq = ?1");
    EXPECT_FALSE(is_error(prepared));
    Statement stmt = take_value(prepared);
    stmt.bind_int64(1, seq);
    auto stepped = stmt.step();
    EXPECT_FALSE(is_error(stepped));
    return nlohmann::json::parse(stmt.column_text(0));
}

TEST(SchemaMigrationTest, FreshDatabaseReachesLatest) {
    TempWorkspace workspace("migrate");
    RawDb db(workspace.db_path());
    ASSERT_FALSE(is_error(migrate(db.get())));

    auto version = read_schema_version(db.get());
    ASSERT_FALSE(is_error(version));
    EXPECT_EQ(get_value(version), kLatestSchemaVersion);

    // Running again is a no-op.
    EXPECT_FALSE(is_error(migrate(db.get())));
}

TEST(SchemaMigrationTest, NewerSchemaIsRejected) {
    TempWorkspace workspace("migrate");
    RawDb db(workspace.db_path());
    ASSERT_FALSE(is_error(exec_sql(db.get(), "PRAGMA user_version = 99;")));

    auto migrated = migrate(db.get());
    ASSERT_TRUE(is_error(migrated));
    EXPECT_EQ(get_error(migrated).code, "schema_too_new");
}

TEST(SchemaMigrationTest, RewritesLegacyFlatEntries) {
    TempWorkspace workspace("migrate");
    RawDb db(workspace.db_path());
    ASSERT_FALSE(is_error(migrate(db.get(), 3)));
    ASSERT_FALSE(is_error(exec_sql(
        db.get(),
        "INSERT INTO conversations (project_slug, workspace_name, thread_local_id, created_at, "
        "updated_at) VALUES ('p', 'w', 1, 0, 0);")));

    seed_legacy_row(db.get(), 1, "e_1", "user_message",
                    R"({"type":"user_message","text":"hi","attachments":[]})");
    seed_legacy_row(db.get(), 2, "e_2", "agent_item",
                    R"({"type":"agent_item","item":{"type":"agent_message","id":"m","text":"yo"}})");
    seed_legacy_row(db.get(), 3, "e_3", "turn_error",
                    R"({"type":"turn_error","message":"bad"})");
    seed_legacy_row(db.get(), 4, "e_4", "agent_item",
                    R"({"type":"agent_event","entry_id":"e_4","event":{"type":"turn_canceled"}})");

    ASSERT_FALSE(is_error(migrate(db.get())));

    const auto user = payload_at(db.get(), 1);
    EXPECT_EQ(user.at("type"), "user_event");
    EXPECT_EQ(user.at("entry_id"), "e_1");
    EXPECT_EQ(user.at("event").at("text"), "hi");

    const auto message = payload_at(db.get(), 2);
    EXPECT_EQ(message.at("type"), "agent_event");
    EXPECT_EQ(message.at("event").at("type"), "message");
    EXPECT_EQ(message.at("event").at("text"), "yo");

    const auto error = payload_at(db.get(), 3);
    EXPECT_EQ(error.at("event").at("type"), "turn_error");
    EXPECT_EQ(error.at("event").at("message"), "bad");

    const auto tagged = payload_at(db.get(), 4);
    EXPECT_EQ(tagged.at("event").at("type"), "turn_canceled");
}

TEST(SchemaMigrationTest, UnknownLegacyTypeFailsAndRollsBack) {
    TempWorkspace workspace("migrate");
    RawDb db(workspace.db_path());
    ASSERT_FALSE(is_error(migrate(db.get(), 3)));
    ASSERT_FALSE(is_error(exec_sql(
        db.get(),
        "INSERT INTO conversations (project_slug, workspace_name, thread_local_id, created_at, "
        "updated_at) VALUES ('p', 'w', 1, 0, 0);")));
    seed_legacy_row(db.get(), 1, "e_1", "agent_item", R"({"type":"mystery"})");

    auto migrated = migrate(db.get());
    ASSERT_TRUE(is_error(migrated));
    EXPECT_EQ(get_error(migrated).code, "migration_failed");

    auto version = read_schema_version(db.get());
    ASSERT_FALSE(is_error(version));
    EXPECT_EQ(get_value(version), 3);
}

}  // namespace
