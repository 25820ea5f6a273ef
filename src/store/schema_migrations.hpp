#pragma once
#include <sqlite3.h>
#include "core/errors/engine_errors.hpp"

namespace turnloom::store {

    inline constexpr int kLatestSchemaVersion = 4;

    // Version at which stored entry payloads moved from the flat legacy shape
    // to tagged system_event / user_event / agent_event payloads.
    inline constexpr int kTaggedEntriesSchemaVersion = 4;

    core::errors::Result<int> read_schema_version(sqlite3* db);

    // Applies pending migrations up to target_version in one transaction.
    // Fails with schema_too_new when the database is ahead of this build.
    core::errors::Status migrate(sqlite3* db, int target_version = kLatestSchemaVersion);

} // namespace turnloom::store
