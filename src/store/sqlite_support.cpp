#include "store/sqlite_support.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace turnloom::store {

using core::errors::EngineError;
using core::errors::ErrorCategory;

EngineError sqlite_error(sqlite3* db, const std::string& context) {
    const std::string detail = db != nullptr ? sqlite3_errmsg(db) : "no database handle";
    return EngineError{ErrorCategory::Storage, context + ": " + detail,
                       core::errors::codes::kSqliteError};
}

core::errors::Status exec_sql(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        return EngineError{ErrorCategory::Storage, "SQLite exec failed: " + msg,
                           core::errors::codes::kSqliteError};
    }
    return core::errors::ok();
}

core::errors::Result<Statement> Statement::prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
        return sqlite_error(db, "prepare failed");
    }
    return Statement(db, stmt, sql);
}

Statement::Statement(sqlite3* db, sqlite3_stmt* stmt, std::string sql)
    : db_(db), stmt_(stmt), sql_(std::move(sql)) {}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_),
      stmt_(std::exchange(other.stmt_, nullptr)),
      sql_(std::move(other.sql_)),
      bind_rc_(other.bind_rc_) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
        sql_ = std::move(other.sql_);
        bind_rc_ = other.bind_rc_;
    }
    return *this;
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::record_bind(const int rc) {
    if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
        bind_rc_ = rc;
    }
}

void Statement::bind_text(const int index, const std::string& value) {
    record_bind(sqlite3_bind_text(stmt_, index, value.c_str(),
                                  static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

void Statement::bind_int64(const int index, const std::int64_t value) {
    record_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
}

void Statement::bind_null(const int index) {
    record_bind(sqlite3_bind_null(stmt_, index));
}

void Statement::bind_optional_text(const int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
        bind_text(index, *value);
    } else {
        bind_null(index);
    }
}

void Statement::bind_optional_int64(const int index,
                                    const std::optional<std::int64_t>& value) {
    if (value.has_value()) {
        bind_int64(index, *value);
    } else {
        bind_null(index);
    }
}

core::errors::Result<bool> Statement::step() {
    if (bind_rc_ != SQLITE_OK) {
        return EngineError{ErrorCategory::Storage,
                           "bind failed (" + std::string(sqlite3_errstr(bind_rc_)) + "): " + sql_,
                           core::errors::codes::kSqliteError};
    }
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return sqlite_error(db_, "step failed");
}

core::errors::Status Statement::run() {
    while (true) {
        auto stepped = step();
        if (core::errors::is_error(stepped)) {
            return core::errors::get_error(stepped);
        }
        if (!core::errors::get_value(stepped)) {
            return core::errors::ok();
        }
    }
}

void Statement::reset() {
    // The error of the last step is already reported by step().
    static_cast<void>(sqlite3_reset(stmt_));
    static_cast<void>(sqlite3_clear_bindings(stmt_));
    bind_rc_ = SQLITE_OK;
}

std::string Statement::column_text(const int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    if (text == nullptr) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::int64_t Statement::column_int64(const int index) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

bool Statement::column_is_null(const int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(const int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_text(index);
}

std::optional<std::int64_t> Statement::column_optional_int64(const int index) const {
    if (column_is_null(index)) {
        return std::nullopt;
    }
    return column_int64(index);
}

core::errors::Result<Transaction> Transaction::begin(sqlite3* db) {
    auto begun = exec_sql(db, "BEGIN IMMEDIATE;");
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    return Transaction(db);
}

Transaction::Transaction(Transaction&& other) noexcept
    : db_(other.db_), finished_(std::exchange(other.finished_, true)) {}

Transaction::~Transaction() {
    if (finished_) {
        return;
    }
    auto rolled_back = exec_sql(db_, "ROLLBACK;");
    if (core::errors::is_error(rolled_back)) {
        TURNLOOM_LOG_WARN("Transaction rollback failed: " +
                          core::errors::get_error(rolled_back).message);
    }
}

core::errors::Status Transaction::commit() {
    auto committed = exec_sql(db_, "COMMIT;");
    if (core::errors::is_error(committed)) {
        return committed;
    }
    finished_ = true;
    return core::errors::ok();
}

} // namespace turnloom::store
