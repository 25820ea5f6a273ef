#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>
#include "core/errors/engine_errors.hpp"

namespace turnloom::store {

    core::errors::EngineError sqlite_error(sqlite3* db, const std::string& context);

    // Runs one or more statements that return no rows.
    core::errors::Status exec_sql(sqlite3* db, const std::string& sql);

    // Owns one prepared statement. Bind failures are reported by the next step().
    class Statement {
    public:
        static core::errors::Result<Statement> prepare(sqlite3* db, const std::string& sql);

        Statement(Statement&& other) noexcept;
        Statement& operator=(Statement&& other) noexcept;
        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;
        ~Statement();

        void bind_text(int index, const std::string& value);
        void bind_int64(int index, std::int64_t value);
        void bind_null(int index);
        void bind_optional_text(int index, const std::optional<std::string>& value);
        void bind_optional_int64(int index, const std::optional<std::int64_t>& value);

        // true when a row is available, false when the statement is done.
        core::errors::Result<bool> step();

        // Steps to completion. For INSERT/UPDATE/DELETE.
        core::errors::Status run();

        void reset();

        std::string column_text(int index) const;
        std::int64_t column_int64(int index) const;
        bool column_is_null(int index) const;
        std::optional<std::string> column_optional_text(int index) const;
        std::optional<std::int64_t> column_optional_int64(int index) const;

    private:
        Statement(sqlite3* db, sqlite3_stmt* stmt, std::string sql);
        void record_bind(int rc);

        sqlite3* db_ = nullptr;
        sqlite3_stmt* stmt_ = nullptr;
        std::string sql_;
        int bind_rc_ = SQLITE_OK;
    };

    // BEGIN IMMEDIATE on construction; rolls back unless commit() succeeded.
    class Transaction {
    public:
        static core::errors::Result<Transaction> begin(sqlite3* db);

        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        ~Transaction();

        core::errors::Status commit();

    private:
        explicit Transaction(sqlite3* db) : db_(db) {}

        sqlite3* db_ = nullptr;
        bool finished_ = false;
    };

} // namespace turnloom::store
