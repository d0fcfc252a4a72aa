/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Warden Store - Database Header
// RAII wrappers over the SQLite C API: connection, prepared statement, transaction

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/error.hpp"
#include "../query/query.hpp"

namespace warden::store {

using core::Error;
using core::Result;
using core::Status;

/// Custom deleters for SQLite handles
struct SqliteDeleter {
    void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
};

struct SqliteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

using SqlitePtr = std::unique_ptr<sqlite3, SqliteDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

/// Prepared statement (move-only)
class Statement {
public:
    Statement(sqlite3* db, SqliteStmtPtr stmt) noexcept : db_(db), stmt_(std::move(stmt)) {}

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&&) noexcept = default;
    Statement& operator=(Statement&&) noexcept = default;

    /// Bind one value at a 1-based index
    [[nodiscard]] Status bind(int index, const query::BindValue& value);

    /// Bind values starting at a 1-based index; returns the next free index
    [[nodiscard]] Result<int> bind_all(const std::vector<query::BindValue>& values,
                                       int first_index = 1);

    /// Advance. true = a row is available, false = done.
    [[nodiscard]] Result<bool> step();

    /// Run to completion, ignoring rows
    [[nodiscard]] Status run();

    /// Rewind and clear bindings so the statement can be executed again
    void reset() noexcept;

    [[nodiscard]] bool is_null(int column) const noexcept;
    [[nodiscard]] std::string text(int column) const;
    [[nodiscard]] std::optional<std::string> optional_text(int column) const;
    [[nodiscard]] int64_t int64(int column) const noexcept;

    /// Rows modified by the last completed step
    [[nodiscard]] int changes() const noexcept;

private:
    sqlite3* db_;
    SqliteStmtPtr stmt_;
};

/// Shared SQLite connection.
///
/// The handle is opened in serialized mode and every statement sequence
/// additionally holds lock(), so one Database can back every store.
class Database {
public:
    /// Open (or create) the database, enable foreign keys and set the busy timeout
    [[nodiscard]] static Result<std::shared_ptr<Database>> open(const std::string& path,
                                                                int busy_timeout_ms = 5000);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Serialize access. Recursive so a Transaction and the statements inside it
    /// can lock from the same thread.
    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    /// Execute one or more statements without parameters
    [[nodiscard]] Status execute(std::string_view sql);

    [[nodiscard]] Result<Statement> prepare(std::string_view sql);

    /// Create tables and indexes if missing
    [[nodiscard]] Status ensure_schema();

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    Database(SqlitePtr db, std::string path) : db_(std::move(db)), path_(std::move(path)) {}

    [[nodiscard]] Error failure(std::string_view operation) const;

    SqlitePtr db_;
    std::string path_;
    std::recursive_mutex mutex_;
};

/// Scoped write transaction (BEGIN IMMEDIATE). Rolled back on destruction
/// unless committed. Holds the connection lock for its whole lifetime.
class Transaction {
public:
    explicit Transaction(Database& db) : db_(db), lock_(db.lock()) {}
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] Status begin();
    [[nodiscard]] Status commit();

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool active_ = false;
};

}  // namespace warden::store
