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

// Warden Store - Database Implementation

#include "database.hpp"

#include <fmt/format.h>

#include <type_traits>

#include "../core/logging.hpp"

namespace warden::store {

namespace {

constexpr std::string_view kSchema = R"sql(
CREATE TABLE IF NOT EXISTS signing_keys
(
    id          TEXT    NOT NULL PRIMARY KEY,
    private_key TEXT    NOT NULL,
    state       TEXT    NOT NULL CHECK ( state IN ('ACTIVE', 'RETIRED') ),
    created_at  INTEGER NOT NULL,
    expires_at  INTEGER NOT NULL
);

CREATE UNIQUE INDEX IF NOT EXISTS signing_keys_single_active
    ON signing_keys (state) WHERE state = 'ACTIVE';

CREATE TABLE IF NOT EXISTS users
(
    id           TEXT NOT NULL PRIMARY KEY,
    email        TEXT NOT NULL UNIQUE,
    display_name TEXT NOT NULL,
    password     TEXT
);

CREATE TABLE IF NOT EXISTS organizations
(
    id   TEXT NOT NULL PRIMARY KEY,
    name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS events
(
    id           TEXT NOT NULL PRIMARY KEY,
    organization TEXT NOT NULL,
    name         TEXT NOT NULL,
    FOREIGN KEY (organization) REFERENCES organizations (id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS permissions
(
    id           TEXT NOT NULL PRIMARY KEY,
    user         TEXT NOT NULL,
    role         TEXT NOT NULL CHECK ( role IN ('SERVER_ADMIN', 'ORGANIZATION_ADMIN',
                                                'ORGANIZATION_VIEWER', 'EVENT_ADMIN',
                                                'EVENT_EDITOR', 'EVENT_VIEWER') ),
    organization TEXT,
    event        TEXT,
    FOREIGN KEY (user) REFERENCES users (id) ON DELETE CASCADE,
    FOREIGN KEY (organization) REFERENCES organizations (id) ON DELETE CASCADE,
    FOREIGN KEY (event) REFERENCES events (id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS permissions_user ON permissions (user);
)sql";

}  // namespace

// ============================================================================
// Statement
// ============================================================================

Status Statement::bind(int index, const query::BindValue& value) {
    int rc = std::visit(
        [this, index](const auto& v) -> int {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_.get(), index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_.get(), index, v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return sqlite3_bind_int(stmt_.get(), index, v ? 1 : 0);
            } else {
                return sqlite3_bind_text(stmt_.get(), index, v.data(),
                                         static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        },
        value);

    if (rc != SQLITE_OK) {
        return Error::store(fmt::format("bind {} failed: {}", index, sqlite3_errmsg(db_)));
    }
    return Status::success();
}

Result<int> Statement::bind_all(const std::vector<query::BindValue>& values, int first_index) {
    int index = first_index;
    for (const auto& value : values) {
        auto status = bind(index, value);
        if (!status) {
            return std::move(status).error();
        }
        ++index;
    }
    return index;
}

Result<bool> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    return Error::store(fmt::format("step failed ({}): {}", rc, sqlite3_errmsg(db_)));
}

Status Statement::run() {
    while (true) {
        auto row = step();
        if (!row) {
            return std::move(row).error();
        }
        if (!*row) {
            return Status::success();
        }
    }
}

void Statement::reset() noexcept {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
}

bool Statement::is_null(int column) const noexcept {
    return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

std::string Statement::text(int column) const {
    const auto* data = sqlite3_column_text(stmt_.get(), column);
    if (!data) {
        return {};
    }
    int size = sqlite3_column_bytes(stmt_.get(), column);
    return std::string(reinterpret_cast<const char*>(data), static_cast<size_t>(size));
}

std::optional<std::string> Statement::optional_text(int column) const {
    if (is_null(column)) {
        return std::nullopt;
    }
    return text(column);
}

int64_t Statement::int64(int column) const noexcept {
    return sqlite3_column_int64(stmt_.get(), column);
}

int Statement::changes() const noexcept {
    return sqlite3_changes(db_);
}

// ============================================================================
// Database
// ============================================================================

Result<std::shared_ptr<Database>> Database::open(const std::string& path, int busy_timeout_ms) {
    sqlite3* raw = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    SqlitePtr handle(raw);  // sqlite3_open_v2 allocates a handle even on failure

    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        LOG_ERROR(logging::get_logger(), "Failed to open database {}: {}", path, message);
        return Error::store(fmt::format("open {} failed: {}", path, message));
    }

    sqlite3_busy_timeout(handle.get(), busy_timeout_ms);

    std::shared_ptr<Database> db(new Database(std::move(handle), path));

    auto status = db->execute("PRAGMA foreign_keys = ON;");
    if (!status) {
        return std::move(status).error();
    }

    LOG_INFO(logging::get_logger(), "Database opened: path={}, busy_timeout_ms={}", path,
             busy_timeout_ms);
    return db;
}

Status Database::execute(std::string_view sql) {
    auto guard = lock();

    std::string statement(sql);
    char* message = nullptr;
    int rc = sqlite3_exec(db_.get(), statement.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        LOG_ERROR(logging::get_logger(), "SQL execution failed: {}", detail);
        return Error::store(fmt::format("exec failed: {}", detail));
    }
    return Status::success();
}

Result<Statement> Database::prepare(std::string_view sql) {
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_.get(), sql.data(), static_cast<int>(sql.size()), &raw,
                                nullptr);
    SqliteStmtPtr stmt(raw);

    if (rc != SQLITE_OK) {
        auto error = failure("prepare");
        LOG_ERROR(logging::get_logger(), "{}", error.describe());
        return error;
    }
    return Statement(db_.get(), std::move(stmt));
}

Status Database::ensure_schema() {
    auto status = execute(kSchema);
    if (!status) {
        return status;
    }

    LOG_INFO(logging::get_logger(), "Database schema ready: path={}", path_);
    return Status::success();
}

Error Database::failure(std::string_view operation) const {
    return Error::store(fmt::format("{} failed: {}", operation, sqlite3_errmsg(db_.get())));
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::~Transaction() {
    if (active_) {
        auto status = db_.execute("ROLLBACK;");
        if (!status) {
            LOG_ERROR(logging::get_logger(), "Transaction rollback failed: {}",
                      status.error().describe());
        }
    }
}

Status Transaction::begin() {
    auto status = db_.execute("BEGIN IMMEDIATE;");
    if (status) {
        active_ = true;
    }
    return status;
}

Status Transaction::commit() {
    auto status = db_.execute("COMMIT;");
    if (status) {
        active_ = false;
    }
    return status;
}

}  // namespace warden::store
