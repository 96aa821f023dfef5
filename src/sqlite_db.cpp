// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cartograph/sqlite_db.hpp"
#include "cartograph/errors.hpp"
#include "cartograph/logging.hpp"

namespace cartograph {

void throw_sqlite_error(sqlite3 *db, int rc, const std::string &what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    int primary = rc & 0xff;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
        throw StoreBusy(msg);
    }
    throw StoreError(msg);
}

// ============ Statement ============

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw_sqlite_error(db_, rc, "sqlite prepare");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement &&other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Statement &Statement::bind_int64(int idx, int64_t value) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
    return *this;
}

Statement &Statement::bind_int(int idx, int value) {
    sqlite3_bind_int(stmt_, idx, value);
    return *this;
}

Statement &Statement::bind_double(int idx, double value) {
    sqlite3_bind_double(stmt_, idx, value);
    return *this;
}

Statement &Statement::bind_text(int idx, const std::string &value) {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    return *this;
}

Statement &Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

Statement &Statement::bind_optional(int idx, const std::optional<int64_t> &value) {
    return value ? bind_int64(idx, *value) : bind_null(idx);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite_error(db_, rc, "sqlite step");
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

int Statement::column_int(int col) const {
    return sqlite3_column_int(stmt_, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char *text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<int64_t> Statement::column_optional(int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_int64(col);
}

// ============ Database ============

Database::Database(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open database " + path_ + ": " + msg);
    }
    configure();
}

Database::~Database() {
    if (db_) sqlite3_close_v2(db_);
}

void Database::exec(const std::string &sql) {
    char *err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) throw StoreBusy(msg);
        throw StoreError(msg);
    }
}

Statement Database::prepare(const std::string &sql) {
    return Statement(db_, sql);
}

int64_t Database::changes() const {
    return static_cast<int64_t>(sqlite3_changes(db_));
}

int Database::user_version() {
    Statement stmt = prepare("PRAGMA user_version;");
    return stmt.step() ? stmt.column_int(0) : 0;
}

void Database::set_user_version(int version) {
    exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void Database::configure() {
    // Wait for locks instead of failing immediately; set first so the
    // journal-mode switch below also waits
    if (sqlite3_busy_timeout(db_, 5000) != SQLITE_OK) {
        throw_sqlite_error(db_, sqlite3_errcode(db_), "busy_timeout");
    }
    // WAL lets readers proceed while a worker holds the write lock
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=NORMAL;");
    // Foreign keys are off by default in sqlite
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA temp_store=MEMORY;");
}

// ============ Transaction ============

Transaction::Transaction(Database &db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    int rc = sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        log_warn("Rollback failed", {StringField("db", db_.path()), StringField("error", sqlite3_errstr(rc))});
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace cartograph
