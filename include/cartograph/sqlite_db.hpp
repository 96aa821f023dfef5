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

#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>

namespace cartograph {

// Throws StoreBusy for SQLITE_BUSY / SQLITE_LOCKED, StoreError otherwise
[[noreturn]] void throw_sqlite_error(sqlite3 *db, int rc, const std::string &what);

// ============================================================================
// Statement - RAII prepared statement
// ============================================================================
class Statement {
public:

    Statement(sqlite3 *db, const std::string &sql);
    ~Statement();

    // Non-copyable
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    // Movable
    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&other) noexcept;

    // Parameter indexes start at 1
    Statement &bind_int64(int idx, int64_t value);
    Statement &bind_int(int idx, int value);
    Statement &bind_double(int idx, double value);
    Statement &bind_text(int idx, const std::string &value);
    Statement &bind_null(int idx);
    Statement &bind_optional(int idx, const std::optional<int64_t> &value);

    // true while rows are produced, false once done
    bool step();

    // Step to completion, ignoring rows
    void run();

    void reset();

    // Column indexes start at 0
    int64_t column_int64(int col) const;
    int column_int(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    bool column_is_null(int col) const;
    std::optional<int64_t> column_optional(int col) const;

private:

    sqlite3 *db_ = nullptr;
    sqlite3_stmt *stmt_ = nullptr;
};

// ============================================================================
// Database - RAII connection configured for concurrent workers
// (WAL journal, foreign keys, busy timeout)
// ============================================================================
class Database {
public:

    explicit Database(std::string path);
    ~Database();

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    sqlite3 *handle() const { return db_; }
    const std::string &path() const { return path_; }

    void exec(const std::string &sql);

    Statement prepare(const std::string &sql);

    // Rows touched by the last INSERT / UPDATE / DELETE
    int64_t changes() const;

    int user_version();
    void set_user_version(int version);

private:

    sqlite3 *db_ = nullptr;
    std::string path_;

    void configure();
};

// ============================================================================
// Transaction - BEGIN IMMEDIATE; rolls back unless committed
// ============================================================================
class Transaction {
public:

    explicit Transaction(Database &db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:

    Database &db_;
    bool done_ = false;
};

} // namespace cartograph
