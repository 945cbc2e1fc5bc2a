// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Sqlite3Session -- one physical SQLite3 connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error return / Error* output parameter
//   - Opened full-mutex: a session may be handed to an async worker, the
//     transaction layer guarantees it is never used by two flows at once
//   - sqlite3_close_v2 so a live reader never blocks Close()

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

#include "txpp/connection_string.hpp"
#include "txpp/error.hpp"
#include "txpp/isolation.hpp"
#include "txpp/sqlite3_reader.hpp"
#include "txpp/sqlite3_statement.hpp"
#include "txpp/value.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// Sqlite3Session
// ---------------------------------------------------------------------------

class Sqlite3Session {
 public:
  Sqlite3Session() = default;

  ~Sqlite3Session() { Close(); }

  // Move
  Sqlite3Session(Sqlite3Session&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Session& operator=(Sqlite3Session&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Session(const Sqlite3Session&) = delete;
  Sqlite3Session& operator=(const Sqlite3Session&) = delete;

  // --- Open / Close ---

  Error Open(const ConnectionOptions& options) {
    if (options.target[0] == '\0') {
      return Error::Make(ErrorCode::kNullParam, "target is empty");
    }
    Close();
    int32_t flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                    SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    int32_t rc = sqlite3_open_v2(options.target, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::Make(
          Sqlite3Statement::MapResultCode(rc),
          db_ ? sqlite3_errmsg(db_) : "sqlite3_open_v2 failed");
      if (db_ != nullptr) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
      }
      return err;
    }
    if (options.busy_timeout_ms > 0) {
      sqlite3_busy_timeout(db_, options.busy_timeout_ms);
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close_v2(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute parameterless SQL (DDL, transaction control, multi-statement
  /// scripts). Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return -1;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return -1;
    }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      out_error->Set(Sqlite3Statement::MapResultCode(rc),
                     errmsg ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Parameterized execution ---

  /// Execute one parameterized statement. Returns affected rows, or -1.
  int64_t Execute(const char* sql, const Params& params,
                  Error* out_error = nullptr) {
    Sqlite3Statement stmt = Compile(sql, out_error);
    if (!stmt.Valid()) { return -1; }
    Error err = stmt.Bind(params);
    if (!err.ok()) {
      Report(out_error, err);
      return -1;
    }
    return stmt.ExecDml(out_error);
  }

  /// Execute one parameterized query. Returns a reader positioned on the
  /// first row (Eof() when the result is empty).
  Sqlite3Reader Query(const char* sql, const Params& params,
                      Error* out_error = nullptr) {
    Sqlite3Statement stmt = Compile(sql, out_error);
    if (!stmt.Valid()) { return Sqlite3Reader{}; }
    Error err = stmt.Bind(params);
    if (!err.ok()) {
      Report(out_error, err);
      return Sqlite3Reader{};
    }
    return stmt.ExecQuery(out_error);
  }

  /// Compile a prepared statement.
  Sqlite3Statement Compile(const char* sql, Error* out_error = nullptr) {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return Sqlite3Statement{};
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return Sqlite3Statement{};
    }

    const char* tail = nullptr;
    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, &tail);
    if (rc != SQLITE_OK || stmt == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(rc != SQLITE_OK ? Sqlite3Statement::MapResultCode(rc)
                                       : ErrorCode::kMisuse,
                       rc != SQLITE_OK ? sqlite3_errmsg(db_) : "empty sql");
      }
      if (stmt != nullptr) { sqlite3_finalize(stmt); }
      return Sqlite3Statement{};
    }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Transaction ---

  /// SQLite3 transactions are serializable; ReadUncommitted only relaxes
  /// reads in shared-cache mode.
  Error Begin(IsolationLevel level) {
    Error err;
    ExecDml(level == IsolationLevel::kReadUncommitted
                ? "PRAGMA read_uncommitted = 1;"
                : "PRAGMA read_uncommitted = 0;",
            &err);
    if (!err.ok()) { return err; }
    ExecDml("BEGIN DEFERRED TRANSACTION;", &err);
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT TRANSACTION;", &err);
    return err;
  }

  Error Rollback() {
    if (!InTransaction()) { return Error::Ok(); }
    Error err;
    ExecDml("ROLLBACK;", &err);
    return err;
  }

  bool InTransaction() const {
    if (db_ == nullptr) { return false; }
    return sqlite3_get_autocommit(db_) == 0;
  }

  // --- Misc ---

  bool TableExists(const char* table) {
    if (db_ == nullptr || table == nullptr) { return false; }
    Error err;
    Sqlite3Reader r = Query(
        "SELECT count(*) FROM sqlite_master WHERE type='table' AND name=:t;",
        Params().Set("t", table), &err);
    return err.ok() && !r.Eof() && r.GetInt(0) > 0;
  }

 private:
  sqlite3* db_ = nullptr;
};

}  // namespace txpp
