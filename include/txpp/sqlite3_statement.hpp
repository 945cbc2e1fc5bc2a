// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Named parameters only (@name, :name, $name), bound from txpp::Params
//   - ExecDml() for INSERT/UPDATE/DELETE, ExecQuery() for SELECT

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "txpp/error.hpp"
#include "txpp/sqlite3_reader.hpp"
#include "txpp/value.hpp"

namespace txpp {

class Sqlite3Session;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Execute DML (INSERT/UPDATE/DELETE). Returns affected row count,
  /// or -1 on error.
  int64_t ExecDml(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return -1;
    }

    int32_t rc = sqlite3_step(stmt_);
    while (rc == SQLITE_ROW) { rc = sqlite3_step(stmt_); }
    if (rc == SQLITE_DONE) {
      int64_t changes = static_cast<int64_t>(sqlite3_changes(db_));
      sqlite3_reset(stmt_);
      return changes;
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
      out_error->code = MapResultCode(sqlite3_extended_errcode(db_));
    }
    sqlite3_reset(stmt_);
    return -1;
  }

  /// Execute SELECT query. Returns Sqlite3Reader for iteration.
  /// Note: after ExecQuery(), the statement handle is transferred to
  /// the returned reader. This statement becomes empty.
  Sqlite3Reader ExecQuery(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return Sqlite3Reader{};
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      Sqlite3Reader r(db_, stmt_, rc == SQLITE_DONE);
      stmt_ = nullptr;  // ownership transferred
      return r;
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
      out_error->code = MapResultCode(sqlite3_extended_errcode(db_));
    }
    sqlite3_reset(stmt_);
    return Sqlite3Reader{};
  }

  // --- Bind ---

  /// Bind every placeholder of the statement from `params`. Positional
  /// '?' placeholders are rejected, a placeholder without a binding is
  /// kNotFound. Bindings the statement does not use are ignored.
  Error Bind(const Params& params) {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t count = sqlite3_bind_parameter_count(stmt_);
    for (int32_t i = 1; i <= count; ++i) {
      const char* name = sqlite3_bind_parameter_name(stmt_, i);
      if (name == nullptr || name[0] == '?') {
        return Error::Make(ErrorCode::kMisuse,
                           "positional parameters are not supported");
      }
      const Value* value = params.Find(name);
      if (value == nullptr) {
        Error err;
        err.SetFormat(ErrorCode::kNotFound, "no value bound for '%s'", name);
        return err;
      }
      Error err = BindValue(i, *value);
      if (!err.ok()) { return err; }
    }
    return Error::Ok();
  }

  // --- Reset ---

  Error Reset() {
    if (stmt_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
    }
    int32_t rc = sqlite3_reset(stmt_);
    if (rc != SQLITE_OK) {
      return Error::Make(MapResultCode(rc),
                         db_ ? sqlite3_errmsg(db_) : "reset failed");
    }
    sqlite3_clear_bindings(stmt_);
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

  static ErrorCode MapResultCode(int32_t rc) {
    return MapSqliteResultCode(rc);
  }

 private:
  friend class Sqlite3Session;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  Error BindValue(int32_t idx, const Value& value) {
    int32_t rc = SQLITE_OK;
    switch (value.Type()) {
      case ValueType::kNull:
        rc = sqlite3_bind_null(stmt_, idx);
        break;
      case ValueType::kInt:
        rc = sqlite3_bind_int64(stmt_, idx,
                                static_cast<sqlite3_int64>(value.AsInt64()));
        break;
      case ValueType::kReal:
        rc = sqlite3_bind_double(stmt_, idx, value.AsDouble());
        break;
      case ValueType::kText:
        rc = sqlite3_bind_text(stmt_, idx, value.Bytes().data(),
                               static_cast<int>(value.Bytes().size()),
                               SQLITE_TRANSIENT);
        break;
      case ValueType::kBlob:
        rc = sqlite3_bind_blob(stmt_, idx, value.Bytes().data(),
                               static_cast<int>(value.Bytes().size()),
                               SQLITE_TRANSIENT);
        break;
    }
    if (rc != SQLITE_OK) {
      Error err;
      err.SetFormat(MapResultCode(rc), "bind parameter %d failed: %s", idx,
                    sqlite3_errstr(rc));
      return err;
    }
    return Error::Ok();
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace txpp
