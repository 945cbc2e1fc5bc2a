// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Sqlite3Reader -- forward-only, non-restartable row sequence.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Rows are produced lazily by Eof()/NextRow(); there is no rewind
//   - Typed field accessors with null defaults, ReadRow() materializes
//     the current row into a txpp::Row

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlite3.h"

#include "txpp/error.hpp"
#include "txpp/value.hpp"

namespace txpp {

class Sqlite3Session;
class Sqlite3Statement;

/// Map a (possibly extended) SQLite3 result code to an ErrorCode.
inline ErrorCode MapSqliteResultCode(int32_t rc) {
  switch (rc & 0xff) {
    case SQLITE_OK: return ErrorCode::kOk;
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return ErrorCode::kBusy;
    case SQLITE_NOTFOUND: return ErrorCode::kNotFound;
    case SQLITE_CONSTRAINT: return ErrorCode::kConstraint;
    case SQLITE_MISUSE: return ErrorCode::kMisuse;
    case SQLITE_RANGE: return ErrorCode::kRange;
    default: return ErrorCode::kError;
  }
}

// ---------------------------------------------------------------------------
// Sqlite3Reader
// ---------------------------------------------------------------------------

class Sqlite3Reader {
 public:
  Sqlite3Reader() = default;

  ~Sqlite3Reader() { Finalize(); }

  // Move
  Sqlite3Reader(Sqlite3Reader&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_),
        columns_(std::move(other.columns_)) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Reader& operator=(Sqlite3Reader&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      columns_ = std::move(other.columns_);
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Reader(const Sqlite3Reader&) = delete;
  Sqlite3Reader& operator=(const Sqlite3Reader&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (stmt_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      const char* col_name = sqlite3_column_name(stmt_, i);
      if (col_name != nullptr && std::strcmp(name, col_name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return sqlite3_column_name(stmt_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (Eof() || col < 0 || col >= num_fields_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Typed accessors ---

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int(stmt_, col);
  }

  int32_t GetInt(const char* name, int32_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt(idx, null_value) : null_value;
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int64(stmt_, col);
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_double(stmt_, col);
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    const unsigned char* val = sqlite3_column_text(stmt_, col);
    return (val != nullptr) ? reinterpret_cast<const char*>(val) : null_value;
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  /// Copy the current row out of the statement.
  Row ReadRow() const {
    std::vector<Value> values;
    if (Eof()) { return Row(columns_, std::move(values)); }
    values.reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      switch (sqlite3_column_type(stmt_, i)) {
        case SQLITE_INTEGER:
          values.emplace_back(
              static_cast<int64_t>(sqlite3_column_int64(stmt_, i)));
          break;
        case SQLITE_FLOAT:
          values.emplace_back(sqlite3_column_double(stmt_, i));
          break;
        case SQLITE_TEXT:
          values.emplace_back(std::string(
              reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i)),
              static_cast<size_t>(sqlite3_column_bytes(stmt_, i))));
          break;
        case SQLITE_BLOB:
          values.push_back(Value::Blob(
              static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, i)),
              static_cast<size_t>(sqlite3_column_bytes(stmt_, i))));
          break;
        default:
          values.emplace_back();
          break;
      }
    }
    return Row(columns_, std::move(values));
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Advance to the next row. A step error ends the sequence and is
  /// reported through out_error.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr || eof_) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      out_error->Set(MapSqliteResultCode(sqlite3_extended_errcode(db_)),
                     sqlite3_errmsg(db_));
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class Sqlite3Session;
  friend class Sqlite3Statement;

  Sqlite3Reader(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
      auto names = std::make_shared<std::vector<std::string>>();
      names->reserve(static_cast<size_t>(num_fields_));
      for (int32_t i = 0; i < num_fields_; ++i) {
        const char* name = sqlite3_column_name(stmt_, i);
        names->emplace_back(name != nullptr ? name : "");
      }
      columns_ = std::move(names);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
  ColumnNames columns_;
};

}  // namespace txpp
