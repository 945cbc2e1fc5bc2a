// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::MariaReader -- forward-only row sequence for MariaDB/MySQL.
//
// Design:
//   - Wraps MYSQL_RES* (mysql_store_result) with RAII
//   - Move-only (no copy), no rewind
//   - Forward iteration via Eof()/NextRow()
//   - ReadRow() types numeric columns, everything else stays text
//   - API-compatible with Sqlite3Reader for the transaction layer templates

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <mysql.h>

#include "txpp/error.hpp"
#include "txpp/value.hpp"

namespace txpp {

class MariaSession;

// ---------------------------------------------------------------------------
// MariaReader
// ---------------------------------------------------------------------------

class MariaReader {
 public:
  MariaReader() = default;

  ~MariaReader() { Finalize(); }

  // Move
  MariaReader(MariaReader&& other) noexcept
      : res_(other.res_),
        row_(other.row_),
        lengths_(other.lengths_),
        fields_(other.fields_),
        eof_(other.eof_),
        num_fields_(other.num_fields_),
        columns_(std::move(other.columns_)) {
    other.res_ = nullptr;
    other.row_ = nullptr;
    other.lengths_ = nullptr;
    other.fields_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  MariaReader& operator=(MariaReader&& other) noexcept {
    if (this != &other) {
      Finalize();
      res_ = other.res_;
      row_ = other.row_;
      lengths_ = other.lengths_;
      fields_ = other.fields_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      columns_ = std::move(other.columns_);
      other.res_ = nullptr;
      other.row_ = nullptr;
      other.lengths_ = nullptr;
      other.fields_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  MariaReader(const MariaReader&) = delete;
  MariaReader& operator=(const MariaReader&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldIndex(const char* name) const {
    if (fields_ == nullptr || name == nullptr) { return -1; }
    for (int32_t i = 0; i < num_fields_; ++i) {
      if (fields_[i].name != nullptr &&
          std::strcmp(name, fields_[i].name) == 0) {
        return i;
      }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (fields_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    return fields_[col].name;
  }

  bool FieldIsNull(int32_t col) const {
    if (row_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return row_[col] == nullptr;
  }

  // --- Typed accessors ---

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int32_t>(std::strtol(row_[col], nullptr, 10));
  }

  int32_t GetInt(const char* name, int32_t null_value = 0) const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetInt(idx, null_value) : null_value;
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return static_cast<int64_t>(std::strtoll(row_[col], nullptr, 10));
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    if (FieldIsNull(col)) { return null_value; }
    return std::strtod(row_[col], nullptr);
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    return row_[col];
  }

  const char* GetString(const char* name,
                        const char* null_value = "") const {
    int32_t idx = FieldIndex(name);
    return (idx >= 0) ? GetString(idx, null_value) : null_value;
  }

  /// Copy the current row out of the result.
  Row ReadRow() const {
    std::vector<Value> values;
    if (Eof()) { return Row(columns_, std::move(values)); }
    values.reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      if (row_[i] == nullptr) {
        values.emplace_back();
        continue;
      }
      switch (fields_[i].type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
          values.emplace_back(
              static_cast<int64_t>(std::strtoll(row_[i], nullptr, 10)));
          break;
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
          values.emplace_back(std::strtod(row_[i], nullptr));
          break;
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
          // charsetnr 63 is "binary"; TEXT columns share the BLOB types
          if (fields_[i].charsetnr == 63) {
            values.push_back(Value::Blob(
                reinterpret_cast<const uint8_t*>(row_[i]),
                static_cast<size_t>(lengths_[i])));
            break;
          }
          values.emplace_back(
              std::string(row_[i], static_cast<size_t>(lengths_[i])));
          break;
        default:
          values.emplace_back(
              std::string(row_[i], static_cast<size_t>(lengths_[i])));
          break;
      }
    }
    return Row(columns_, std::move(values));
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Rows are fully buffered by mysql_store_result, a fetch cannot fail.
  void NextRow(Error* out_error = nullptr) {
    (void)out_error;
    if (res_ == nullptr || eof_) { return; }
    row_ = mysql_fetch_row(res_);
    if (row_ != nullptr) {
      lengths_ = mysql_fetch_lengths(res_);
    } else {
      eof_ = true;
      lengths_ = nullptr;
    }
  }

  void Finalize() {
    if (res_ != nullptr) {
      mysql_free_result(res_);
      res_ = nullptr;
    }
    row_ = nullptr;
    lengths_ = nullptr;
    fields_ = nullptr;
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class MariaSession;

  explicit MariaReader(MYSQL_RES* res) : res_(res) {
    if (res_ == nullptr) { return; }
    num_fields_ = static_cast<int32_t>(mysql_num_fields(res_));
    fields_ = mysql_fetch_fields(res_);
    auto names = std::make_shared<std::vector<std::string>>();
    names->reserve(static_cast<size_t>(num_fields_));
    for (int32_t i = 0; i < num_fields_; ++i) {
      names->emplace_back(fields_[i].name != nullptr ? fields_[i].name : "");
    }
    columns_ = std::move(names);
    row_ = mysql_fetch_row(res_);
    if (row_ != nullptr) {
      lengths_ = mysql_fetch_lengths(res_);
      eof_ = false;
    }
  }

  MYSQL_RES* res_ = nullptr;
  MYSQL_ROW row_ = nullptr;
  unsigned long* lengths_ = nullptr;
  MYSQL_FIELD* fields_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
  ColumnNames columns_;
};

}  // namespace txpp
