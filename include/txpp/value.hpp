// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Value / Params / Row -- typed parameters and result rows.
//
// Design:
//   - Value is a small tagged value: Null, Int (int64), Real, Text, Blob
//   - Params is an ordered list of named bindings, looked up by name
//   - Row owns its values and shares the column names of its result
//   - Accessors take a null default, like the Query field accessors

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace txpp {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kInt,
  kReal,
  kText,
  kBlob,
};

class Value {
 public:
  Value() = default;
  Value(int32_t v) : type_(ValueType::kInt), int_(v) { RenderInt(); }
  Value(int64_t v) : type_(ValueType::kInt), int_(v) { RenderInt(); }
  Value(double v) : type_(ValueType::kReal), real_(v) { RenderReal(); }
  Value(const char* v) {
    if (v != nullptr) {
      type_ = ValueType::kText;
      text_ = v;
    }
  }
  Value(std::string v) : type_(ValueType::kText), text_(std::move(v)) {}

  static Value Null() { return Value{}; }

  static Value Blob(const uint8_t* data, size_t len) {
    Value v;
    v.type_ = ValueType::kBlob;
    if (data != nullptr && len > 0) {
      v.text_.assign(reinterpret_cast<const char*>(data), len);
    }
    return v;
  }

  ValueType Type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  int64_t AsInt64(int64_t null_value = 0) const {
    switch (type_) {
      case ValueType::kNull: return null_value;
      case ValueType::kInt: return int_;
      case ValueType::kReal: return static_cast<int64_t>(real_);
      default: return std::strtoll(text_.c_str(), nullptr, 10);
    }
  }

  int32_t AsInt(int32_t null_value = 0) const {
    if (type_ == ValueType::kNull) { return null_value; }
    return static_cast<int32_t>(AsInt64());
  }

  double AsDouble(double null_value = 0.0) const {
    switch (type_) {
      case ValueType::kNull: return null_value;
      case ValueType::kInt: return static_cast<double>(int_);
      case ValueType::kReal: return real_;
      default: return std::strtod(text_.c_str(), nullptr);
    }
  }

  /// Text rendering of the value; numeric values are pre-rendered.
  const char* AsString(const char* null_value = "") const {
    if (type_ == ValueType::kNull) { return null_value; }
    return text_.c_str();
  }

  /// Raw bytes for Text and Blob values.
  const std::string& Bytes() const { return text_; }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull: return true;
      case ValueType::kInt: return int_ == other.int_;
      case ValueType::kReal: return real_ == other.real_;
      default: return text_ == other.text_;
    }
  }
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  void RenderInt() {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(int_));
    text_ = buf;
  }

  void RenderReal() {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%.17g", real_);
    text_ = buf;
  }

  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double real_ = 0.0;
  std::string text_;
};

// ---------------------------------------------------------------------------
// Params
// ---------------------------------------------------------------------------

/// Strip a leading '@', ':' or '$' placeholder marker.
inline const char* BareParamName(const char* name) {
  if (name != nullptr && (name[0] == '@' || name[0] == ':' || name[0] == '$')) {
    return name + 1;
  }
  return name;
}

class Params {
 public:
  using Binding = std::pair<std::string, Value>;

  Params() = default;

  Params& Set(const char* name, Value value) {
    const char* bare = BareParamName(name);
    if (bare == nullptr || bare[0] == '\0') { return *this; }
    for (auto& b : bindings_) {
      if (b.first == bare) {
        b.second = std::move(value);
        return *this;
      }
    }
    bindings_.emplace_back(bare, std::move(value));
    return *this;
  }

  const Value* Find(const char* name) const {
    const char* bare = BareParamName(name);
    if (bare == nullptr) { return nullptr; }
    for (const auto& b : bindings_) {
      if (b.first == bare) { return &b.second; }
    }
    return nullptr;
  }

  size_t Size() const { return bindings_.size(); }
  bool Empty() const { return bindings_.empty(); }

  std::vector<Binding>::const_iterator begin() const {
    return bindings_.begin();
  }
  std::vector<Binding>::const_iterator end() const { return bindings_.end(); }

 private:
  std::vector<Binding> bindings_;
};

// ---------------------------------------------------------------------------
// Row
// ---------------------------------------------------------------------------

using ColumnNames = std::shared_ptr<const std::vector<std::string>>;

class Row {
 public:
  Row() = default;
  Row(ColumnNames columns, std::vector<Value> values)
      : columns_(std::move(columns)), values_(std::move(values)) {}

  int32_t NumFields() const { return static_cast<int32_t>(values_.size()); }

  int32_t FieldIndex(const char* name) const {
    if (columns_ == nullptr || name == nullptr) { return -1; }
    for (size_t i = 0; i < columns_->size(); ++i) {
      if ((*columns_)[i] == name) { return static_cast<int32_t>(i); }
    }
    return -1;
  }

  const char* FieldName(int32_t col) const {
    if (columns_ == nullptr || col < 0 ||
        col >= static_cast<int32_t>(columns_->size())) {
      return nullptr;
    }
    return (*columns_)[static_cast<size_t>(col)].c_str();
  }

  const Value& Get(int32_t col) const {
    static const Value kNullValue;
    if (col < 0 || col >= NumFields()) { return kNullValue; }
    return values_[static_cast<size_t>(col)];
  }

  const Value& Get(const char* name) const { return Get(FieldIndex(name)); }

  bool FieldIsNull(int32_t col) const { return Get(col).IsNull(); }

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    return Get(col).AsInt(null_value);
  }
  int32_t GetInt(const char* name, int32_t null_value = 0) const {
    return Get(name).AsInt(null_value);
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    return Get(col).AsInt64(null_value);
  }
  int64_t GetInt64(const char* name, int64_t null_value = 0) const {
    return Get(name).AsInt64(null_value);
  }

  double GetDouble(int32_t col, double null_value = 0.0) const {
    return Get(col).AsDouble(null_value);
  }
  double GetDouble(const char* name, double null_value = 0.0) const {
    return Get(name).AsDouble(null_value);
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    return Get(col).AsString(null_value);
  }
  const char* GetString(const char* name,
                        const char* null_value = "") const {
    return Get(name).AsString(null_value);
  }

 private:
  ColumnNames columns_;
  std::vector<Value> values_;
};

using RowSet = std::vector<Row>;

}  // namespace txpp
