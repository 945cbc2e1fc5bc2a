// Copyright (c) 2024 liudegui. MIT License.
// Tests for txpp::Value, txpp::Params and txpp::Row.

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "txpp/value.hpp"

using namespace txpp;

TEST_CASE("Value: default is null", "[value]") {
  Value v;
  REQUIRE(v.IsNull());
  REQUIRE(v.Type() == ValueType::kNull);
  REQUIRE(v.AsInt64(-1) == -1);
  REQUIRE(std::strcmp(v.AsString("none"), "none") == 0);
}

TEST_CASE("Value: integers render as text", "[value]") {
  Value v(int64_t{-42});
  REQUIRE(v.Type() == ValueType::kInt);
  REQUIRE(v.AsInt64() == -42);
  REQUIRE(v.AsDouble() == -42.0);
  REQUIRE(std::strcmp(v.AsString(), "-42") == 0);
}

TEST_CASE("Value: text converts to numbers", "[value]") {
  Value v("123");
  REQUIRE(v.Type() == ValueType::kText);
  REQUIRE(v.AsInt() == 123);
  REQUIRE(v.AsDouble() == 123.0);
}

TEST_CASE("Value: null char pointer is null", "[value]") {
  const char* none = nullptr;
  Value v(none);
  REQUIRE(v.IsNull());
}

TEST_CASE("Value: blob keeps embedded zeros", "[value]") {
  const uint8_t data[] = {0x01, 0x00, 0x02};
  Value v = Value::Blob(data, sizeof(data));
  REQUIRE(v.Type() == ValueType::kBlob);
  REQUIRE(v.Bytes().size() == 3);
  REQUIRE(v.Bytes()[1] == '\0');
}

TEST_CASE("Value: equality compares type and content", "[value]") {
  REQUIRE(Value(1) == Value(int64_t{1}));
  REQUIRE(Value(1) != Value("1"));
  REQUIRE(Value::Null() == Value());
  REQUIRE(Value(1.5) != Value(2.5));
}

TEST_CASE("Params: set, find and replace", "[value]") {
  Params p;
  p.Set("id", 1).Set(":name", "alice");
  REQUIRE(p.Size() == 2);

  REQUIRE(p.Find("id") != nullptr);
  REQUIRE(p.Find("@name") != nullptr);
  REQUIRE(std::strcmp(p.Find("name")->AsString(), "alice") == 0);
  REQUIRE(p.Find("missing") == nullptr);

  p.Set("@id", 2);
  REQUIRE(p.Size() == 2);
  REQUIRE(p.Find("id")->AsInt() == 2);
}

TEST_CASE("Params: keeps insertion order", "[value]") {
  Params p;
  p.Set("b", 1).Set("a", 2).Set("c", 3);
  std::vector<std::string> names;
  for (const auto& b : p) { names.push_back(b.first); }
  REQUIRE(names == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("Params: empty name ignored", "[value]") {
  Params p;
  p.Set("", 1).Set(":", 2);
  REQUIRE(p.Empty());
}

TEST_CASE("Row: access by index and name", "[value]") {
  auto columns = std::make_shared<const std::vector<std::string>>(
      std::vector<std::string>{"id", "name", "score"});
  Row row(columns, {Value(7), Value("bob"), Value::Null()});

  REQUIRE(row.NumFields() == 3);
  REQUIRE(row.FieldIndex("name") == 1);
  REQUIRE(std::strcmp(row.FieldName(2), "score") == 0);
  REQUIRE(row.GetInt("id") == 7);
  REQUIRE(std::strcmp(row.GetString(1), "bob") == 0);
  REQUIRE(row.FieldIsNull(2));
  REQUIRE(row.GetDouble("score", -1.0) == -1.0);
}

TEST_CASE("Row: out of range is null", "[value]") {
  Row row;
  REQUIRE(row.NumFields() == 0);
  REQUIRE(row.FieldIsNull(5));
  REQUIRE(row.GetInt("nope", 9) == 9);
  REQUIRE(row.FieldName(0) == nullptr);
}
