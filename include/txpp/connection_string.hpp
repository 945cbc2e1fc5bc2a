// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::ConnectionOptions -- connection string parsing.
//
// Format: "<target>[;Key=Value]*"
//   <target>     backend specific: SQLite path / "file:" URI, or the MariaDB
//                DSN "host:port:user:password:database"
//   Enlist       true|false|yes|no|1|0 (default true): auto-enlist in the
//                current ambient transaction scope
//   BusyTimeout  milliseconds, >= 0 (default 0: driver default)
//
// Keys are case-insensitive, whitespace around keys and values is ignored.

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "txpp/error.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// ConnectionOptions
// ---------------------------------------------------------------------------

struct ConnectionOptions {
  static constexpr uint32_t kMaxTargetLen = 512;

  char target[kMaxTargetLen] = {};
  bool enlist = true;
  int32_t busy_timeout_ms = 0;

  Error Parse(const char* conn_str) {
    if (conn_str == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "connection string is null");
    }
    if (std::strlen(conn_str) >= kMaxTargetLen) {
      return Error::Make(ErrorCode::kRange, "connection string too long");
    }

    char buf[kMaxTargetLen];
    std::strncpy(buf, conn_str, sizeof(buf) - 1);
    buf[sizeof(buf) - 1] = '\0';

    ConnectionOptions parsed;
    char* segment = buf;
    bool first = true;
    while (segment != nullptr) {
      char* next = std::strchr(segment, ';');
      if (next != nullptr) { *next++ = '\0'; }

      if (first) {
        char* t = Trim(segment);
        if (t[0] == '\0') {
          return Error::Make(ErrorCode::kMisuse,
                             "connection string has an empty target");
        }
        std::strncpy(parsed.target, t, kMaxTargetLen - 1);
        first = false;
      } else {
        Error err = parsed.ParseOption(segment);
        if (!err.ok()) { return err; }
      }
      segment = next;
    }

    *this = parsed;
    return Error::Ok();
  }

  /// Whether the target names a private in-memory (or temporary) SQLite
  /// database, which no second connection can share.
  bool IsInMemory() const {
    if (target[0] == '\0' || std::strcmp(target, ":memory:") == 0) {
      return true;
    }
    if (std::strncmp(target, "file:", 5) != 0) { return false; }
    return std::strncmp(target + 5, ":memory:", 8) == 0 ||
           std::strstr(target, "mode=memory") != nullptr;
  }

 private:
  Error ParseOption(char* segment) {
    char* s = Trim(segment);
    if (s[0] == '\0') { return Error::Ok(); }  // tolerate "a;;b" and a trailing ';'

    char* eq = std::strchr(s, '=');
    if (eq == nullptr) {
      Error err;
      err.SetFormat(ErrorCode::kMisuse, "option '%s' has no value", s);
      return err;
    }
    *eq = '\0';
    char* key = Trim(s);
    char* value = Trim(eq + 1);

    if (EqualsNoCase(key, "Enlist")) {
      if (EqualsNoCase(value, "true") || EqualsNoCase(value, "yes") ||
          std::strcmp(value, "1") == 0) {
        enlist = true;
      } else if (EqualsNoCase(value, "false") || EqualsNoCase(value, "no") ||
                 std::strcmp(value, "0") == 0) {
        enlist = false;
      } else {
        Error err;
        err.SetFormat(ErrorCode::kRange, "invalid Enlist value '%s'", value);
        return err;
      }
      return Error::Ok();
    }

    if (EqualsNoCase(key, "BusyTimeout")) {
      char* end = nullptr;
      long ms = std::strtol(value, &end, 10);
      if (value[0] == '\0' || end == nullptr || *end != '\0' || ms < 0 ||
          ms > INT32_MAX) {
        Error err;
        err.SetFormat(ErrorCode::kRange, "invalid BusyTimeout value '%s'",
                      value);
        return err;
      }
      busy_timeout_ms = static_cast<int32_t>(ms);
      return Error::Ok();
    }

    Error err;
    err.SetFormat(ErrorCode::kMisuse, "unknown connection option '%s'", key);
    return err;
  }

  static char* Trim(char* s) {
    while (*s != '\0' && std::isspace(static_cast<unsigned char>(*s))) { ++s; }
    size_t len = std::strlen(s);
    while (len > 0 && std::isspace(static_cast<unsigned char>(s[len - 1]))) {
      s[--len] = '\0';
    }
    return s;
  }

  static bool EqualsNoCase(const char* a, const char* b) {
    while (*a != '\0' && *b != '\0') {
      if (std::tolower(static_cast<unsigned char>(*a)) !=
          std::tolower(static_cast<unsigned char>(*b))) {
        return false;
      }
      ++a;
      ++b;
    }
    return *a == *b;
  }
};

}  // namespace txpp
