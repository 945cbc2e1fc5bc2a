// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::MariaSession -- one physical MariaDB/MySQL connection with RAII.
//
// Design:
//   - Wraps MYSQL* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error return / Error* output parameter
//   - Named parameters (@name, :name) are expanded client side into
//     escaped literals; quoted text, quoted identifiers, comments and
//     @@system variables are copied untouched
//   - API-compatible with Sqlite3Session for the transaction layer templates
//
// Target format: "host:port:user:password:database"
//   e.g. "localhost:3306:root:pass:testdb"
//   or   "127.0.0.1:3306:root::mydb" (empty password)

#pragma once

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <mysql.h>

#include "txpp/connection_string.hpp"
#include "txpp/error.hpp"
#include "txpp/isolation.hpp"
#include "txpp/maria_reader.hpp"
#include "txpp/value.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// MariaSession
// ---------------------------------------------------------------------------

class MariaSession {
 public:
  MariaSession() = default;

  ~MariaSession() { Close(); }

  // Move
  MariaSession(MariaSession&& other) noexcept
      : conn_(other.conn_), in_transaction_(other.in_transaction_) {
    other.conn_ = nullptr;
    other.in_transaction_ = false;
  }

  MariaSession& operator=(MariaSession&& other) noexcept {
    if (this != &other) {
      Close();
      conn_ = other.conn_;
      in_transaction_ = other.in_transaction_;
      other.conn_ = nullptr;
      other.in_transaction_ = false;
    }
    return *this;
  }

  // No copy
  MariaSession(const MariaSession&) = delete;
  MariaSession& operator=(const MariaSession&) = delete;

  // --- Open / Close ---

  /// Fields can be empty. Minimal: "localhost:3306:root::testdb"
  Error Open(const ConnectionOptions& options) {
    if (options.target[0] == '\0') {
      return Error::Make(ErrorCode::kNullParam, "target is empty");
    }
    Close();

    // Parse DSN: host:port:user:password:database
    char buf[ConnectionOptions::kMaxTargetLen];
    std::strncpy(buf, options.target, sizeof(buf) - 1);
    buf[sizeof(buf) - 1] = '\0';

    const char* host = "localhost";
    uint16_t port = 3306;
    const char* user = "root";
    const char* password = nullptr;
    const char* database = nullptr;

    char* parts[5] = {};
    int32_t count = 1;
    char* p = buf;
    parts[0] = p;
    while (*p != '\0' && count < 5) {
      if (*p == ':') {
        *p = '\0';
        parts[count++] = p + 1;
      }
      ++p;
    }

    if (parts[0][0] != '\0') { host = parts[0]; }
    if (count >= 2 && parts[1][0] != '\0') {
      port = static_cast<uint16_t>(std::strtoul(parts[1], nullptr, 10));
    }
    if (count >= 3 && parts[2][0] != '\0') { user = parts[2]; }
    if (count >= 4 && parts[3][0] != '\0') { password = parts[3]; }
    if (count >= 5 && parts[4][0] != '\0') { database = parts[4]; }

    conn_ = mysql_init(nullptr);
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kError, "mysql_init failed");
    }

    if (options.busy_timeout_ms > 0) {
      unsigned int seconds =
          static_cast<unsigned int>((options.busy_timeout_ms + 999) / 1000);
      mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
    }

    if (mysql_real_connect(conn_, host, user, password, database,
                           port, nullptr, 0) == nullptr) {
      Error err = Error::Make(ErrorCode::kError, mysql_error(conn_));
      mysql_close(conn_);
      conn_ = nullptr;
      return err;
    }

    mysql_set_character_set(conn_, "utf8mb4");
    if (options.busy_timeout_ms > 0) {
      char sql[96];
      std::snprintf(sql, sizeof(sql),
                    "SET SESSION innodb_lock_wait_timeout = %d",
                    (options.busy_timeout_ms + 999) / 1000);
      Error err;
      ExecDml(sql, &err);
      if (!err.ok()) {
        Close();
        return err;
      }
    }
    return Error::Ok();
  }

  void Close() {
    if (conn_ != nullptr) {
      mysql_close(conn_);
      conn_ = nullptr;
    }
    in_transaction_ = false;
  }

  bool IsOpen() const { return conn_ != nullptr; }

  // --- DML ---

  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (conn_ == nullptr) {
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

    if (mysql_query(conn_, sql) != 0) {
      if (out_error != nullptr) {
        out_error->Set(MapErrno(mysql_errno(conn_)), mysql_error(conn_));
      }
      return -1;
    }
    DiscardResult();

    int64_t affected = static_cast<int64_t>(mysql_affected_rows(conn_));
    return static_cast<int32_t>(affected);
  }

  // --- Parameterized execution ---

  int64_t Execute(const char* sql, const Params& params,
                  Error* out_error = nullptr) {
    std::string text;
    if (!Prepare(sql, params, &text, out_error)) { return -1; }

    if (mysql_real_query(conn_, text.data(),
                         static_cast<unsigned long>(text.size())) != 0) {
      if (out_error != nullptr) {
        out_error->Set(MapErrno(mysql_errno(conn_)), mysql_error(conn_));
      }
      return -1;
    }
    DiscardResult();
    return static_cast<int64_t>(mysql_affected_rows(conn_));
  }

  MariaReader Query(const char* sql, const Params& params,
                    Error* out_error = nullptr) {
    std::string text;
    if (!Prepare(sql, params, &text, out_error)) { return MariaReader{}; }

    if (mysql_real_query(conn_, text.data(),
                         static_cast<unsigned long>(text.size())) != 0) {
      if (out_error != nullptr) {
        out_error->Set(MapErrno(mysql_errno(conn_)), mysql_error(conn_));
      }
      return MariaReader{};
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res == nullptr) {
      // Could be a non-SELECT or an error
      if (mysql_field_count(conn_) > 0 && out_error != nullptr) {
        out_error->Set(MapErrno(mysql_errno(conn_)), mysql_error(conn_));
      }
      return MariaReader{};
    }
    return MariaReader(res);
  }

  // --- Transaction ---

  Error Begin(IsolationLevel level) {
    char sql[80];
    std::snprintf(sql, sizeof(sql), "SET TRANSACTION ISOLATION LEVEL %s",
                  IsolationSql(level));
    Error err;
    ExecDml(sql, &err);
    if (!err.ok()) { return err; }
    ExecDml(level == IsolationLevel::kSnapshot
                ? "START TRANSACTION WITH CONSISTENT SNAPSHOT"
                : "START TRANSACTION",
            &err);
    if (err.ok()) { in_transaction_ = true; }
    return err;
  }

  Error Commit() {
    Error err;
    ExecDml("COMMIT", &err);
    in_transaction_ = false;
    return err;
  }

  Error Rollback() {
    if (!in_transaction_) { return Error::Ok(); }
    Error err;
    ExecDml("ROLLBACK", &err);
    in_transaction_ = false;
    return err;
  }

  bool InTransaction() const { return in_transaction_; }

  // --- Misc ---

  bool TableExists(const char* table) {
    if (conn_ == nullptr || table == nullptr) { return false; }
    Error err;
    MariaReader r = Query(
        "SELECT COUNT(*) FROM information_schema.tables "
        "WHERE table_schema = DATABASE() AND table_name = @t",
        Params().Set("t", table), &err);
    return err.ok() && !r.Eof() && r.GetInt(0) > 0;
  }

  /// Expand named parameters of `sql` into literals. Text escaping needs
  /// the open connection's character set.
  Error ExpandParams(const char* sql, const Params& params,
                     std::string* out) const {
    if (conn_ == nullptr) {
      return Error::Make(ErrorCode::kNotOpen, "Database not open");
    }
    out->clear();
    const size_t n = std::strlen(sql);
    out->reserve(n + 16);
    size_t i = 0;
    while (i < n) {
      char c = sql[i];
      if (c == '\'' || c == '"' || c == '`') {
        size_t end = SkipQuoted(sql, n, i);
        out->append(sql + i, end - i);
        i = end;
        continue;
      }
      if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
        const char* nl = std::strchr(sql + i, '\n');
        size_t end = (nl != nullptr) ? static_cast<size_t>(nl - sql) : n;
        out->append(sql + i, end - i);
        i = end;
        continue;
      }
      if (c == '@' && i + 1 < n && sql[i + 1] == '@') {
        size_t end = i + 2;
        while (end < n && IsIdentChar(sql[end])) { ++end; }
        out->append(sql + i, end - i);
        i = end;
        continue;
      }
      if ((c == '@' || c == ':') && i + 1 < n && IsIdentStart(sql[i + 1])) {
        size_t end = i + 1;
        while (end < n && IsIdentChar(sql[end])) { ++end; }
        std::string name(sql + i + 1, end - i - 1);
        const Value* value = params.Find(name.c_str());
        if (value == nullptr) {
          Error err;
          err.SetFormat(ErrorCode::kNotFound, "no value bound for '%c%s'", c,
                        name.c_str());
          return err;
        }
        AppendLiteral(*value, out);
        i = end;
        continue;
      }
      out->push_back(c);
      ++i;
    }
    return Error::Ok();
  }

 private:
  bool Prepare(const char* sql, const Params& params, std::string* text,
               Error* out_error) {
    if (conn_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return false;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return false;
    }
    Error err = ExpandParams(sql, params, text);
    if (!err.ok()) {
      Report(out_error, err);
      return false;
    }
    return true;
  }

  void DiscardResult() {
    MYSQL_RES* res = mysql_store_result(conn_);
    if (res != nullptr) { mysql_free_result(res); }
  }

  void AppendLiteral(const Value& value, std::string* out) const {
    switch (value.Type()) {
      case ValueType::kNull:
        out->append("NULL");
        return;
      case ValueType::kInt:
      case ValueType::kReal:
        out->append(value.AsString());
        return;
      case ValueType::kText: {
        const std::string& src = value.Bytes();
        std::vector<char> buf(src.size() * 2 + 1);
        unsigned long len = mysql_real_escape_string(
            conn_, buf.data(), src.data(),
            static_cast<unsigned long>(src.size()));
        out->push_back('\'');
        out->append(buf.data(), len);
        out->push_back('\'');
        return;
      }
      case ValueType::kBlob: {
        static const char kHex[] = "0123456789ABCDEF";
        out->append("X'");
        for (unsigned char b : value.Bytes()) {
          out->push_back(kHex[b >> 4]);
          out->push_back(kHex[b & 0x0f]);
        }
        out->push_back('\'');
        return;
      }
    }
  }

  static size_t SkipQuoted(const char* sql, size_t n, size_t start) {
    char quote = sql[start];
    size_t i = start + 1;
    while (i < n) {
      if (sql[i] == '\\' && quote != '`' && i + 1 < n) {
        i += 2;
        continue;
      }
      if (sql[i] == quote) {
        if (i + 1 < n && sql[i + 1] == quote) {  // doubled quote
          i += 2;
          continue;
        }
        return i + 1;
      }
      ++i;
    }
    return n;
  }

  static bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
  }

  static bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  }

  static const char* IsolationSql(IsolationLevel level) {
    switch (level) {
      case IsolationLevel::kReadUncommitted: return "READ UNCOMMITTED";
      case IsolationLevel::kReadCommitted: return "READ COMMITTED";
      case IsolationLevel::kRepeatableRead:
      case IsolationLevel::kSnapshot: return "REPEATABLE READ";
      case IsolationLevel::kSerializable: return "SERIALIZABLE";
    }
    return "REPEATABLE READ";
  }

  static ErrorCode MapErrno(unsigned int err) {
    switch (err) {
      case 1205:  // ER_LOCK_WAIT_TIMEOUT
      case 1213:  // ER_LOCK_DEADLOCK
        return ErrorCode::kBusy;
      case 1062:  // ER_DUP_ENTRY
      case 1451:  // ER_ROW_IS_REFERENCED_2
      case 1452:  // ER_NO_REFERENCED_ROW_2
        return ErrorCode::kConstraint;
      case 2006:  // CR_SERVER_GONE_ERROR
      case 2013:  // CR_SERVER_LOST
        return ErrorCode::kNotOpen;
      default:
        return ErrorCode::kError;
    }
  }

  MYSQL* conn_ = nullptr;
  bool in_transaction_ = false;
};

}  // namespace txpp
