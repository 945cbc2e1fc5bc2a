// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Batch -- pending row changes for one table, applied atomically.
//
// Design:
//   - Inserts, keyed updates and keyed deletes are queued in memory and
//     turned into parameterized statements only when applied
//   - Apply() is all-or-nothing: inside a transaction context it runs under
//     a savepoint (rolled back on failure without dooming the context),
//     otherwise in its own short transaction
//   - After a failed Apply() every change stays pending so the caller can
//     fix the data and retry; a successful one clears them
//   - BulkLoad() is the insert-only fast path: consecutive inserts with the
//     same column list become multi-row INSERT statements
//   - Table and column names cannot be bound, so they are validated as
//     plain (optionally schema-qualified) identifiers

#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "txpp/connection.hpp"
#include "txpp/error.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction.hpp"
#include "txpp/transaction_context.hpp"
#include "txpp/value.hpp"

namespace txpp {

enum class MutationKind : uint8_t { kInsert, kUpdate, kDelete };

struct RowMutation {
  MutationKind kind = MutationKind::kInsert;
  Params key;
  Params values;
};

// ---------------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------------

class Batch {
 public:
  /// Bound parameters per multi-row INSERT, under SQLite's historic limit
  /// of 999 host parameters.
  static constexpr size_t kMaxBulkParams = 900;

  explicit Batch(const char* table, const char* connection_string = nullptr)
      : table_(table != nullptr ? table : ""),
        connection_string_(connection_string != nullptr ? connection_string
                                                        : "") {}

  const char* Table() const { return table_.c_str(); }

  void AddInsert(Params values) {
    RowMutation m;
    m.kind = MutationKind::kInsert;
    m.values = std::move(values);
    pending_.push_back(std::move(m));
  }

  void AddUpdate(Params key, Params values) {
    RowMutation m;
    m.kind = MutationKind::kUpdate;
    m.key = std::move(key);
    m.values = std::move(values);
    pending_.push_back(std::move(m));
  }

  void AddDelete(Params key) {
    RowMutation m;
    m.kind = MutationKind::kDelete;
    m.key = std::move(key);
    pending_.push_back(std::move(m));
  }

  size_t PendingCount() const { return pending_.size(); }
  const std::vector<RowMutation>& Pending() const { return pending_; }
  void Clear() { pending_.clear(); }

  // --- Apply ---

  /// Apply every pending change as one unit. Returns the total number of
  /// affected rows, or 0 with `out_error` set (changes stay pending).
  template <typename Backend>
  int64_t Apply(
      Connection<Backend>& conn,
      const typename Connection<Backend>::TransactionType* tx = nullptr,
      Error* out_error = nullptr) {
    return RunAtomically(
        conn, tx, out_error,
        [this](typename Backend::Session* session, int64_t* total) {
          std::string sql;
          Params params;
          for (const RowMutation& m : pending_) {
            Error err = BuildStatement(m, &sql, &params);
            if (!err.ok()) { return err; }
            int64_t n = session->Execute(sql.c_str(), params, &err);
            if (!err.ok()) { return err; }
            *total += n;
          }
          return Error::Ok();
        });
  }

  /// Apply through a connection opened from the batch's connection string.
  template <typename Backend>
  int64_t Apply(Error* out_error = nullptr) {
    Connection<Backend> conn;
    Error err = OpenOwn(&conn);
    if (!err.ok()) {
      Report(out_error, err);
      return 0;
    }
    int64_t total = Apply(conn, nullptr, out_error);
    CloseOwn(&conn, out_error);
    return total;
  }

  // --- Bulk load ---

  /// Insert every pending row with multi-row INSERT statements. Only
  /// inserts may be pending (kInvalidOperation otherwise).
  template <typename Backend>
  int64_t BulkLoad(
      Connection<Backend>& conn,
      const typename Connection<Backend>::TransactionType* tx = nullptr,
      Error* out_error = nullptr) {
    for (const RowMutation& m : pending_) {
      if (m.kind != MutationKind::kInsert) {
        Report(out_error, Error::Make(ErrorCode::kInvalidOperation,
                                      "bulk load accepts inserts only"));
        return 0;
      }
    }
    return RunAtomically(
        conn, tx, out_error,
        [this](typename Backend::Session* session, int64_t* total) {
          std::string sql;
          Params params;
          size_t begin = 0;
          while (begin < pending_.size()) {
            size_t end = 0;
            Error err = BuildBulkInsert(begin, &end, &sql, &params);
            if (!err.ok()) { return err; }
            int64_t n = session->Execute(sql.c_str(), params, &err);
            if (!err.ok()) { return err; }
            *total += n;
            begin = end;
          }
          return Error::Ok();
        });
  }

  template <typename Backend>
  int64_t BulkLoad(Error* out_error = nullptr) {
    Connection<Backend> conn;
    Error err = OpenOwn(&conn);
    if (!err.ok()) {
      Report(out_error, err);
      return 0;
    }
    int64_t total = BulkLoad(conn, nullptr, out_error);
    CloseOwn(&conn, out_error);
    return total;
  }

 private:
  template <typename Backend, typename Body>
  int64_t RunAtomically(Connection<Backend>& conn,
                        const typename Connection<Backend>::TransactionType* tx,
                        Error* out_error,
                        Body body) {
    Report(out_error, Error::Ok());
    if (pending_.empty()) { return 0; }
    Error err = Validate();
    if (!err.ok()) {
      Report(out_error, err);
      return 0;
    }
    if (tx != nullptr && tx->ConnectionId() != conn.Id()) {
      Report(out_error,
             Error::Make(ErrorCode::kConnectionMismatch,
                         "transaction belongs to another connection"));
      return 0;
    }

    std::shared_ptr<TransactionContext> ctx;
    err = conn.ResolveContext(tx != nullptr ? tx->Context() : nullptr, &ctx);
    if (err.ok()) { err = conn.AcquireUse(); }
    if (!err.ok()) {
      Report(out_error, err);
      return 0;
    }

    typename Backend::Session* session = conn.Session();
    const bool own_tx = (ctx == nullptr);
    if (own_tx) {
      err = session->Begin(IsolationLevel::kReadCommitted);
    } else {
      session->ExecDml("SAVEPOINT txpp_batch", &err);
    }

    int64_t total = 0;
    if (err.ok()) { err = body(session, &total); }
    if (err.ok()) {
      if (own_tx) {
        err = session->Commit();
      } else {
        session->ExecDml("RELEASE SAVEPOINT txpp_batch", &err);
      }
    }
    if (!err.ok()) { Undo(session, own_tx, ctx.get()); }
    conn.ReleaseUse();

    if (!err.ok()) {
      Log().debug("batch on {}: {} change(s) kept pending: {}", table_,
                  pending_.size(), err.message);
      Report(out_error, err);
      return 0;
    }
    Log().debug("batch on {}: applied {} change(s), {} row(s)", table_,
                pending_.size(), total);
    pending_.clear();
    return total;
  }

  template <typename Session>
  void Undo(Session* session, bool own_tx, TransactionContext* ctx) {
    Error err;
    if (own_tx) {
      err = session->Rollback();
    } else {
      session->ExecDml("ROLLBACK TO SAVEPOINT txpp_batch", &err);
      if (err.ok()) { session->ExecDml("RELEASE SAVEPOINT txpp_batch", &err); }
    }
    if (!err.ok()) {
      Log().error("batch on {}: undo failed: {}", table_, err.message);
      // The enclosing transaction may now hold half the batch.
      if (ctx != nullptr) { ctx->MarkFailed(err); }
    }
  }

  template <typename Backend>
  Error OpenOwn(Connection<Backend>* conn) const {
    if (connection_string_.empty()) {
      return Error::Make(ErrorCode::kMisuse, "batch has no connection string");
    }
    return conn->Open(connection_string_.c_str());
  }

  template <typename Backend>
  static void CloseOwn(Connection<Backend>* conn, Error* out_error) {
    Error err = conn->Close();
    if (!err.ok()) {
      if (out_error != nullptr && out_error->ok()) { *out_error = err; }
      Log().error("batch connection close failed: {}", err.message);
    }
  }

  // --- Statement building ---

  Error Validate() const {
    if (!IsIdentifier(table_.c_str(), true)) {
      return Error::Make(ErrorCode::kMisuse, "invalid table name");
    }
    for (const RowMutation& m : pending_) {
      if (m.kind != MutationKind::kDelete && m.values.Empty()) {
        return Error::Make(ErrorCode::kMisuse, "change has no column values");
      }
      if (m.kind != MutationKind::kInsert && m.key.Empty()) {
        return Error::Make(ErrorCode::kMisuse, "change has no key columns");
      }
      for (const auto& b : m.values) {
        if (!IsIdentifier(b.first.c_str(), false)) {
          return Error::Make(ErrorCode::kMisuse, "invalid column name");
        }
      }
      for (const auto& b : m.key) {
        if (!IsIdentifier(b.first.c_str(), false)) {
          return Error::Make(ErrorCode::kMisuse, "invalid key column name");
        }
      }
    }
    return Error::Ok();
  }

  Error BuildStatement(const RowMutation& m, std::string* sql,
                       Params* params) const {
    *params = Params();
    sql->clear();
    switch (m.kind) {
      case MutationKind::kInsert: {
        std::string cols;
        std::string vals;
        for (const auto& b : m.values) {
          if (!cols.empty()) {
            cols += ", ";
            vals += ", ";
          }
          cols += b.first;
          vals += ":v_" + b.first;
          params->Set(("v_" + b.first).c_str(), b.second);
        }
        *sql = "INSERT INTO " + table_ + " (" + cols + ") VALUES (" + vals +
               ")";
        break;
      }
      case MutationKind::kUpdate: {
        *sql = "UPDATE " + table_ + " SET ";
        bool first = true;
        for (const auto& b : m.values) {
          if (!first) { *sql += ", "; }
          first = false;
          *sql += b.first + " = :v_" + b.first;
          params->Set(("v_" + b.first).c_str(), b.second);
        }
        AppendWhere(m.key, sql, params);
        break;
      }
      case MutationKind::kDelete:
        *sql = "DELETE FROM " + table_;
        AppendWhere(m.key, sql, params);
        break;
    }
    return Error::Ok();
  }

  static void AppendWhere(const Params& key, std::string* sql,
                          Params* params) {
    bool first = true;
    for (const auto& b : key) {
      *sql += first ? " WHERE " : " AND ";
      first = false;
      *sql += b.first + " = :k_" + b.first;
      params->Set(("k_" + b.first).c_str(), b.second);
    }
  }

  /// Build one multi-row INSERT from pending_[begin], covering the
  /// following rows that share its column list. `*end` is one past the
  /// last row used.
  Error BuildBulkInsert(size_t begin, size_t* end, std::string* sql,
                        Params* params) const {
    const Params& head = pending_[begin].values;
    const size_t ncols = head.Size();
    const size_t max_rows =
        ncols >= kMaxBulkParams ? 1 : kMaxBulkParams / ncols;

    *params = Params();
    *sql = "INSERT INTO " + table_ + " (";
    bool first = true;
    for (const auto& b : head) {
      if (!first) { *sql += ", "; }
      first = false;
      *sql += b.first;
    }
    *sql += ") VALUES ";

    size_t row = 0;
    size_t i = begin;
    while (i < pending_.size() && row < max_rows &&
           SameColumns(head, pending_[i].values)) {
      *sql += row == 0 ? "(" : ", (";
      const std::string prefix = "r" + std::to_string(row) + "_";
      bool first_col = true;
      for (const auto& b : pending_[i].values) {
        if (!first_col) { *sql += ", "; }
        first_col = false;
        *sql += ":" + prefix + b.first;
        params->Set((prefix + b.first).c_str(), b.second);
      }
      *sql += ")";
      ++row;
      ++i;
    }
    *end = i;
    return Error::Ok();
  }

  static bool SameColumns(const Params& a, const Params& b) {
    if (a.Size() != b.Size()) { return false; }
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end(); ++ia, ++ib) {
      if (ia->first != ib->first) { return false; }
    }
    return true;
  }

  static bool IsIdentifier(const char* name, bool allow_schema) {
    if (name == nullptr || name[0] == '\0') { return false; }
    bool at_start = true;
    for (const char* p = name; *p != '\0'; ++p) {
      unsigned char c = static_cast<unsigned char>(*p);
      if (c == '.' && allow_schema && !at_start) {
        allow_schema = false;
        at_start = true;
        continue;
      }
      if (at_start ? (std::isalpha(c) || c == '_')
                   : (std::isalnum(c) || c == '_')) {
        at_start = false;
        continue;
      }
      return false;
    }
    return !at_start;
  }

  std::string table_;
  std::string connection_string_;
  std::vector<RowMutation> pending_;
};

}  // namespace txpp
