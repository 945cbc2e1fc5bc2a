// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Command<Backend> -- SQL text plus parameters executed under the
// right transaction context.
//
// Design:
//   - Bound either to a caller-owned Connection (optionally with an
//     explicit Transaction of that same connection) or to a connection
//     string, in which case every execution opens and closes its own
//     connection (enlisting in the ambient transaction like any other)
//   - Result shape chosen per command: affected-row count, at most one row
//     (more is kCardinalityViolation), or all rows
//   - Copyable; ExecuteAsync() runs a copy on a std::async worker thread
//     inside a flow forked from the caller's ambient scopes
//   - Any failure inside a transaction context dooms that context

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "txpp/ambient_scope.hpp"
#include "txpp/connection.hpp"
#include "txpp/error.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction.hpp"
#include "txpp/transaction_context.hpp"
#include "txpp/value.hpp"

namespace txpp {

enum class ResultShape : uint8_t { kNonQuery, kSingleRow, kRows };

struct ExecutionResult {
  Error error;
  ResultShape shape = ResultShape::kNonQuery;
  int64_t rows_affected = 0;
  std::optional<Row> single;
  RowSet rows;

  bool ok() const { return error.ok(); }
};

// ---------------------------------------------------------------------------
// Command<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class Command {
 public:
  using ReaderType = typename Backend::Reader;

  Command() {
    status_.Set(ErrorCode::kInvalidState, "command has no connection");
  }

  Command(Connection<Backend>& conn, const char* sql,
          ResultShape shape = ResultShape::kNonQuery)
      : conn_(&conn), sql_(sql != nullptr ? sql : ""), shape_(shape) {
    if (sql == nullptr) {
      status_.Set(ErrorCode::kNullParam, "sql is null");
    }
  }

  Command(Connection<Backend>& conn, const Transaction<Backend>& tx,
          const char* sql, ResultShape shape = ResultShape::kNonQuery)
      : Command(conn, sql, shape) {
    if (!status_.ok()) { return; }
    if (!tx.Valid()) {
      status_.Set(ErrorCode::kInvalidState, "transaction is not valid");
    } else if (tx.ConnectionId() != conn.Id()) {
      status_.Set(ErrorCode::kConnectionMismatch,
                  "transaction belongs to another connection");
    } else {
      tx_ = tx.Context();
    }
  }

  Command(const char* connection_string, const char* sql,
          ResultShape shape = ResultShape::kNonQuery)
      : sql_(sql != nullptr ? sql : ""),
        connection_string_(connection_string != nullptr ? connection_string
                                                        : ""),
        shape_(shape) {
    if (sql == nullptr) {
      status_.Set(ErrorCode::kNullParam, "sql is null");
    } else if (connection_string == nullptr) {
      status_.Set(ErrorCode::kNullParam, "connection string is null");
    }
  }

  /// Build a command, reporting a construction failure through `out_error`.
  static Command Create(Connection<Backend>& conn,
                        const Transaction<Backend>* tx, const char* sql,
                        ResultShape shape, Error* out_error = nullptr) {
    Command cmd = tx != nullptr ? Command(conn, *tx, sql, shape)
                                : Command(conn, sql, shape);
    Report(out_error, cmd.status_);
    return cmd;
  }

  /// Construction result. A failed command sends nothing to the database.
  const Error& Status() const { return status_; }
  const char* Sql() const { return sql_.c_str(); }
  ResultShape Shape() const { return shape_; }

  // --- Execution ---

  ExecutionResult Execute(const Params& params = Params()) const {
    return Run(shape_, params);
  }

  /// Execute on a worker thread. The worker sees the caller's ambient
  /// transaction only if the innermost scope enabled async flow; otherwise
  /// (and without an explicit transaction) the result is
  /// kTransactionContextLost and nothing is executed.
  std::future<ExecutionResult> ExecuteAsync(Params params = Params()) const {
    FlowSnapshot snapshot = AmbientScopeManager::Capture();
    Command self = *this;
    return std::async(
        std::launch::async,
        [self, params = std::move(params),
         snapshot = std::move(snapshot)]() mutable {
          FlowScope flow(std::move(snapshot));
          if (self.tx_ == nullptr && flow.ContextLost()) {
            ExecutionResult result;
            result.shape = self.shape_;
            result.error.Set(ErrorCode::kTransactionContextLost,
                             "ambient transaction does not flow into the "
                             "asynchronous continuation");
            Log().error("flow {}: {}", flow.FlowId(), result.error.message);
            return result;
          }
          return self.Run(self.shape_, params);
        });
  }

  int64_t ExecuteNonQuery(const Params& params = Params(),
                          Error* out_error = nullptr) const {
    ExecutionResult result = Run(ResultShape::kNonQuery, params);
    Report(out_error, result.error);
    return result.ok() ? result.rows_affected : -1;
  }

  std::optional<Row> ExecuteSingle(const Params& params = Params(),
                                   Error* out_error = nullptr) const {
    ExecutionResult result = Run(ResultShape::kSingleRow, params);
    Report(out_error, result.error);
    if (!result.ok()) { return std::nullopt; }
    return std::move(result.single);
  }

  RowSet ExecuteRows(const Params& params = Params(),
                     Error* out_error = nullptr) const {
    ExecutionResult result = Run(ResultShape::kRows, params);
    Report(out_error, result.error);
    if (!result.ok()) { return RowSet(); }
    return std::move(result.rows);
  }

  /// Forward-only reader over the result. Needs a caller-owned connection,
  /// which must stay open while the reader is in use.
  ReaderType ExecuteReader(const Params& params = Params(),
                           Error* out_error = nullptr) const {
    if (!status_.ok()) {
      Report(out_error, status_);
      return ReaderType();
    }
    if (conn_ == nullptr) {
      Report(out_error,
             Error::Make(ErrorCode::kInvalidOperation,
                         "a reader needs a caller-owned connection"));
      return ReaderType();
    }
    std::shared_ptr<TransactionContext> ctx;
    Error err = conn_->ResolveContext(tx_, &ctx);
    if (!err.ok()) {
      Report(out_error, err);
      return ReaderType();
    }
    err = conn_->AcquireUse();
    if (!err.ok()) {
      Report(out_error, err);
      return ReaderType();
    }
    ReaderType reader = conn_->Session()->Query(sql_.c_str(), params, &err);
    conn_->ReleaseUse();
    if (!err.ok() && ctx != nullptr) { ctx->MarkFailed(err); }
    Report(out_error, err);
    return reader;
  }

 private:
  ExecutionResult Run(ResultShape shape, const Params& params) const {
    ExecutionResult result;
    result.shape = shape;
    if (!status_.ok()) {
      result.error = status_;
      return result;
    }

    Connection<Backend> owned;
    Connection<Backend>* conn = conn_;
    if (conn == nullptr) {
      result.error = owned.Open(connection_string_.c_str());
      if (!result.error.ok()) { return result; }
      conn = &owned;
    }

    std::shared_ptr<TransactionContext> ctx;
    result.error = conn->ResolveContext(tx_, &ctx);
    if (result.error.ok()) { result.error = conn->AcquireUse(); }
    if (result.error.ok()) {
      RunOn(conn->Session(), shape, params, &result);
      conn->ReleaseUse();
      if (!result.error.ok() && ctx != nullptr) {
        ctx->MarkFailed(result.error);
      }
    }

    if (conn == &owned) {
      Error close_err = owned.Close();
      if (!close_err.ok() && result.error.ok()) { result.error = close_err; }
    }
    return result;
  }

  void RunOn(typename Backend::Session* session, ResultShape shape,
             const Params& params, ExecutionResult* result) const {
    Error& err = result->error;
    if (shape == ResultShape::kNonQuery) {
      result->rows_affected = session->Execute(sql_.c_str(), params, &err);
      return;
    }

    ReaderType reader = session->Query(sql_.c_str(), params, &err);
    if (!err.ok()) { return; }

    if (shape == ResultShape::kSingleRow) {
      if (reader.Eof()) { return; }
      Row row = reader.ReadRow();
      reader.NextRow(&err);
      if (!err.ok()) { return; }
      if (!reader.Eof()) {
        err.Set(ErrorCode::kCardinalityViolation,
                "single-row command returned more than one row");
        return;
      }
      result->single = std::move(row);
      result->rows_affected = 1;
      return;
    }

    while (!reader.Eof()) {
      result->rows.push_back(reader.ReadRow());
      reader.NextRow(&err);
      if (!err.ok()) { return; }
    }
    result->rows_affected = static_cast<int64_t>(result->rows.size());
  }

  Connection<Backend>* conn_ = nullptr;
  std::shared_ptr<TransactionContext> tx_;
  std::string sql_;
  std::string connection_string_;
  ResultShape shape_ = ResultShape::kNonQuery;
  Error status_;
};

}  // namespace txpp
