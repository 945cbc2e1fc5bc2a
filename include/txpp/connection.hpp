// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Connection<Backend> -- transaction-aware connection handle.
//
// Design:
//   - Template over backend traits (Sqlite3Backend, MariaBackend), the
//     physical session is Backend::Session held by std::shared_ptr so a
//     transaction context can keep it alive after Close()
//   - Move-only (no copy), RAII: destruction rolls back a pending explicit
//     transaction and closes (or parks) the session
//   - Open() inside an ambient scope enlists automatically unless the
//     connection string says Enlist=false; a session the same context
//     parked earlier for the same target and options is reattached instead
//     of opening a second physical connection
//   - One execution at a time: a busy flag rejects overlapping use with
//     kConnectionInUse instead of interleaving on one session

#pragma once

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "txpp/ambient_scope.hpp"
#include "txpp/connection_string.hpp"
#include "txpp/enlistment.hpp"
#include "txpp/error.hpp"
#include "txpp/ids.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction.hpp"
#include "txpp/transaction_context.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// Connection<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class Connection {
 public:
  using SessionType = typename Backend::Session;
  using TransactionType = Transaction<Backend>;

  Connection() : id_(NextId()) {}

  explicit Connection(const char* connection_string) : Connection() {
    Error err = SetConnectionString(connection_string);
    (void)err;  // kept in options_error_, reported by Open()
  }

  ~Connection() { Release(); }

  // Move
  Connection(Connection&& other) noexcept
      : id_(other.id_),
        conn_str_(std::move(other.conn_str_)),
        options_(other.options_),
        options_error_(other.options_error_),
        session_(std::move(other.session_)),
        explicit_ctx_(std::move(other.explicit_ctx_)),
        enlisted_ctx_(std::move(other.enlisted_ctx_)) {
    other.id_ = NextId();
  }

  Connection& operator=(Connection&& other) noexcept {
    if (this != &other) {
      Release();
      id_ = other.id_;
      conn_str_ = std::move(other.conn_str_);
      options_ = other.options_;
      options_error_ = other.options_error_;
      session_ = std::move(other.session_);
      explicit_ctx_ = std::move(other.explicit_ctx_);
      enlisted_ctx_ = std::move(other.enlisted_ctx_);
      other.id_ = NextId();
    }
    return *this;
  }

  // No copy
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- Configuration ---

  Error SetConnectionString(const char* connection_string) {
    if (IsOpen()) {
      return Error::Make(ErrorCode::kInvalidState,
                         "connection string of an open connection");
    }
    conn_str_ = connection_string != nullptr ? connection_string : "";
    options_error_ = options_.Parse(connection_string);
    return options_error_;
  }

  const char* ConnectionString() const { return conn_str_.c_str(); }
  const ConnectionOptions& Options() const { return options_; }

  uint64_t Id() const { return id_; }

  // --- Open / Close ---

  Error Open(const char* connection_string) {
    Error err = SetConnectionString(connection_string);
    if (!err.ok()) { return err; }
    return Open();
  }

  Error Open() {
    if (IsOpen()) {
      return Error::Make(ErrorCode::kInvalidState, "connection already open");
    }
    if (!options_error_.ok()) { return options_error_; }
    if (conn_str_.empty()) {
      return Error::Make(ErrorCode::kMisuse, "connection string not set");
    }

    std::shared_ptr<TransactionContext> ambient =
        options_.enlist ? AmbientScopeManager::Current() : nullptr;
    if (ambient != nullptr) {
      if (!ambient->IsActive()) {
        Error err;
        err.SetFormat(ErrorCode::kInvalidState,
                      "ambient transaction %" PRIu64 " already %s",
                      ambient->Id(), TransactionStateName(ambient->State()));
        return err;
      }
      Enlistment* parked =
          ambient->AttachParked(Backend::kName, options_, id_);
      if (parked != nullptr) {
        session_ = static_cast<SessionEnlistment<Backend>*>(parked)->Session();
        enlisted_ctx_ = std::move(ambient);
        return Error::Ok();
      }
    }

    auto session = std::make_shared<SessionType>();
    Error err = session->Open(options_);
    if (!err.ok()) { return err; }
    session_ = std::move(session);
    Log().debug("connection {} opened ({})", id_, Backend::kName);

    if (ambient != nullptr) {
      err = EnlistIn(ambient);
      if (!err.ok()) {
        session_.reset();
        return err;
      }
    }
    return Error::Ok();
  }

  /// Close the handle. A session enlisted in an active ambient transaction
  /// stays open, parked in the context, until that transaction finishes.
  Error Close() {
    if (!IsOpen()) { return Error::Ok(); }
    if (busy_.load(std::memory_order_acquire)) {
      return Error::Make(ErrorCode::kConnectionInUse,
                         "connection has an execution in progress");
    }
    if (explicit_ctx_ != nullptr && explicit_ctx_->IsActive()) {
      Error err;
      err.SetFormat(ErrorCode::kInvalidState,
                    "connection %" PRIu64 " has active transaction %" PRIu64,
                    id_, explicit_ctx_->Id());
      return err;
    }
    if (enlisted_ctx_ != nullptr && enlisted_ctx_->IsActive()) {
      enlisted_ctx_->Detach(id_);
    }
    session_.reset();
    explicit_ctx_.reset();
    enlisted_ctx_.reset();
    Log().debug("connection {} closed", id_);
    return Error::Ok();
  }

  bool IsOpen() const { return session_ != nullptr && session_->IsOpen(); }

  // --- Transactions ---

  bool InTransaction() const {
    return (explicit_ctx_ != nullptr && explicit_ctx_->IsActive()) ||
           IsEnlisted();
  }

  /// Whether the connection takes part in an active ambient transaction.
  bool IsEnlisted() const {
    return enlisted_ctx_ != nullptr && enlisted_ctx_->IsActive();
  }

  std::shared_ptr<TransactionContext> EnlistedContext() const {
    return IsEnlisted() ? enlisted_ctx_ : nullptr;
  }

  Transaction<Backend> BeginTransaction(
      IsolationLevel level = IsolationLevel::kReadCommitted,
      Error* out_error = nullptr) {
    if (!IsOpen()) {
      Report(out_error,
             Error::Make(ErrorCode::kInvalidState, "connection is not open"));
      return Transaction<Backend>();
    }
    if (InTransaction()) {
      Error err;
      err.SetFormat(ErrorCode::kConnectionInUse,
                    "connection %" PRIu64 " already takes part in a "
                    "transaction",
                    id_);
      Report(out_error, err);
      return Transaction<Backend>();
    }

    Error err = session_->Begin(level);
    if (!err.ok()) {
      Report(out_error, err);
      return Transaction<Backend>();
    }
    auto ctx =
        std::make_shared<TransactionContext>(ContextMode::kExplicit, level);
    err = ctx->Enlist(std::unique_ptr<Enlistment>(
        new SessionEnlistment<Backend>(session_, options_, id_)));
    if (!err.ok()) {
      Error rb = session_->Rollback();
      if (!rb.ok()) {
        Log().error("connection {} rollback failed: {}", id_, rb.message);
      }
      Report(out_error, err);
      return Transaction<Backend>();
    }
    explicit_ctx_ = ctx;
    Log().debug("connection {} began transaction {} ({})", id_, ctx->Id(),
                IsolationLevelName(level));
    Report(out_error, Error::Ok());
    return Transaction<Backend>(std::move(ctx), id_);
  }

  /// Enlist an already open connection in the current ambient context.
  Error EnlistAmbient() {
    if (!IsOpen()) {
      return Error::Make(ErrorCode::kInvalidState, "connection is not open");
    }
    std::shared_ptr<TransactionContext> ambient =
        AmbientScopeManager::Current();
    if (ambient == nullptr) {
      return Error::Make(ErrorCode::kInvalidOperation,
                         "no ambient transaction");
    }
    return EnlistIn(ambient);
  }

  // --- Execution plumbing (Command, Batch) ---

  /// Pick the context an execution runs under: the explicit transaction
  /// passed in, else the ambient context this connection is enlisted in,
  /// else the current ambient context (enlisting lazily), else none
  /// (autocommit, `*out_ctx` reset).
  Error ResolveContext(const std::shared_ptr<TransactionContext>& explicit_ctx,
                       std::shared_ptr<TransactionContext>* out_ctx) {
    out_ctx->reset();
    if (!IsOpen()) {
      return Error::Make(ErrorCode::kInvalidState, "connection is not open");
    }

    std::shared_ptr<TransactionContext> ctx;
    if (explicit_ctx != nullptr) {
      if (explicit_ctx->BoundConnectionId() != id_) {
        Error err;
        err.SetFormat(ErrorCode::kConnectionMismatch,
                      "transaction %" PRIu64 " belongs to another connection",
                      explicit_ctx->Id());
        return err;
      }
      ctx = explicit_ctx;
    } else if (explicit_ctx_ != nullptr && explicit_ctx_->IsActive()) {
      return Error::Make(ErrorCode::kInvalidOperation,
                         "connection has a pending explicit transaction, "
                         "pass it to the command");
    } else if (IsEnlisted()) {
      ctx = enlisted_ctx_;
    } else {
      enlisted_ctx_.reset();
      std::shared_ptr<TransactionContext> ambient =
          options_.enlist ? AmbientScopeManager::Current() : nullptr;
      if (ambient == nullptr) { return Error::Ok(); }
      if (ambient->IsActive()) {
        Error err = EnlistIn(ambient);
        if (!err.ok()) { return err; }
      }
      ctx = std::move(ambient);
    }

    if (!ctx->IsActive()) {
      Error err;
      err.SetFormat(ErrorCode::kInvalidState,
                    "transaction %" PRIu64 " already %s", ctx->Id(),
                    TransactionStateName(ctx->State()));
      return err;
    }
    if (ctx->IsCancellationRequested()) {
      Error err = Error::Make(ErrorCode::kCancelled, "cancellation requested");
      ctx->MarkFailed(err);
      return err;
    }
    if (ctx->IsDoomed()) {
      Error err;
      err.SetFormat(ErrorCode::kAborted, "transaction %" PRIu64 " aborted: %s",
                    ctx->Id(), ctx->Failure().message);
      return err;
    }
    *out_ctx = std::move(ctx);
    return Error::Ok();
  }

  Error AcquireUse() {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true,
                                       std::memory_order_acq_rel)) {
      Error err;
      err.SetFormat(ErrorCode::kConnectionInUse,
                    "connection %" PRIu64 " is executing another command",
                    id_);
      return err;
    }
    return Error::Ok();
  }

  void ReleaseUse() { busy_.store(false, std::memory_order_release); }

  SessionType* Session() const { return session_.get(); }

 private:
  Error EnlistIn(const std::shared_ptr<TransactionContext>& ctx) {
    if (explicit_ctx_ != nullptr && explicit_ctx_->IsActive()) {
      return Error::Make(ErrorCode::kConnectionInUse,
                         "connection has an active explicit transaction");
    }
    if (IsEnlisted()) {
      if (enlisted_ctx_ == ctx) { return Error::Ok(); }
      Error err;
      err.SetFormat(ErrorCode::kConnectionInUse,
                    "connection %" PRIu64
                    " is enlisted in transaction %" PRIu64,
                    id_, enlisted_ctx_->Id());
      return err;
    }
    if (!ctx->IsActive()) {
      Error err;
      err.SetFormat(ErrorCode::kInvalidState,
                    "transaction %" PRIu64 " already %s", ctx->Id(),
                    TransactionStateName(ctx->State()));
      return err;
    }

    Error err = session_->Begin(ctx->Isolation());
    if (!err.ok()) { return err; }
    err = ctx->Enlist(std::unique_ptr<Enlistment>(
        new SessionEnlistment<Backend>(session_, options_, id_)));
    if (!err.ok()) {
      Error rb = session_->Rollback();
      if (!rb.ok()) {
        Log().error("connection {} rollback failed: {}", id_, rb.message);
      }
      return err;
    }
    enlisted_ctx_ = ctx;
    return Error::Ok();
  }

  void Release() {
    if (!IsOpen()) { return; }
    if (explicit_ctx_ != nullptr && explicit_ctx_->IsActive()) {
      Log().warn("connection {} destroyed with active transaction {}, "
                 "rolling back",
                 id_, explicit_ctx_->Id());
      Error err = explicit_ctx_->Rollback();
      if (!err.ok()) {
        Log().error("transaction {} rollback failed: {}", explicit_ctx_->Id(),
                    err.message);
      }
    }
    busy_.store(false, std::memory_order_release);
    Error err = Close();
    if (!err.ok()) {
      Log().error("connection {} close failed: {}", id_, err.message);
    }
  }

  uint64_t id_;
  std::string conn_str_;
  ConnectionOptions options_;
  Error options_error_;
  std::shared_ptr<SessionType> session_;
  std::shared_ptr<TransactionContext> explicit_ctx_;
  std::shared_ptr<TransactionContext> enlisted_ctx_;
  std::atomic<bool> busy_{false};
};

/// Begin an explicit transaction on `conn`.
template <typename Backend>
Transaction<Backend> BeginExplicit(
    Connection<Backend>& conn,
    IsolationLevel level = IsolationLevel::kReadCommitted,
    Error* out_error = nullptr) {
  return conn.BeginTransaction(level, out_error);
}

}  // namespace txpp
