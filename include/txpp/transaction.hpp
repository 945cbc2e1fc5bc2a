// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Transaction<Backend> -- explicit transaction guard.
//
// Design:
//   - Created by Connection::BeginTransaction(); bound to that connection
//     for its whole life
//   - Move-only (no copy), RAII: destruction without Complete() rolls back
//   - Shares its TransactionContext with the connection and with any
//     asynchronous execution still running against it

#pragma once

#include <cstdint>
#include <memory>
#include <utility>

#include "txpp/cancellation.hpp"
#include "txpp/error.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction_context.hpp"

namespace txpp {

template <typename Backend>
class Connection;

// ---------------------------------------------------------------------------
// Transaction<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class Transaction {
 public:
  Transaction() = default;

  ~Transaction() { Release(); }

  // Move
  Transaction(Transaction&& other) noexcept
      : context_(std::move(other.context_)),
        connection_id_(other.connection_id_) {
    other.connection_id_ = 0;
  }

  Transaction& operator=(Transaction&& other) noexcept {
    if (this != &other) {
      Release();
      context_ = std::move(other.context_);
      connection_id_ = other.connection_id_;
      other.connection_id_ = 0;
    }
    return *this;
  }

  // No copy
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  bool Valid() const { return context_ != nullptr; }

  uint64_t ConnectionId() const { return connection_id_; }

  const std::shared_ptr<TransactionContext>& Context() const {
    return context_;
  }

  IsolationLevel Isolation() const {
    return context_ ? context_->Isolation() : IsolationLevel::kReadCommitted;
  }

  TransactionState State() const {
    return context_ ? context_->State() : TransactionState::kRolledBack;
  }

  bool IsActive() const { return context_ && context_->IsActive(); }

  void SetCancellation(CancellationToken token) {
    if (context_) { context_->SetCancellation(std::move(token)); }
  }

  /// Commit. kAborted (after rolling back) when an execution failed inside
  /// the transaction, kInvalidOperation when already completed.
  Error Complete() {
    if (!context_) {
      return Error::Make(ErrorCode::kInvalidState, "no transaction");
    }
    return context_->Commit();
  }

  Error Rollback() {
    if (!context_) {
      return Error::Make(ErrorCode::kInvalidState, "no transaction");
    }
    if (!context_->IsActive()) {
      return Error::Make(ErrorCode::kInvalidOperation,
                         "transaction already completed");
    }
    return context_->Rollback();
  }

 private:
  friend class Connection<Backend>;

  Transaction(std::shared_ptr<TransactionContext> context,
              uint64_t connection_id)
      : context_(std::move(context)), connection_id_(connection_id) {}

  void Release() {
    if (context_ && context_->IsActive()) {
      Log().warn("transaction {} released without Complete, rolling back",
                 context_->Id());
      Error err = context_->Rollback();
      if (!err.ok()) {
        Log().error("transaction {} rollback failed: {}", context_->Id(),
                    err.message);
      }
    }
    context_.reset();
  }

  std::shared_ptr<TransactionContext> context_;
  uint64_t connection_id_ = 0;
};

}  // namespace txpp
