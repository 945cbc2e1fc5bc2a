// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::TransactionContext -- the unit of atomicity shared by transaction
// guards, connections and in-flight executions.
//
// Design:
//   - Non-template: sessions of any backend enlist through Enlistment
//   - Shared ownership (std::shared_ptr); every member is guarded by one
//     mutex so asynchronous continuations may observe and doom it
//   - State machine: Active -> Committed | RolledBack, never back
//   - The first recorded failure dooms the context; Commit() then rolls
//     back and reports kAborted
//   - A second physical session escalates the context to distributed (or is
//     refused under EscalationPolicy::kReject). Parked sessions count;
//     reattaching one never escalates
//   - No two-phase commit: enlistments commit in enlistment order and the
//     remainder is rolled back on the first failure

#pragma once

#include <cinttypes>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "txpp/cancellation.hpp"
#include "txpp/connection_string.hpp"
#include "txpp/enlistment.hpp"
#include "txpp/error.hpp"
#include "txpp/ids.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"

namespace txpp {

enum class ContextMode : uint8_t { kExplicit, kAmbient };

enum class TransactionState : uint8_t { kActive, kCommitted, kRolledBack };

enum class EscalationPolicy : uint8_t { kAllow, kReject };

inline const char* TransactionStateName(TransactionState state) {
  switch (state) {
    case TransactionState::kActive: return "active";
    case TransactionState::kCommitted: return "committed";
    case TransactionState::kRolledBack: return "rolled back";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// TransactionContext
// ---------------------------------------------------------------------------

class TransactionContext {
 public:
  TransactionContext(ContextMode mode, IsolationLevel isolation,
                     EscalationPolicy policy = EscalationPolicy::kAllow)
      : id_(NextId()), mode_(mode), isolation_(isolation), policy_(policy) {}

  ~TransactionContext() {
    if (state_ == TransactionState::kActive && !enlistments_.empty()) {
      Log().warn("transaction {} destroyed while active, rolling back", id_);
      Error err = RollbackLocked();
      if (!err.ok()) {
        Log().error("transaction {} rollback failed: {}", id_, err.message);
      }
    }
  }

  // No copy, no move
  TransactionContext(const TransactionContext&) = delete;
  TransactionContext& operator=(const TransactionContext&) = delete;

  // --- Identity ---

  uint64_t Id() const { return id_; }
  ContextMode Mode() const { return mode_; }
  IsolationLevel Isolation() const { return isolation_; }
  EscalationPolicy Policy() const { return policy_; }

  /// Connection an explicit transaction is bound to, 0 before the first
  /// enlistment and always 0 for ambient contexts.
  uint64_t BoundConnectionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_connection_;
  }

  // --- State ---

  TransactionState State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  bool IsActive() const { return State() == TransactionState::kActive; }

  bool IsDistributed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return distributed_;
  }

  /// kUnexpectedDistributedTransaction once the context has escalated.
  Error RequireLocal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!distributed_) { return Error::Ok(); }
    Error err;
    err.SetFormat(ErrorCode::kUnexpectedDistributedTransaction,
                  "transaction %" PRIu64 " spans %zu physical connections",
                  id_, enlistments_.size());
    return err;
  }

  size_t EnlistmentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enlistments_.size();
  }

  // --- Failure / cancellation ---

  void SetCancellation(CancellationToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    cancellation_ = std::move(token);
  }

  bool IsCancellationRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancellation_.IsCancellationRequested();
  }

  /// Record `err` as the reason this context can no longer commit. Only the
  /// first failure is kept.
  void MarkFailed(const Error& err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::kActive || !failure_.ok()) { return; }
    failure_ = err;
    Log().debug("transaction {} doomed: [{}] {}", id_,
                ErrorCodeName(err.code), err.message);
  }

  bool IsDoomed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !failure_.ok() || cancellation_.IsCancellationRequested();
  }

  Error Failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
  }

  // --- Enlistment ---

  Error Enlist(std::unique_ptr<Enlistment> enlistment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::kActive) {
      return StateError(ErrorCode::kInvalidState);
    }
    if (mode_ == ContextMode::kExplicit) {
      if (!enlistments_.empty()) {
        Error err;
        err.SetFormat(ErrorCode::kConnectionMismatch,
                      "transaction %" PRIu64 " is bound to connection %" PRIu64,
                      id_, bound_connection_);
        return err;
      }
      bound_connection_ = enlistment->AttachedConnection();
    } else {
      // Parked sessions are still open physical connections.
      if (!enlistments_.empty()) {
        if (policy_ == EscalationPolicy::kReject) {
          Log().warn("transaction {} refused a second physical connection "
                     "({}), escalation is disabled",
                     id_, enlistment->BackendName());
          Error err;
          err.SetFormat(ErrorCode::kUnexpectedDistributedTransaction,
                        "transaction %" PRIu64 " would escalate: %zu "
                        "session(s) already enlisted",
                        id_, enlistments_.size());
          return err;
        }
        if (!distributed_) {
          distributed_ = true;
          Log().warn("transaction {} escalated to distributed ({} sessions)",
                     id_, enlistments_.size() + 1);
        }
      }
    }
    Log().debug("transaction {}: connection {} enlisted session {} ({} {})",
                id_, enlistment->AttachedConnection(), enlistment->SessionId(),
                enlistment->BackendName(), enlistment->Target());
    enlistments_.push_back(std::move(enlistment));
    return Error::Ok();
  }

  /// Reattach a parked session opened with the same backend, target and
  /// options to the connection `connection_id`. Returns nullptr when none is
  /// parked.
  Enlistment* AttachParked(const char* backend,
                           const ConnectionOptions& options,
                           uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::kActive) { return nullptr; }
    for (auto& e : enlistments_) {
      if (!e->IsAttached() && e->Matches(backend, options)) {
        e->attached_connection_ = connection_id;
        Log().debug("transaction {}: connection {} reattached session {}", id_,
                    connection_id, e->SessionId());
        return e.get();
      }
    }
    return nullptr;
  }

  bool IsEnlisted(uint64_t connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : enlistments_) {
      if (e->AttachedConnection() == connection_id) { return true; }
    }
    return false;
  }

  /// Park the session held by `connection_id` until the context finishes.
  void Detach(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& e : enlistments_) {
      if (e->AttachedConnection() == connection_id) {
        e->attached_connection_ = 0;
        Log().debug("transaction {}: session {} parked", id_, e->SessionId());
      }
    }
  }

  // --- Completion ---

  Error Commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::kActive) {
      return StateError(ErrorCode::kInvalidOperation);
    }
    if (cancellation_.IsCancellationRequested() && failure_.ok()) {
      failure_ = Error::Make(ErrorCode::kCancelled, "cancellation requested");
    }
    if (!failure_.ok()) {
      Error rb = RollbackLocked();
      if (!rb.ok()) {
        Log().error("transaction {} rollback failed: {}", id_, rb.message);
      }
      Error err;
      err.SetFormat(failure_.code == ErrorCode::kCancelled
                        ? ErrorCode::kCancelled
                        : ErrorCode::kAborted,
                    "transaction %" PRIu64 " aborted: %s", id_,
                    failure_.message);
      return err;
    }
    for (size_t i = 0; i < enlistments_.size(); ++i) {
      Error err = enlistments_[i]->Commit();
      if (err.ok()) { continue; }
      Log().error("transaction {}: commit of session {} failed after {} "
                  "committed: {}",
                  id_, enlistments_[i]->SessionId(), i, err.message);
      for (size_t j = i; j < enlistments_.size(); ++j) {
        Error rb = enlistments_[j]->Rollback();
        if (!rb.ok()) {
          Log().error("transaction {}: rollback of session {} failed: {}", id_,
                      enlistments_[j]->SessionId(), rb.message);
        }
      }
      Finish(TransactionState::kRolledBack);
      return err;
    }
    Finish(TransactionState::kCommitted);
    return Error::Ok();
  }

  /// Roll back every enlisted session. No-op once finished.
  Error Rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != TransactionState::kActive) { return Error::Ok(); }
    return RollbackLocked();
  }

 private:
  Error RollbackLocked() {
    Error first;
    for (auto& e : enlistments_) {
      Error err = e->Rollback();
      if (!err.ok() && first.ok()) { first = err; }
    }
    Finish(TransactionState::kRolledBack);
    return first;
  }

  void Finish(TransactionState state) {
    state_ = state;
    // Parked sessions close here; attached ones return to autocommit with
    // their connections.
    enlistments_.clear();
    Log().debug("transaction {} {}", id_, TransactionStateName(state));
  }

  Error StateError(ErrorCode code) const {
    Error err;
    err.SetFormat(code, "transaction %" PRIu64 " already %s", id_,
                  TransactionStateName(state_));
    return err;
  }

  const uint64_t id_;
  const ContextMode mode_;
  const IsolationLevel isolation_;
  const EscalationPolicy policy_;

  mutable std::mutex mutex_;
  TransactionState state_ = TransactionState::kActive;
  bool distributed_ = false;
  uint64_t bound_connection_ = 0;
  Error failure_;
  CancellationToken cancellation_;
  std::vector<std::unique_ptr<Enlistment>> enlistments_;
};

}  // namespace txpp
