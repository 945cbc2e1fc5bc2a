// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::TransactionScope -- ambient transaction guard.
//
// Design:
//   - Stack object, neither copyable nor movable; construction pushes an
//     entry onto the current flow, destruction pops it (LIFO)
//   - ScopeOption::kRequired joins an active enclosing context (isolation
//     levels must match), kRequiresNew always starts a fresh root context,
//     kSuppress hides the ambient context for its extent
//   - Only the root scope commits. A joined scope's Complete() is a vote;
//     releasing a joined scope without it dooms the shared context
//   - A root scope released without Complete() rolls back every enlisted
//     session
//   - Construction errors are kept in Status(); nothing is pushed then

#pragma once

#include <cinttypes>
#include <cstdint>
#include <memory>
#include <utility>

#include "txpp/ambient_scope.hpp"
#include "txpp/cancellation.hpp"
#include "txpp/error.hpp"
#include "txpp/ids.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction_context.hpp"

namespace txpp {

enum class ScopeOption : uint8_t { kRequired, kRequiresNew, kSuppress };

struct ScopeOptions {
  ScopeOption option = ScopeOption::kRequired;
  IsolationLevel isolation = IsolationLevel::kSerializable;
  bool async_flow = false;
  EscalationPolicy escalation = EscalationPolicy::kAllow;
  CancellationToken cancellation;
};

// ---------------------------------------------------------------------------
// TransactionScope
// ---------------------------------------------------------------------------

class TransactionScope {
 public:
  TransactionScope() : TransactionScope(ScopeOptions{}) {}

  TransactionScope(IsolationLevel isolation, bool async_flow)
      : TransactionScope(MakeOptions(isolation, async_flow)) {}

  explicit TransactionScope(const ScopeOptions& options)
      : id_(NextId()), cancellation_(options.cancellation) {
    if (options.option == ScopeOption::kSuppress) {
      AmbientScopeManager::Push(id_, nullptr, options.async_flow);
      pushed_ = true;
      return;
    }

    std::shared_ptr<TransactionContext> outer =
        options.option == ScopeOption::kRequired
            ? AmbientScopeManager::Current()
            : nullptr;
    if (outer != nullptr) {
      if (!outer->IsActive()) {
        status_.SetFormat(ErrorCode::kInvalidState,
                          "enclosing transaction %" PRIu64 " already %s",
                          outer->Id(), TransactionStateName(outer->State()));
        return;
      }
      if (outer->Isolation() != options.isolation) {
        status_.SetFormat(ErrorCode::kInvalidOperation,
                          "isolation level %s differs from enclosing "
                          "transaction (%s)",
                          IsolationLevelName(options.isolation),
                          IsolationLevelName(outer->Isolation()));
        return;
      }
      context_ = std::move(outer);
    } else {
      context_ = std::make_shared<TransactionContext>(
          ContextMode::kAmbient, options.isolation, options.escalation);
      context_->SetCancellation(options.cancellation);
      root_ = true;
    }
    AmbientScopeManager::Push(id_, context_, options.async_flow);
    pushed_ = true;
    Log().debug("scope {} {} transaction {} ({})", id_,
                root_ ? "begins" : "joins", context_->Id(),
                IsolationLevelName(context_->Isolation()));
  }

  ~TransactionScope() {
    if (!pushed_) { return; }
    Error err = AmbientScopeManager::Pop(id_);
    (void)err;  // logged by the manager; the contexts are already doomed
    if (context_ == nullptr) { return; }
    if (!root_) {
      if (!completed_) {
        context_->MarkFailed(Error::Make(
            ErrorCode::kAborted, "nested scope released without Complete"));
      }
      return;
    }
    if (context_->IsActive()) {
      Log().warn("scope {} released without Complete, rolling back "
                 "transaction {}",
                 id_, context_->Id());
      Error rb = context_->Rollback();
      if (!rb.ok()) {
        Log().error("transaction {} rollback failed: {}", context_->Id(),
                    rb.message);
      }
    }
  }

  // No copy, no move
  TransactionScope(const TransactionScope&) = delete;
  TransactionScope& operator=(const TransactionScope&) = delete;

  /// Construction result; a failed scope participates in nothing.
  const Error& Status() const { return status_; }

  uint64_t Id() const { return id_; }
  bool IsRoot() const { return root_; }
  bool IsCompleted() const { return completed_; }

  /// The governing context, nullptr for a suppressing scope.
  const std::shared_ptr<TransactionContext>& Context() const {
    return context_;
  }

  bool IsDistributed() const {
    return context_ != nullptr && context_->IsDistributed();
  }

  Error RequireLocal() const {
    return context_ != nullptr ? context_->RequireLocal() : Error::Ok();
  }

  /// Root scope: commit every enlisted session. Joined scope: vote to
  /// commit. Returns kAborted when the context was doomed meanwhile.
  Error Complete() {
    if (!status_.ok()) { return status_; }
    if (completed_) {
      return Error::Make(ErrorCode::kInvalidOperation,
                         "scope already completed");
    }
    if (context_ == nullptr) {
      completed_ = true;
      return Error::Ok();
    }
    if (cancellation_.IsCancellationRequested()) {
      Error err = Error::Make(ErrorCode::kCancelled, "cancellation requested");
      context_->MarkFailed(err);
      if (root_) {
        Error rb = context_->Rollback();
        if (!rb.ok()) {
          Log().error("transaction {} rollback failed: {}", context_->Id(),
                      rb.message);
        }
      }
      return err;
    }
    if (!root_) {
      if (!context_->IsActive()) {
        Error err;
        err.SetFormat(ErrorCode::kInvalidState,
                      "transaction %" PRIu64 " already %s", context_->Id(),
                      TransactionStateName(context_->State()));
        return err;
      }
      if (context_->IsDoomed()) {
        Error err;
        err.SetFormat(ErrorCode::kAborted,
                      "transaction %" PRIu64 " aborted: %s",
                      context_->Id(), context_->Failure().message);
        return err;
      }
      completed_ = true;
      return Error::Ok();
    }
    Error err = context_->Commit();
    if (err.ok()) { completed_ = true; }
    return err;
  }

 private:
  static ScopeOptions MakeOptions(IsolationLevel isolation, bool async_flow) {
    ScopeOptions options;
    options.isolation = isolation;
    options.async_flow = async_flow;
    return options;
  }

  uint64_t id_;
  std::shared_ptr<TransactionContext> context_;
  CancellationToken cancellation_;
  Error status_;
  bool pushed_ = false;
  bool root_ = false;
  bool completed_ = false;
};

}  // namespace txpp
