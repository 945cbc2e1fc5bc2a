// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::AmbientScopeManager -- per-flow stack of ambient transaction scopes.
//
// Design:
//   - A Flow is one logical thread of execution; each OS thread starts on
//     its own default (empty) flow through a thread_local slot
//   - Entries are pushed/popped strictly LIFO by TransactionScope; the top
//     entry is the ambient context seen by Connection::Open and Command
//   - Capture() snapshots the stack for an asynchronous continuation; the
//     snapshot is "lost" when the innermost scope disabled async flow
//   - FlowScope installs a forked flow on a worker thread for its lifetime,
//     so the worker sees the captured contexts and nothing it pushes leaks
//     back to the origin
//   - An out-of-order Pop dooms every context on the flow (kScopeOrder) and
//     is logged critical; the process keeps running

#pragma once

#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "txpp/error.hpp"
#include "txpp/ids.hpp"
#include "txpp/log.hpp"
#include "txpp/transaction_context.hpp"

namespace txpp {

struct ScopeEntry {
  uint64_t scope_id = 0;
  std::shared_ptr<TransactionContext> context;  // nullptr: suppressed
  bool async_flow = false;
};

// ---------------------------------------------------------------------------
// Flow
// ---------------------------------------------------------------------------

class Flow {
 public:
  Flow() : id_(NextId()) {}
  explicit Flow(std::vector<ScopeEntry> stack)
      : id_(NextId()), stack_(std::move(stack)) {}

  Flow(const Flow&) = delete;
  Flow& operator=(const Flow&) = delete;

  uint64_t Id() const { return id_; }
  std::vector<ScopeEntry>& Stack() { return stack_; }
  const std::vector<ScopeEntry>& Stack() const { return stack_; }

 private:
  uint64_t id_;
  std::vector<ScopeEntry> stack_;
};

struct FlowSnapshot {
  std::vector<ScopeEntry> stack;
  bool lost = false;  // an ambient context existed but does not flow
  uint64_t origin_flow = 0;
};

// ---------------------------------------------------------------------------
// AmbientScopeManager
// ---------------------------------------------------------------------------

class AmbientScopeManager {
 public:
  /// Innermost ambient context of the current flow, nullptr when there is
  /// none or the innermost scope suppresses it.
  static std::shared_ptr<TransactionContext> Current() {
    const std::vector<ScopeEntry>& stack = Slot()->Stack();
    if (stack.empty()) { return nullptr; }
    return stack.back().context;
  }

  static size_t Depth() { return Slot()->Stack().size(); }

  static uint64_t CurrentFlowId() { return Slot()->Id(); }

  static void Push(uint64_t scope_id,
                   std::shared_ptr<TransactionContext> context,
                   bool async_flow) {
    Flow* flow = Slot();
    Log().debug("flow {}: push scope {} (depth {})", flow->Id(), scope_id,
                flow->Stack().size() + 1);
    flow->Stack().push_back(ScopeEntry{scope_id, std::move(context),
                                       async_flow});
  }

  static Error Pop(uint64_t scope_id) {
    Flow* flow = Slot();
    std::vector<ScopeEntry>& stack = flow->Stack();
    if (!stack.empty() && stack.back().scope_id == scope_id) {
      stack.pop_back();
      Log().debug("flow {}: pop scope {} (depth {})", flow->Id(), scope_id,
                  stack.size());
      return Error::Ok();
    }

    Error err;
    err.SetFormat(ErrorCode::kScopeOrder,
                  "scope %" PRIu64 " released out of order on flow %" PRIu64,
                  scope_id, flow->Id());
    Log().critical("flow {}: scope {} released out of order (innermost is {})",
                   flow->Id(), scope_id,
                   stack.empty() ? uint64_t{0} : stack.back().scope_id);
    for (const ScopeEntry& entry : stack) {
      if (entry.context != nullptr) { entry.context->MarkFailed(err); }
    }
    for (auto it = stack.begin(); it != stack.end(); ++it) {
      if (it->scope_id == scope_id) {
        stack.erase(it);
        break;
      }
    }
    return err;
  }

  static FlowSnapshot Capture() {
    const Flow* flow = Slot();
    FlowSnapshot snapshot;
    snapshot.origin_flow = flow->Id();
    const std::vector<ScopeEntry>& stack = flow->Stack();
    if (stack.empty() || stack.back().context == nullptr) { return snapshot; }
    if (stack.back().async_flow) {
      snapshot.stack = stack;
    } else {
      snapshot.lost = true;
    }
    return snapshot;
  }

 private:
  friend class FlowScope;

  static Flow*& Slot() {
    static thread_local Flow default_flow;
    static thread_local Flow* current = &default_flow;
    return current;
  }
};

// ---------------------------------------------------------------------------
// FlowScope
// ---------------------------------------------------------------------------

/// Runs the enclosing block on a flow forked from `snapshot`.
class FlowScope {
 public:
  explicit FlowScope(FlowSnapshot snapshot)
      : flow_(std::move(snapshot.stack)),
        previous_(AmbientScopeManager::Slot()),
        lost_(snapshot.lost) {
    AmbientScopeManager::Slot() = &flow_;
    Log().debug("flow {} forked from flow {}", flow_.Id(),
                snapshot.origin_flow);
  }

  ~FlowScope() { AmbientScopeManager::Slot() = previous_; }

  FlowScope(const FlowScope&) = delete;
  FlowScope& operator=(const FlowScope&) = delete;

  bool ContextLost() const { return lost_; }
  uint64_t FlowId() const { return flow_.Id(); }

 private:
  Flow flow_;
  Flow* previous_;
  bool lost_;
};

}  // namespace txpp
