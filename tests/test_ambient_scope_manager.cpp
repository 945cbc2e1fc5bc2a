// Copyright (c) 2024 liudegui. MIT License.
// Tests for txpp::AmbientScopeManager and txpp::FlowScope.

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <thread>
#include <utility>

#include "txpp/txpp.hpp"

using namespace txpp;

static std::shared_ptr<TransactionContext> MakeContext() {
  return std::make_shared<TransactionContext>(ContextMode::kAmbient,
                                              IsolationLevel::kSerializable);
}

TEST_CASE("AmbientScopeManager: empty flow", "[ambient]") {
  REQUIRE(AmbientScopeManager::Current() == nullptr);
  REQUIRE(AmbientScopeManager::Depth() == 0);
  REQUIRE(AmbientScopeManager::CurrentFlowId() != 0);
}

TEST_CASE("AmbientScopeManager: push and pop", "[ambient]") {
  auto a = MakeContext();
  auto b = MakeContext();
  AmbientScopeManager::Push(101, a, false);
  AmbientScopeManager::Push(102, b, false);
  REQUIRE(AmbientScopeManager::Depth() == 2);
  REQUIRE(AmbientScopeManager::Current() == b);

  REQUIRE(AmbientScopeManager::Pop(102).ok());
  REQUIRE(AmbientScopeManager::Current() == a);
  REQUIRE(AmbientScopeManager::Pop(101).ok());
  REQUIRE(AmbientScopeManager::Depth() == 0);
  REQUIRE_FALSE(a->IsDoomed());
}

TEST_CASE("AmbientScopeManager: suppressed entry hides context",
          "[ambient]") {
  auto a = MakeContext();
  AmbientScopeManager::Push(201, a, false);
  AmbientScopeManager::Push(202, nullptr, false);
  REQUIRE(AmbientScopeManager::Current() == nullptr);
  REQUIRE(AmbientScopeManager::Pop(202).ok());
  REQUIRE(AmbientScopeManager::Current() == a);
  REQUIRE(AmbientScopeManager::Pop(201).ok());
}

TEST_CASE("AmbientScopeManager: out-of-order pop dooms the flow",
          "[ambient]") {
  auto a = MakeContext();
  auto b = MakeContext();
  AmbientScopeManager::Push(301, a, false);
  AmbientScopeManager::Push(302, b, false);

  Error err = AmbientScopeManager::Pop(301);
  REQUIRE(err.code == ErrorCode::kScopeOrder);
  REQUIRE(a->IsDoomed());
  REQUIRE(b->IsDoomed());
  REQUIRE(b->Failure().code == ErrorCode::kScopeOrder);
  REQUIRE(AmbientScopeManager::Depth() == 1);

  REQUIRE(AmbientScopeManager::Pop(302).ok());
  REQUIRE(AmbientScopeManager::Depth() == 0);
  REQUIRE(a->Commit().code == ErrorCode::kAborted);
}

TEST_CASE("AmbientScopeManager: scopes released out of order", "[ambient]") {
  auto outer = std::make_unique<TransactionScope>();
  auto inner = std::make_unique<TransactionScope>();
  std::shared_ptr<TransactionContext> ctx = outer->Context();

  outer.reset();
  REQUIRE(ctx->State() == TransactionState::kRolledBack);
  REQUIRE(AmbientScopeManager::Depth() == 1);

  REQUIRE(inner->Complete().code == ErrorCode::kInvalidState);
  inner.reset();
  REQUIRE(AmbientScopeManager::Depth() == 0);
}

TEST_CASE("AmbientScopeManager: threads have their own flow", "[ambient]") {
  TransactionScope scope;
  uint64_t main_flow = AmbientScopeManager::CurrentFlowId();

  bool saw_context = true;
  uint64_t worker_flow = main_flow;
  std::thread worker([&]() {
    saw_context = AmbientScopeManager::Current() != nullptr;
    worker_flow = AmbientScopeManager::CurrentFlowId();
  });
  worker.join();

  REQUIRE_FALSE(saw_context);
  REQUIRE(worker_flow != main_flow);
  REQUIRE(AmbientScopeManager::Current() == scope.Context());
}

TEST_CASE("AmbientScopeManager: capture without async flow is lost",
          "[ambient]") {
  TransactionScope scope;
  FlowSnapshot snapshot = AmbientScopeManager::Capture();
  REQUIRE(snapshot.lost);
  REQUIRE(snapshot.stack.empty());
}

TEST_CASE("AmbientScopeManager: capture with nothing ambient", "[ambient]") {
  FlowSnapshot snapshot = AmbientScopeManager::Capture();
  REQUIRE_FALSE(snapshot.lost);
  REQUIRE(snapshot.stack.empty());
}

TEST_CASE("FlowScope: forked flow sees captured context", "[ambient]") {
  TransactionScope scope(IsolationLevel::kSerializable, true);
  FlowSnapshot snapshot = AmbientScopeManager::Capture();
  REQUIRE_FALSE(snapshot.lost);
  REQUIRE(snapshot.stack.size() == 1);

  std::shared_ptr<TransactionContext> seen;
  bool lost = true;
  Error nested_result = Error::Make(ErrorCode::kError);
  size_t depth_inside = 0;
  size_t depth_after = 99;
  std::thread worker([&]() {
    {
      FlowScope flow(std::move(snapshot));
      lost = flow.ContextLost();
      seen = AmbientScopeManager::Current();
      TransactionScope nested;
      depth_inside = AmbientScopeManager::Depth();
      nested_result = nested.Complete();
    }
    depth_after = AmbientScopeManager::Depth();
  });
  worker.join();

  REQUIRE_FALSE(lost);
  REQUIRE(nested_result.ok());
  REQUIRE(seen == scope.Context());
  REQUIRE(depth_inside == 2);
  REQUIRE(depth_after == 0);
  REQUIRE(AmbientScopeManager::Depth() == 1);
  REQUIRE(scope.Complete().ok());
}
