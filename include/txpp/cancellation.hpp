// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::CancellationSource / CancellationToken -- cooperative cancellation.
//
// A token observed as raised before Complete() dooms the transaction
// context; executions fail with kCancelled and release rolls back.

#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace txpp {

class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancellationRequested() const {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() { flag_->store(true, std::memory_order_release); }

  bool IsCancellationRequested() const {
    return flag_->load(std::memory_order_acquire);
  }

  CancellationToken Token() const { return CancellationToken(flag_); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace txpp
