// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::NextId -- process-unique identities for connections, sessions,
// transaction contexts, scopes and flows. Never reused, never zero.

#pragma once

#include <atomic>
#include <cstdint>

namespace txpp {

inline uint64_t NextId() {
  static std::atomic<uint64_t> next{1};
  return next.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace txpp
