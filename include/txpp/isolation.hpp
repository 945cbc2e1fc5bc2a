// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::IsolationLevel -- transaction isolation levels.

#pragma once

#include <cstdint>

namespace txpp {

enum class IsolationLevel : uint8_t {
  kReadUncommitted = 0,
  kReadCommitted,
  kRepeatableRead,
  kSerializable,
  kSnapshot,
};

inline const char* IsolationLevelName(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadUncommitted: return "ReadUncommitted";
    case IsolationLevel::kReadCommitted: return "ReadCommitted";
    case IsolationLevel::kRepeatableRead: return "RepeatableRead";
    case IsolationLevel::kSerializable: return "Serializable";
    case IsolationLevel::kSnapshot: return "Snapshot";
  }
  return "Unknown";
}

}  // namespace txpp
