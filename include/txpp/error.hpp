// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Error -- error handling without exceptions.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - Driver-level codes plus the transaction-propagation taxonomy

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace txpp {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kBusy = -3,
  kNotFound = -4,
  kConstraint = -5,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,

  // Transaction propagation
  kInvalidState = -20,
  kInvalidOperation = -21,
  kConnectionMismatch = -22,
  kConnectionInUse = -23,
  kCardinalityViolation = -24,
  kTransactionContextLost = -25,
  kUnexpectedDistributedTransaction = -26,
  kAborted = -27,
  kCancelled = -28,
  kScopeOrder = -29,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return "Ok";
    case ErrorCode::kError: return "Error";
    case ErrorCode::kNotOpen: return "NotOpen";
    case ErrorCode::kBusy: return "Busy";
    case ErrorCode::kNotFound: return "NotFound";
    case ErrorCode::kConstraint: return "Constraint";
    case ErrorCode::kMisuse: return "Misuse";
    case ErrorCode::kRange: return "Range";
    case ErrorCode::kNullParam: return "NullParam";
    case ErrorCode::kInvalidState: return "InvalidState";
    case ErrorCode::kInvalidOperation: return "InvalidOperation";
    case ErrorCode::kConnectionMismatch: return "ConnectionMismatch";
    case ErrorCode::kConnectionInUse: return "ConnectionInUse";
    case ErrorCode::kCardinalityViolation: return "CardinalityViolation";
    case ErrorCode::kTransactionContextLost: return "TransactionContextLost";
    case ErrorCode::kUnexpectedDistributedTransaction:
      return "UnexpectedDistributedTransaction";
    case ErrorCode::kAborted: return "Aborted";
    case ErrorCode::kCancelled: return "Cancelled";
    case ErrorCode::kScopeOrder: return "ScopeOrder";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

/// Copy `err` into `*out_error` when the caller asked for it.
inline void Report(Error* out_error, const Error& err) {
  if (out_error != nullptr) { *out_error = err; }
}

}  // namespace txpp
