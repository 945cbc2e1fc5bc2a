// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Enlistment -- one physical session taking part in a transaction
// context.
//
// Design:
//   - The context only needs commit/rollback and the attachment state, so
//     sessions of different backends can share one (distributed) context
//   - "Attached" means an open Connection handle currently holds the
//     session; a closed connection parks its session in the context until
//     the context finishes, and a later connection with the same target
//     and options reattaches it instead of opening a second physical
//     connection; in-memory targets are never shared

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "txpp/connection_string.hpp"
#include "txpp/error.hpp"
#include "txpp/ids.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// Enlistment
// ---------------------------------------------------------------------------

class Enlistment {
 public:
  Enlistment(const char* backend, const ConnectionOptions& options,
             uint64_t connection_id)
      : backend_(backend),
        target_(options.target),
        busy_timeout_ms_(options.busy_timeout_ms),
        shareable_(!options.IsInMemory()),
        session_id_(NextId()),
        attached_connection_(connection_id) {}

  virtual ~Enlistment() = default;

  Enlistment(const Enlistment&) = delete;
  Enlistment& operator=(const Enlistment&) = delete;

  const char* BackendName() const { return backend_; }
  const std::string& Target() const { return target_; }
  uint64_t SessionId() const { return session_id_; }

  /// Whether a connection opened with `options` may take over this session
  /// once it is parked.
  bool Matches(const char* backend, const ConnectionOptions& options) const {
    return shareable_ && std::strcmp(backend_, backend) == 0 &&
           target_ == options.target &&
           busy_timeout_ms_ == options.busy_timeout_ms;
  }

  /// Id of the connection holding the session, 0 while parked.
  uint64_t AttachedConnection() const { return attached_connection_; }
  bool IsAttached() const { return attached_connection_ != 0; }

  virtual Error Commit() = 0;
  virtual Error Rollback() = 0;

 private:
  friend class TransactionContext;

  const char* backend_;
  std::string target_;
  int32_t busy_timeout_ms_;
  bool shareable_;
  uint64_t session_id_;
  uint64_t attached_connection_;
};

// ---------------------------------------------------------------------------
// SessionEnlistment<Backend>
// ---------------------------------------------------------------------------

template <typename Backend>
class SessionEnlistment : public Enlistment {
 public:
  using SessionType = typename Backend::Session;

  SessionEnlistment(std::shared_ptr<SessionType> session,
                    const ConnectionOptions& options, uint64_t connection_id)
      : Enlistment(Backend::kName, options, connection_id),
        session_(std::move(session)) {}

  Error Commit() override { return session_->Commit(); }
  Error Rollback() override { return session_->Rollback(); }

  const std::shared_ptr<SessionType>& Session() const { return session_; }

 private:
  std::shared_ptr<SessionType> session_;
};

}  // namespace txpp
