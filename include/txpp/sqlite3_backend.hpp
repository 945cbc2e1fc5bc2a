// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::Sqlite3Backend -- backend traits for SQLite3.
//
// Design:
//   - Aggregates all SQLite3-specific types into a single traits struct
//   - Used as template parameter for Connection/Transaction/Command
//   - Zero overhead: just type aliases, no virtual dispatch

#pragma once

#include "txpp/sqlite3_session.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// Sqlite3Backend -- type traits for the transaction layer templates
// ---------------------------------------------------------------------------

struct Sqlite3Backend {
  using Session = Sqlite3Session;
  using Reader  = Sqlite3Reader;

  static constexpr const char* kName = "sqlite3";
};

}  // namespace txpp
