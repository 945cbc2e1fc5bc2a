// Copyright (c) 2024 liudegui. MIT License.
//
// txpp::MariaBackend -- backend traits for MariaDB/MySQL.
//
// Design:
//   - Aggregates all MariaDB-specific types into a single traits struct
//   - Used as template parameter for Connection/Transaction/Command
//   - Zero overhead: just type aliases, no virtual dispatch

#pragma once

#include "txpp/maria_session.hpp"

namespace txpp {

// ---------------------------------------------------------------------------
// MariaBackend -- type traits for the transaction layer templates
// ---------------------------------------------------------------------------

struct MariaBackend {
  using Session = MariaSession;
  using Reader  = MariaReader;

  static constexpr const char* kName = "mariadb";
};

}  // namespace txpp
