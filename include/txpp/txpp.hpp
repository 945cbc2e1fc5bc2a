// Copyright (c) 2024 liudegui. MIT License.
//
// txpp -- typed SQL command execution with explicit and ambient transaction
// propagation.
//
// Design:
//   - Users include this single header; SQLite3 aliases are always there,
//     the MariaDB ones when built with TXPP_HAS_MARIADB=1
//   - To switch backend: using MyConn = txpp::Connection<txpp::MariaBackend>;
//   - Move-only, RAII, no exceptions
//
// Usage (explicit):
//   txpp::SqliteConnection conn("app.db;BusyTimeout=2000");
//   conn.Open();
//   auto tx = conn.BeginTransaction();
//   txpp::SqliteCommand(conn, tx, "INSERT INTO t(v) VALUES(:v)")
//       .ExecuteNonQuery(txpp::Params().Set("v", 1));
//   tx.Complete();
//
// Usage (ambient):
//   {
//     txpp::TransactionScope scope;
//     txpp::SqliteCommand("a.db", "UPDATE a SET n = n - 1").Execute();
//     txpp::SqliteCommand("a.db", "UPDATE b SET n = n + 1").Execute();
//     scope.Complete();
//   }

#pragma once

#include "txpp/ambient_scope.hpp"
#include "txpp/batch.hpp"
#include "txpp/cancellation.hpp"
#include "txpp/command.hpp"
#include "txpp/connection.hpp"
#include "txpp/error.hpp"
#include "txpp/isolation.hpp"
#include "txpp/log.hpp"
#include "txpp/sqlite3_backend.hpp"
#include "txpp/transaction.hpp"
#include "txpp/transaction_context.hpp"
#include "txpp/transaction_scope.hpp"
#include "txpp/value.hpp"

#if defined(TXPP_HAS_MARIADB) && TXPP_HAS_MARIADB
#include "txpp/maria_backend.hpp"
#endif

namespace txpp {

using SqliteConnection  = Connection<Sqlite3Backend>;
using SqliteTransaction = Transaction<Sqlite3Backend>;
using SqliteCommand     = Command<Sqlite3Backend>;

#if defined(TXPP_HAS_MARIADB) && TXPP_HAS_MARIADB
using MariaConnection  = Connection<MariaBackend>;
using MariaTransaction = Transaction<MariaBackend>;
using MariaCommand     = Command<MariaBackend>;
#endif

}  // namespace txpp
