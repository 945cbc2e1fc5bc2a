// Copyright (c) 2024 liudegui. MIT License.
// Tests for txpp::Transaction<Sqlite3Backend> (explicit mode).

#include <catch2/catch_test_macros.hpp>
#include <cstring>
#include <utility>

#include "test_helpers.hpp"
#include "txpp/txpp.hpp"

using namespace txpp;
using txpp_test::TempDb;

static void OpenWithTable(TempDb& db, SqliteConnection& conn) {
  db.Exec("CREATE TABLE acct(id INTEGER PRIMARY KEY, balance INTEGER);");
  REQUIRE(conn.Open(db.Path()).ok());
}

TEST_CASE("Transaction: commit makes changes visible", "[transaction]") {
  TempDb db("tx_commit");
  SqliteConnection conn;
  OpenWithTable(db, conn);

  SqliteTransaction tx = conn.BeginTransaction();
  REQUIRE(tx.Valid());
  REQUIRE(tx.IsActive());
  REQUIRE(tx.ConnectionId() == conn.Id());
  REQUIRE(conn.InTransaction());

  SqliteCommand insert(conn, tx, "INSERT INTO acct VALUES(:id, :bal)");
  REQUIRE(insert.ExecuteNonQuery(Params().Set("id", 1).Set("bal", 100)) == 1);
  REQUIRE(db.Count("acct") == 0);

  REQUIRE(tx.Complete().ok());
  REQUIRE(tx.State() == TransactionState::kCommitted);
  REQUIRE_FALSE(conn.InTransaction());
  REQUIRE(db.Count("acct") == 1);
}

TEST_CASE("Transaction: release without Complete rolls back",
          "[transaction]") {
  TempDb db("tx_release");
  SqliteConnection conn;
  OpenWithTable(db, conn);
  {
    SqliteTransaction tx = conn.BeginTransaction();
    SqliteCommand(conn, tx, "INSERT INTO acct VALUES(1, 5)").ExecuteNonQuery();
  }
  REQUIRE_FALSE(conn.InTransaction());
  REQUIRE(db.Count("acct") == 0);

  // The connection is back in autocommit.
  REQUIRE(SqliteCommand(conn, "INSERT INTO acct VALUES(2, 5)")
              .ExecuteNonQuery() == 1);
  REQUIRE(db.Count("acct") == 1);
}

TEST_CASE("Transaction: explicit rollback", "[transaction]") {
  TempDb db("tx_rollback");
  SqliteConnection conn;
  OpenWithTable(db, conn);

  SqliteTransaction tx = conn.BeginTransaction();
  SqliteCommand(conn, tx, "INSERT INTO acct VALUES(1, 5)").ExecuteNonQuery();
  REQUIRE(tx.Rollback().ok());
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(tx.Rollback().code == ErrorCode::kInvalidOperation);
  REQUIRE(db.Count("acct") == 0);
}

TEST_CASE("Transaction: Complete twice", "[transaction]") {
  SqliteConnection conn(":memory:");
  REQUIRE(conn.Open().ok());
  SqliteTransaction tx = conn.BeginTransaction();
  REQUIRE(tx.Complete().ok());
  REQUIRE(tx.Complete().code == ErrorCode::kInvalidOperation);
}

TEST_CASE("Transaction: invalid guard", "[transaction]") {
  SqliteTransaction tx;
  REQUIRE_FALSE(tx.Valid());
  REQUIRE(tx.Complete().code == ErrorCode::kInvalidState);
  REQUIRE(tx.Rollback().code == ErrorCode::kInvalidState);
}

TEST_CASE("Transaction: failed execution dooms the transaction",
          "[transaction]") {
  TempDb db("tx_doomed");
  SqliteConnection conn;
  OpenWithTable(db, conn);

  SqliteTransaction tx = conn.BeginTransaction();
  SqliteCommand insert(conn, tx, "INSERT INTO acct VALUES(:id, 0)");
  REQUIRE(insert.ExecuteNonQuery(Params().Set("id", 1)) == 1);

  Error err;
  insert.ExecuteNonQuery(Params().Set("id", 1), &err);
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(tx.Context()->IsDoomed());

  // Further work in the doomed transaction is refused.
  insert.ExecuteNonQuery(Params().Set("id", 2), &err);
  REQUIRE(err.code == ErrorCode::kAborted);

  err = tx.Complete();
  REQUIRE(err.code == ErrorCode::kAborted);
  REQUIRE(tx.State() == TransactionState::kRolledBack);
  REQUIRE(db.Count("acct") == 0);
}

TEST_CASE("Transaction: command with another connection's transaction",
          "[transaction]") {
  TempDb db("tx_mismatch");
  SqliteConnection a;
  OpenWithTable(db, a);
  SqliteConnection b(db.Path());
  REQUIRE(b.Open().ok());

  SqliteTransaction tx = a.BeginTransaction();
  SqliteCommand cmd(b, tx, "INSERT INTO acct VALUES(1, 1)");
  REQUIRE(cmd.Status().code == ErrorCode::kConnectionMismatch);

  ExecutionResult r = cmd.Execute();
  REQUIRE(r.error.code == ErrorCode::kConnectionMismatch);
  REQUIRE(tx.Complete().ok());
  REQUIRE(db.Count("acct") == 0);

  Error err;
  SqliteCommand::Create(b, &tx, "SELECT 1", ResultShape::kRows, &err);
  REQUIRE(err.code == ErrorCode::kConnectionMismatch);
}

TEST_CASE("Transaction: pending transaction must be passed",
          "[transaction]") {
  SqliteConnection conn(":memory:");
  REQUIRE(conn.Open().ok());
  SqliteTransaction tx = conn.BeginTransaction();

  Error err;
  SqliteCommand(conn, "SELECT 1").ExecuteSingle(Params(), &err);
  REQUIRE(err.code == ErrorCode::kInvalidOperation);

  // A refused command does not doom the transaction.
  REQUIRE(tx.Complete().ok());
}

TEST_CASE("Transaction: command after completion", "[transaction]") {
  SqliteConnection conn(":memory:");
  REQUIRE(conn.Open().ok());
  SqliteTransaction tx = conn.BeginTransaction();
  SqliteCommand cmd(conn, tx, "SELECT 1", ResultShape::kSingleRow);
  REQUIRE(tx.Complete().ok());
  REQUIRE(cmd.Execute().error.code == ErrorCode::kInvalidState);
}

TEST_CASE("Transaction: one at a time per connection", "[transaction]") {
  SqliteConnection conn(":memory:");
  REQUIRE(conn.Open().ok());
  SqliteTransaction tx = conn.BeginTransaction();

  Error err;
  SqliteTransaction second = BeginExplicit(conn, IsolationLevel::kSerializable,
                                           &err);
  REQUIRE(err.code == ErrorCode::kConnectionInUse);
  REQUIRE_FALSE(second.Valid());

  REQUIRE(tx.Complete().ok());
  second = conn.BeginTransaction(IsolationLevel::kSerializable, &err);
  REQUIRE(err.ok());
  REQUIRE(second.Isolation() == IsolationLevel::kSerializable);
}

TEST_CASE("Transaction: move transfers ownership", "[transaction]") {
  TempDb db("tx_move");
  SqliteConnection conn;
  OpenWithTable(db, conn);

  SqliteTransaction a = conn.BeginTransaction();
  SqliteTransaction b(std::move(a));
  REQUIRE_FALSE(a.Valid());
  REQUIRE(b.Valid());
  SqliteCommand(conn, b, "INSERT INTO acct VALUES(1, 1)").ExecuteNonQuery();
  REQUIRE(b.Complete().ok());
  REQUIRE(db.Count("acct") == 1);
}

TEST_CASE("Transaction: cancellation", "[transaction]") {
  TempDb db("tx_cancel");
  SqliteConnection conn;
  OpenWithTable(db, conn);

  CancellationSource source;
  SqliteTransaction tx = conn.BeginTransaction();
  tx.SetCancellation(source.Token());
  SqliteCommand insert(conn, tx, "INSERT INTO acct VALUES(:id, 0)");
  REQUIRE(insert.ExecuteNonQuery(Params().Set("id", 1)) == 1);

  source.Cancel();
  Error err;
  insert.ExecuteNonQuery(Params().Set("id", 2), &err);
  REQUIRE(err.code == ErrorCode::kCancelled);

  REQUIRE(tx.Complete().code == ErrorCode::kCancelled);
  REQUIRE(db.Count("acct") == 0);
}
