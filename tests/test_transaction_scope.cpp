// Copyright (c) 2024 liudegui. MIT License.
// Tests for txpp::TransactionScope (ambient mode).

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "test_helpers.hpp"
#include "txpp/txpp.hpp"

using namespace txpp;
using txpp_test::TempDb;

static void CreateTable(const TempDb& db) {
  db.Exec("CREATE TABLE item(id INTEGER PRIMARY KEY, name TEXT);");
}

static Error Insert(const TempDb& db, int id) {
  return SqliteCommand(db.Path(), "INSERT INTO item VALUES(:id, 'x')")
      .Execute(Params().Set("id", id))
      .error;
}

TEST_CASE("TransactionScope: complete commits", "[scope]") {
  TempDb db("scope_commit");
  CreateTable(db);
  {
    TransactionScope scope;
    REQUIRE(scope.Status().ok());
    REQUIRE(scope.IsRoot());
    REQUIRE(AmbientScopeManager::Current() == scope.Context());

    REQUIRE(Insert(db, 1).ok());
    REQUIRE(Insert(db, 2).ok());
    REQUIRE(db.Count("item") == 0);

    REQUIRE(scope.Complete().ok());
    REQUIRE(scope.Context()->State() == TransactionState::kCommitted);
  }
  REQUIRE(AmbientScopeManager::Current() == nullptr);
  REQUIRE(db.Count("item") == 2);
}

TEST_CASE("TransactionScope: release without Complete rolls back",
          "[scope]") {
  TempDb db("scope_rollback");
  CreateTable(db);
  std::shared_ptr<TransactionContext> ctx;
  {
    TransactionScope scope;
    ctx = scope.Context();
    REQUIRE(Insert(db, 1).ok());
  }
  REQUIRE(ctx->State() == TransactionState::kRolledBack);
  REQUIRE(db.Count("item") == 0);
}

TEST_CASE("TransactionScope: default isolation is serializable", "[scope]") {
  TransactionScope scope;
  REQUIRE(scope.Context()->Isolation() == IsolationLevel::kSerializable);
  REQUIRE(scope.Context()->Mode() == ContextMode::kAmbient);
}

TEST_CASE("TransactionScope: closed connection session is reused",
          "[scope]") {
  TempDb db("scope_reuse");
  CreateTable(db);

  TransactionScope scope;
  REQUIRE(Insert(db, 1).ok());
  REQUIRE(Insert(db, 2).ok());
  REQUIRE(Insert(db, 3).ok());
  REQUIRE(scope.Context()->EnlistmentCount() == 1);
  REQUIRE_FALSE(scope.IsDistributed());
  REQUIRE(scope.RequireLocal().ok());
  REQUIRE(scope.Complete().ok());
  REQUIRE(db.Count("item") == 3);
}

TEST_CASE("TransactionScope: nested scope joins the outer transaction",
          "[scope]") {
  TempDb db("scope_nested");
  CreateTable(db);
  {
    TransactionScope outer;
    REQUIRE(Insert(db, 1).ok());
    {
      TransactionScope inner;
      REQUIRE(inner.Status().ok());
      REQUIRE_FALSE(inner.IsRoot());
      REQUIRE(inner.Context() == outer.Context());
      REQUIRE(AmbientScopeManager::Depth() == 2);
      REQUIRE(Insert(db, 2).ok());
      REQUIRE(inner.Complete().ok());
      REQUIRE(inner.Complete().code == ErrorCode::kInvalidOperation);
    }
    // Joined completion does not commit.
    REQUIRE(outer.Context()->IsActive());
    REQUIRE(db.Count("item") == 0);
    REQUIRE(outer.Complete().ok());
  }
  REQUIRE(db.Count("item") == 2);
}

TEST_CASE("TransactionScope: nested scope without Complete aborts outer",
          "[scope]") {
  TempDb db("scope_nested_abort");
  CreateTable(db);
  {
    TransactionScope outer;
    REQUIRE(Insert(db, 1).ok());
    {
      TransactionScope inner;
      REQUIRE(Insert(db, 2).ok());
    }
    REQUIRE(outer.Context()->IsDoomed());
    REQUIRE(outer.Complete().code == ErrorCode::kAborted);
  }
  REQUIRE(db.Count("item") == 0);
}

TEST_CASE("TransactionScope: nested isolation must match", "[scope]") {
  TransactionScope outer(IsolationLevel::kReadCommitted, false);
  {
    TransactionScope inner(IsolationLevel::kSerializable, false);
    REQUIRE(inner.Status().code == ErrorCode::kInvalidOperation);
    REQUIRE(inner.Context() == nullptr);
    REQUIRE(AmbientScopeManager::Depth() == 1);
    REQUIRE(inner.Complete().code == ErrorCode::kInvalidOperation);
  }
  REQUIRE(AmbientScopeManager::Depth() == 1);
  REQUIRE_FALSE(outer.Context()->IsDoomed());
  REQUIRE(outer.Complete().ok());
}

TEST_CASE("TransactionScope: RequiresNew is independent", "[scope]") {
  TempDb db("scope_new");
  CreateTable(db);
  TempDb audit("scope_new_audit");
  audit.Exec("CREATE TABLE item(id INTEGER PRIMARY KEY, name TEXT);");
  {
    TransactionScope outer;
    REQUIRE(Insert(db, 1).ok());
    {
      ScopeOptions options;
      options.option = ScopeOption::kRequiresNew;
      TransactionScope inner(options);
      REQUIRE(inner.IsRoot());
      REQUIRE(inner.Context() != outer.Context());
      REQUIRE(Insert(audit, 1).ok());
      REQUIRE(inner.Complete().ok());
    }
    REQUIRE(audit.Count("item") == 1);
    // outer released without Complete
  }
  REQUIRE(db.Count("item") == 0);
  REQUIRE(audit.Count("item") == 1);
}

TEST_CASE("TransactionScope: Suppress runs in autocommit", "[scope]") {
  TempDb db("scope_suppress");
  CreateTable(db);
  TempDb log("scope_suppress_log");
  log.Exec("CREATE TABLE item(id INTEGER PRIMARY KEY, name TEXT);");
  {
    TransactionScope outer;
    REQUIRE(Insert(db, 1).ok());
    {
      ScopeOptions options;
      options.option = ScopeOption::kSuppress;
      TransactionScope none(options);
      REQUIRE(AmbientScopeManager::Current() == nullptr);
      REQUIRE(Insert(log, 1).ok());
      REQUIRE(log.Count("item") == 1);
      REQUIRE(none.Complete().ok());
    }
    REQUIRE(AmbientScopeManager::Current() == outer.Context());
  }
  REQUIRE(db.Count("item") == 0);
  REQUIRE(log.Count("item") == 1);
}

TEST_CASE("TransactionScope: two databases escalate", "[scope]") {
  TempDb a("scope_esc_a");
  TempDb b("scope_esc_b");
  CreateTable(a);
  CreateTable(b);
  {
    TransactionScope scope;
    SqliteConnection ca(a.Path());
    SqliteConnection cb(b.Path());
    REQUIRE(ca.Open().ok());
    REQUIRE_FALSE(scope.IsDistributed());
    REQUIRE(cb.Open().ok());
    REQUIRE(scope.IsDistributed());
    REQUIRE(scope.RequireLocal().code ==
            ErrorCode::kUnexpectedDistributedTransaction);

    REQUIRE(SqliteCommand(ca, "INSERT INTO item VALUES(1, 'a')")
                .ExecuteNonQuery() == 1);
    REQUIRE(SqliteCommand(cb, "INSERT INTO item VALUES(1, 'b')")
                .ExecuteNonQuery() == 1);
    REQUIRE(scope.Complete().ok());
  }
  REQUIRE(a.Count("item") == 1);
  REQUIRE(b.Count("item") == 1);
}

TEST_CASE("TransactionScope: sequential connections to one database share "
          "a session",
          "[scope]") {
  TempDb db("scope_seq_same");
  CreateTable(db);
  {
    TransactionScope scope;
    {
      SqliteConnection first(db.Path());
      REQUIRE(first.Open().ok());
      REQUIRE(SqliteCommand(first, "INSERT INTO item VALUES(1, 'a')")
                  .ExecuteNonQuery() == 1);
    }
    {
      SqliteConnection second(db.Path());
      REQUIRE(second.Open().ok());
      REQUIRE(SqliteCommand(second, "INSERT INTO item VALUES(2, 'b')")
                  .ExecuteNonQuery() == 1);
    }
    REQUIRE(scope.Context()->EnlistmentCount() == 1);
    REQUIRE_FALSE(scope.IsDistributed());
    REQUIRE(scope.RequireLocal().ok());
    REQUIRE(scope.Complete().ok());
  }
  REQUIRE(db.Count("item") == 2);
}

TEST_CASE("TransactionScope: sequential connections to two databases "
          "escalate",
          "[scope]") {
  TempDb a("scope_seq_a");
  TempDb b("scope_seq_b");
  CreateTable(a);
  CreateTable(b);
  {
    TransactionScope scope;
    REQUIRE(Insert(a, 1).ok());
    REQUIRE_FALSE(scope.IsDistributed());
    // The first session is parked, not closed: both stay open until commit.
    REQUIRE(Insert(b, 1).ok());
    REQUIRE(scope.Context()->EnlistmentCount() == 2);
    REQUIRE(scope.IsDistributed());
    REQUIRE(scope.RequireLocal().code ==
            ErrorCode::kUnexpectedDistributedTransaction);
    // Rejected by the caller before commit: nothing persists anywhere.
  }
  REQUIRE(a.Count("item") == 0);
  REQUIRE(b.Count("item") == 0);
}

TEST_CASE("TransactionScope: parked session blocks a second database under "
          "reject",
          "[scope]") {
  TempDb a("scope_seq_rej_a");
  TempDb b("scope_seq_rej_b");
  CreateTable(a);
  CreateTable(b);
  {
    ScopeOptions options;
    options.escalation = EscalationPolicy::kReject;
    TransactionScope scope(options);
    REQUIRE(Insert(a, 1).ok());
    REQUIRE(Insert(b, 1).code ==
            ErrorCode::kUnexpectedDistributedTransaction);
    REQUIRE(scope.Context()->EnlistmentCount() == 1);
    REQUIRE_FALSE(scope.IsDistributed());
    REQUIRE(scope.Complete().ok());
  }
  REQUIRE(a.Count("item") == 1);
  REQUIRE(b.Count("item") == 0);
}

TEST_CASE("TransactionScope: different BusyTimeout opens a new session",
          "[scope]") {
  TempDb db("scope_busy_opt");
  CreateTable(db);

  TransactionScope scope;
  {
    SqliteConnection first(db.ConnectionString("BusyTimeout=100").c_str());
    REQUIRE(first.Open().ok());
  }
  {
    SqliteConnection same(db.ConnectionString("BusyTimeout=100").c_str());
    REQUIRE(same.Open().ok());
  }
  REQUIRE(scope.Context()->EnlistmentCount() == 1);
  {
    SqliteConnection other(db.ConnectionString("BusyTimeout=2000").c_str());
    REQUIRE(other.Open().ok());
  }
  REQUIRE(scope.Context()->EnlistmentCount() == 2);
  REQUIRE(scope.IsDistributed());
}

TEST_CASE("TransactionScope: in-memory databases are never shared",
          "[scope]") {
  TransactionScope scope;
  {
    SqliteConnection first(":memory:");
    REQUIRE(first.Open().ok());
    REQUIRE(SqliteCommand(first, "CREATE TABLE scratch(v INTEGER)")
                .Execute()
                .ok());
  }
  SqliteConnection second(":memory:");
  REQUIRE(second.Open().ok());
  REQUIRE(scope.Context()->EnlistmentCount() == 2);
  REQUIRE_FALSE(second.Session()->TableExists("scratch"));
}

TEST_CASE("TransactionScope: escalation refused when rejected", "[scope]") {
  TempDb a("scope_rej_a");
  TempDb b("scope_rej_b");
  CreateTable(a);
  CreateTable(b);

  ScopeOptions options;
  options.escalation = EscalationPolicy::kReject;
  TransactionScope scope(options);
  SqliteConnection ca(a.Path());
  SqliteConnection cb(b.Path());
  REQUIRE(ca.Open().ok());
  REQUIRE(cb.Open().code == ErrorCode::kUnexpectedDistributedTransaction);
  REQUIRE_FALSE(cb.IsOpen());
  REQUIRE_FALSE(scope.IsDistributed());

  REQUIRE(SqliteCommand(ca, "INSERT INTO item VALUES(1, 'a')")
              .ExecuteNonQuery() == 1);
  REQUIRE(scope.Complete().ok());
  REQUIRE(a.Count("item") == 1);
}

TEST_CASE("TransactionScope: failed command dooms the scope", "[scope]") {
  TempDb db("scope_fail");
  CreateTable(db);
  {
    TransactionScope scope;
    REQUIRE(Insert(db, 1).ok());
    REQUIRE(Insert(db, 1).code == ErrorCode::kConstraint);
    REQUIRE(Insert(db, 2).code == ErrorCode::kAborted);
    REQUIRE(scope.Complete().code == ErrorCode::kAborted);
  }
  REQUIRE(db.Count("item") == 0);
}

TEST_CASE("TransactionScope: work after completion", "[scope]") {
  TempDb db("scope_after");
  CreateTable(db);
  TransactionScope scope;
  SqliteConnection conn(db.Path());
  REQUIRE(conn.Open().ok());
  REQUIRE(scope.Complete().ok());

  // The enlistment ended with the transaction: back to autocommit.
  REQUIRE_FALSE(conn.IsEnlisted());
  ExecutionResult r =
      SqliteCommand(conn, "INSERT INTO item VALUES(1, 'x')").Execute();
  REQUIRE(r.error.code == ErrorCode::kInvalidState);
  REQUIRE(scope.Complete().code == ErrorCode::kInvalidOperation);
}

TEST_CASE("TransactionScope: cancellation before Complete", "[scope]") {
  TempDb db("scope_cancel");
  CreateTable(db);
  CancellationSource source;
  {
    ScopeOptions options;
    options.cancellation = source.Token();
    TransactionScope scope(options);
    REQUIRE(Insert(db, 1).ok());
    source.Cancel();
    REQUIRE(Insert(db, 2).code == ErrorCode::kCancelled);
    REQUIRE(scope.Complete().code == ErrorCode::kCancelled);
    REQUIRE(scope.Context()->State() == TransactionState::kRolledBack);
  }
  REQUIRE(db.Count("item") == 0);
}

TEST_CASE("TransactionScope: nested scope in a completed transaction",
          "[scope]") {
  TransactionScope outer;
  REQUIRE(outer.Complete().ok());
  TransactionScope inner;
  REQUIRE(inner.Status().code == ErrorCode::kInvalidState);
  REQUIRE(AmbientScopeManager::Depth() == 1);
}
