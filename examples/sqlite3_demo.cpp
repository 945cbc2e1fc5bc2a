// Copyright (c) 2024 liudegui. MIT License.
//
// txpp SQLite3 demo -- explicit and ambient transactions.
//
// Usage:
//   ./sqlite3_demo            (TXPP_LOG_LEVEL=debug to trace enlistment)

#include <cstdio>
#include <future>

#include "txpp/txpp.hpp"

static const char* kBankDb = "txpp_demo_bank.db";
static const char* kAuditDb = "txpp_demo_audit.db";

static bool Check(const txpp::Error& err, const char* what) {
  if (!err.ok()) {
    std::fprintf(stderr, "%s failed: [%s] %s\n", what,
                 txpp::ErrorCodeName(err.code), err.message);
    return false;
  }
  return true;
}

static void PrintAccounts(txpp::SqliteConnection& conn) {
  txpp::RowSet rows =
      txpp::SqliteCommand(conn, "SELECT id, owner, balance FROM account "
                                "ORDER BY id")
          .ExecuteRows();
  for (const txpp::Row& row : rows) {
    std::printf("  %d %-6s %6.2f\n", row.GetInt("id"), row.GetString("owner"),
                row.GetDouble("balance"));
  }
}

int main() {
  std::remove(kBankDb);
  std::remove(kAuditDb);

  txpp::SqliteConnection conn(kBankDb);
  if (!Check(conn.Open(), "Open")) { return 1; }

  txpp::Error err;
  conn.Session()->ExecDml(
      "CREATE TABLE account(id INTEGER PRIMARY KEY, owner TEXT, "
      "balance REAL NOT NULL CHECK(balance >= 0));"
      "INSERT INTO account VALUES(1, 'alice', 100), (2, 'bob', 50);",
      &err);
  if (!Check(err, "Create schema")) { return 1; }

  // Explicit transaction: commands carry the transaction they run in.
  std::printf("--- Explicit transaction ---\n");
  {
    txpp::SqliteTransaction tx = conn.BeginTransaction();
    txpp::SqliteCommand move(conn, tx,
                             "UPDATE account SET balance = balance + :delta "
                             "WHERE id = :id");
    move.ExecuteNonQuery(txpp::Params().Set("id", 1).Set("delta", -30.0));
    move.ExecuteNonQuery(txpp::Params().Set("id", 2).Set("delta", 30.0));
    Check(tx.Complete(), "Complete");
  }
  PrintAccounts(conn);

  // A failing statement dooms the transaction; nothing is applied.
  std::printf("--- Overdraft is rolled back ---\n");
  {
    txpp::SqliteTransaction tx = conn.BeginTransaction();
    txpp::SqliteCommand move(conn, tx,
                             "UPDATE account SET balance = balance + :delta "
                             "WHERE id = :id");
    move.ExecuteNonQuery(txpp::Params().Set("id", 2).Set("delta", 500.0));
    move.ExecuteNonQuery(txpp::Params().Set("id", 1).Set("delta", -500.0),
                         &err);
    std::printf("  debit: %s\n", txpp::ErrorCodeName(err.code));
    std::printf("  complete: %s\n", txpp::ErrorCodeName(tx.Complete().code));
  }
  PrintAccounts(conn);
  Check(conn.Close(), "Close");

  // Ambient scope: connections opened inside enlist by themselves.
  std::printf("--- Ambient scope over two databases ---\n");
  {
    txpp::TransactionScope scope(txpp::IsolationLevel::kSerializable, true);
    txpp::SqliteCommand(kAuditDb,
                        "CREATE TABLE IF NOT EXISTS audit(msg TEXT)")
        .Execute();

    txpp::SqliteConnection bank(kBankDb);
    txpp::SqliteConnection audit(kAuditDb);
    // audit reuses the session parked by the CREATE above; bank needs a
    // second physical session, so the scope escalates.
    Check(audit.Open(), "Open audit");
    Check(bank.Open(), "Open bank");
    std::printf("  distributed: %s\n",
                scope.IsDistributed() ? "yes" : "no");

    txpp::SqliteCommand(bank, "UPDATE account SET balance = balance * 1.01")
        .Execute();
    // The insert runs on a worker thread inside the same transaction.
    std::future<txpp::ExecutionResult> logged =
        txpp::SqliteCommand(audit, "INSERT INTO audit VALUES(:msg)")
            .ExecuteAsync(txpp::Params().Set("msg", "interest applied"));
    Check(logged.get().error, "Async insert");
    Check(scope.Complete(), "Scope complete");
  }

  // Batch: pending row changes applied in one unit.
  std::printf("--- Batch ---\n");
  Check(conn.Open(), "Reopen");
  txpp::Batch batch("account");
  batch.AddInsert(txpp::Params().Set("id", 3).Set("owner", "carol").Set(
      "balance", 10.0));
  batch.AddUpdate(txpp::Params().Set("id", 2),
                  txpp::Params().Set("owner", "robert"));
  int64_t changed = batch.Apply(conn, nullptr, &err);
  if (Check(err, "Batch apply")) {
    std::printf("  %lld row(s) changed\n", static_cast<long long>(changed));
  }
  PrintAccounts(conn);

  txpp::Row audit_rows =
      txpp::SqliteCommand(kAuditDb, "SELECT count(*) AS n FROM audit",
                          txpp::ResultShape::kSingleRow)
          .ExecuteSingle()
          .value_or(txpp::Row());
  std::printf("audit entries: %lld\n",
              static_cast<long long>(audit_rows.GetInt64("n")));

  conn.Close();
  std::remove(kBankDb);
  std::remove(kAuditDb);
  return 0;
}
