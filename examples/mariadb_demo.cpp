// Copyright (c) 2024 liudegui. MIT License.
//
// txpp MariaDB demo -- explicit and ambient transactions via
// Connection<MariaBackend>.
//
// Usage:
//   export TXPP_MARIA_DSN="localhost:3306:root:pass:txpp_test"
//   ./mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS txpp_test;"

#include <cstdio>
#include <cstdlib>
#include <optional>

#include "txpp/txpp.hpp"

static void Show(const char* what, const txpp::Error& err) {
  std::printf("%-22s %s%s%s\n", what, txpp::ErrorCodeName(err.code),
              err.ok() ? "" : ": ", err.message);
}

static long long CountEmp(txpp::MariaConnection& conn) {
  std::optional<txpp::Row> row =
      txpp::MariaCommand(conn, "SELECT COUNT(*) FROM emp").ExecuteSingle();
  return row ? static_cast<long long>(row->GetInt64(0)) : -1;
}

int main() {
  const char* dsn = std::getenv("TXPP_MARIA_DSN");
  if (dsn == nullptr) {
    dsn = "localhost:3306:root::txpp_test";
  }

  txpp::MariaConnection conn(dsn);
  txpp::Error err = conn.Open();
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }
  std::printf("Connected to MariaDB/MySQL\n");

  txpp::MariaSession* session = conn.Session();
  session->ExecDml("DROP TABLE IF EXISTS emp");
  session->ExecDml(
      "CREATE TABLE emp(empno INT PRIMARY KEY, empname VARCHAR(64)) "
      "ENGINE=InnoDB",
      &err);
  Show("create table", err);

  // Explicit transaction
  {
    txpp::MariaTransaction tx =
        conn.BeginTransaction(txpp::IsolationLevel::kRepeatableRead, &err);
    txpp::MariaCommand insert(conn, tx,
                              "INSERT INTO emp VALUES(@no, @name)");
    insert.ExecuteNonQuery(txpp::Params().Set("no", 1).Set("name", "Alice"));
    insert.ExecuteNonQuery(txpp::Params().Set("no", 2).Set("name", "O'Hara"));
    Show("explicit commit", tx.Complete());
  }
  std::printf("rows: %lld\n", CountEmp(conn));

  // Duplicate key dooms the transaction
  {
    txpp::MariaTransaction tx = conn.BeginTransaction();
    txpp::MariaCommand insert(conn, tx,
                              "INSERT INTO emp VALUES(@no, @name)");
    insert.ExecuteNonQuery(txpp::Params().Set("no", 3).Set("name", "Carl"));
    insert.ExecuteNonQuery(txpp::Params().Set("no", 1).Set("name", "Dup"),
                           &err);
    Show("duplicate insert", err);
    Show("explicit commit", tx.Complete());
  }
  std::printf("rows: %lld\n", CountEmp(conn));
  conn.Close();

  // Ambient scope: each command opens its own connection, all of them
  // share one physical session and commit together.
  {
    txpp::TransactionScope scope(txpp::IsolationLevel::kReadCommitted, false);
    txpp::MariaCommand insert(dsn, "INSERT INTO emp VALUES(@no, @name)");
    for (int i = 10; i < 15; ++i) {
      insert.Execute(txpp::Params().Set("no", i).Set("name", "Temp"));
    }
    std::printf("enlisted sessions: %zu\n",
                scope.Context()->EnlistmentCount());
    Show("scope complete", scope.Complete());
  }

  conn.Open();
  std::printf("rows: %lld\n", CountEmp(conn));

  // Batch
  txpp::Batch batch("emp");
  batch.AddUpdate(txpp::Params().Set("empno", 10),
                  txpp::Params().Set("empname", "Boss"));
  batch.AddDelete(txpp::Params().Set("empno", 14));
  long long changed = batch.Apply(conn, nullptr, &err);
  Show("batch", err);
  std::printf("batch changed %lld row(s), rows: %lld\n", changed,
              CountEmp(conn));

  conn.Session()->ExecDml("DROP TABLE IF EXISTS emp");
  conn.Close();
  std::printf("\nDone.\n");
  return 0;
}
