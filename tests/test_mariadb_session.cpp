// Copyright (c) 2024 liudegui. MIT License.
// Tests for txpp::MariaSession and the transaction layer on MariaDB
// (requires running MySQL/MariaDB server).
//
// Environment variables:
//   TXPP_MARIA_DSN  -- DSN string, default "localhost:3306:root::txpp_test"

#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

#include "txpp/txpp.hpp"

using namespace txpp;

static const char* GetDsn() {
  const char* dsn = std::getenv("TXPP_MARIA_DSN");
  return (dsn != nullptr) ? dsn : "localhost:3306:root::txpp_test";
}

static ConnectionOptions DsnOptions() {
  ConnectionOptions o;
  REQUIRE(o.Parse(GetDsn()).ok());
  return o;
}

static MariaSession OpenTestDb() {
  MariaSession db;
  auto err = db.Open(DsnOptions());
  REQUIRE(err.ok());
  db.ExecDml("DROP TABLE IF EXISTS emp;");
  db.ExecDml("CREATE TABLE emp(empno INT PRIMARY KEY, empname VARCHAR(64), "
             "salary DOUBLE) ENGINE=InnoDB;");
  return db;
}

static int64_t CountEmp() {
  MariaSession db;
  REQUIRE(db.Open(DsnOptions()).ok());
  Error err;
  MariaReader r = db.Query("SELECT COUNT(*) FROM emp", Params(), &err);
  REQUIRE(err.ok());
  return r.GetInt64(0);
}

TEST_CASE("MariaSession: open and close", "[mariadb]") {
  MariaSession db;
  REQUIRE_FALSE(db.IsOpen());
  REQUIRE(db.Open(DsnOptions()).ok());
  REQUIRE(db.IsOpen());
  db.Close();
  REQUIRE_FALSE(db.IsOpen());
}

TEST_CASE("MariaSession: parameters are expanded as literals", "[mariadb]") {
  auto db = OpenTestDb();
  std::string text;
  Error err = db.ExpandParams(
      "SELECT @name, ':kept', @@autocommit -- @ignored\n, :n",
      Params().Set("name", "O'Hara").Set("n", Value::Null()), &text);
  REQUIRE(err.ok());
  REQUIRE(text.find("'O\\'Hara'") != std::string::npos);
  REQUIRE(text.find("':kept'") != std::string::npos);
  REQUIRE(text.find("@@autocommit") != std::string::npos);
  REQUIRE(text.find("@ignored") != std::string::npos);
  REQUIRE(text.find("NULL") != std::string::npos);

  err = db.ExpandParams("SELECT @missing", Params(), &text);
  REQUIRE(err.code == ErrorCode::kNotFound);
}

TEST_CASE("MariaSession: execute and query", "[mariadb]") {
  auto db = OpenTestDb();
  Error err;
  int64_t n = db.Execute("INSERT INTO emp VALUES(@no, @name, @sal)",
                         Params().Set("no", 1).Set("name", "Alice").Set(
                             "sal", 10.5),
                         &err);
  REQUIRE(err.ok());
  REQUIRE(n == 1);

  MariaReader r = db.Query("SELECT * FROM emp WHERE empno = :no",
                           Params().Set("no", 1), &err);
  REQUIRE(err.ok());
  REQUIRE_FALSE(r.Eof());
  Row row = r.ReadRow();
  REQUIRE(row.Get("empno").Type() == ValueType::kInt);
  REQUIRE(row.Get("salary").Type() == ValueType::kReal);
  REQUIRE(std::strcmp(row.GetString("empname"), "Alice") == 0);
}

TEST_CASE("MariaSession: duplicate key", "[mariadb]") {
  auto db = OpenTestDb();
  Error err;
  db.Execute("INSERT INTO emp(empno) VALUES(1)", Params(), &err);
  db.Execute("INSERT INTO emp(empno) VALUES(1)", Params(), &err);
  REQUIRE(err.code == ErrorCode::kConstraint);
}

TEST_CASE("MariaSession: TableExists", "[mariadb]") {
  auto db = OpenTestDb();
  REQUIRE(db.TableExists("emp"));
  REQUIRE_FALSE(db.TableExists("no_such_table"));
}

TEST_CASE("MariaConnection: explicit transaction", "[mariadb]") {
  auto setup = OpenTestDb();
  MariaConnection conn(GetDsn());
  REQUIRE(conn.Open().ok());
  {
    MariaTransaction tx = conn.BeginTransaction();
    MariaCommand(conn, tx, "INSERT INTO emp(empno) VALUES(1)")
        .ExecuteNonQuery();
  }
  REQUIRE(CountEmp() == 0);

  MariaTransaction tx =
      conn.BeginTransaction(IsolationLevel::kSerializable);
  MariaCommand(conn, tx, "INSERT INTO emp(empno) VALUES(2)").ExecuteNonQuery();
  REQUIRE(tx.Complete().ok());
  REQUIRE(CountEmp() == 1);
}

TEST_CASE("MariaConnection: ambient scope reuses one session", "[mariadb]") {
  auto setup = OpenTestDb();
  {
    TransactionScope scope(IsolationLevel::kReadCommitted, false);
    MariaCommand insert(GetDsn(), "INSERT INTO emp(empno) VALUES(@no)");
    REQUIRE(insert.Execute(Params().Set("no", 1)).ok());
    REQUIRE(insert.Execute(Params().Set("no", 2)).ok());
    REQUIRE(scope.Context()->EnlistmentCount() == 1);
    REQUIRE_FALSE(scope.IsDistributed());
    REQUIRE(scope.Complete().ok());
  }
  REQUIRE(CountEmp() == 2);
}

TEST_CASE("MariaConnection: batch inside a savepoint", "[mariadb]") {
  auto setup = OpenTestDb();
  MariaConnection conn(GetDsn());
  REQUIRE(conn.Open().ok());
  MariaTransaction tx = conn.BeginTransaction();

  Batch batch("emp");
  batch.AddInsert(Params().Set("empno", 1).Set("empname", "a"));
  batch.AddInsert(Params().Set("empno", 1).Set("empname", "dup"));
  Error err;
  REQUIRE(batch.Apply(conn, &tx, &err) == 0);
  REQUIRE(err.code == ErrorCode::kConstraint);
  REQUIRE(batch.PendingCount() == 2);

  batch.Clear();
  batch.AddInsert(Params().Set("empno", 3).Set("empname", "c"));
  REQUIRE(batch.Apply(conn, &tx, &err) == 1);
  REQUIRE(tx.Complete().ok());
  REQUIRE(CountEmp() == 1);
}
