#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

namespace mediaflow::db::sqlite {

struct SqliteOptions {
  int  busy_timeout_ms{5000};
  bool wal{true}; // ignored for :memory:
};

/*
  Owns one sqlite3 connection, opened in serialized (FULLMUTEX) mode.

  Schema changes go through Migrate(): step i (0-based) runs once, when
  PRAGMA user_version is i, and bumps user_version to i + 1 in the same
  transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  int  UserVersion();
  void Migrate(const std::vector<std::string>& steps);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Prepared statement, finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  // SQLITE_OK when preparation succeeded.
  int prepare_rc() const {
    return prepare_rc_;
  }

  void BindText(int index, const std::string& value);
  void BindU64(int index, std::uint64_t value);

  int Step();

  std::string   ColumnText(int column) const;
  std::uint64_t ColumnU64(int column) const;

 private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

} // namespace mediaflow::db::sqlite
