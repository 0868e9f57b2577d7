#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace mediaflow::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  try {
    Check(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
    Check(sqlite3_busy_timeout(db_, options.busy_timeout_ms), db_, "busy_timeout");
    if (options.wal && path_ != ":memory:") {
      Exec("PRAGMA journal_mode=WAL;");
    }
    Exec("PRAGMA synchronous=NORMAL;");
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

int SqliteDB::UserVersion() {
  Statement stmt(db_, "PRAGMA user_version;");
  Check(stmt.prepare_rc(), db_, "user_version");
  if (stmt.Step() != SQLITE_ROW) {
    throw std::runtime_error(std::string("user_version: ") + sqlite3_errmsg(db_));
  }
  return static_cast<int>(stmt.ColumnU64(0));
}

void SqliteDB::Migrate(const std::vector<std::string>& steps) {
  const int current = UserVersion();
  if (current > static_cast<int>(steps.size())) {
    throw std::runtime_error("sqlite schema version " + std::to_string(current) + " is newer than this build (" +
                             std::to_string(steps.size()) + ")");
  }

  for (int version = current; version < static_cast<int>(steps.size()); ++version) {
    Exec("BEGIN IMMEDIATE;");
    try {
      Exec(steps[version]);
      Exec("PRAGMA user_version=" + std::to_string(version + 1) + ";");
      Exec("COMMIT;");
    } catch (const std::exception& e) {
      if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        MEDIAFLOW_LOG_ERROR("sqlite migration rollback failed", {observability::StringField("error", sqlite3_errmsg(db_))});
      }
      throw std::runtime_error("sqlite migration to version " + std::to_string(version + 1) + " failed: " + e.what());
    }
    MEDIAFLOW_LOG_INFO("sqlite schema migrated", {observability::StringField("path", path_), observability::IntField("version", version + 1)});
  }
}

// ------------------------------------------------------------
// Statement
// ------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) {
  prepare_rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int index, const std::string& value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::BindU64(int index, std::uint64_t value) {
  sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::ColumnText(int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_, column);
  if (!text) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::uint64_t Statement::ColumnU64(int column) const {
  return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, column));
}

} // namespace mediaflow::db::sqlite
