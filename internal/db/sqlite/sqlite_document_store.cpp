#include "sqlite_document_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace mediaflow::db::sqlite {

using mediaflow::db::ErrorCode;
using mediaflow::db::Result;

namespace {

// Appended to, never edited: index i upgrades user_version i to i + 1.
const std::vector<std::string> kMigrations = {
    "CREATE TABLE IF NOT EXISTS document("
    " collection TEXT NOT NULL,"
    " id TEXT NOT NULL,"
    " fields_json TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY(collection, id));",
    "CREATE INDEX IF NOT EXISTS document_by_created ON document(collection, created_at_ms);",
};

/*
  BEGIN IMMEDIATE ... COMMIT, rolled back unless Commit() succeeded.
*/
class ScopedTransaction {
 public:
  explicit ScopedTransaction(sqlite3* db) : db_(db) {
    begin_rc_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr);
  }

  ~ScopedTransaction() {
    if (begin_rc_ == SQLITE_OK && !committed_) {
      int rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
      if (rc != SQLITE_OK) {
        MEDIAFLOW_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", sqlite3_errmsg(db_))});
      }
    }
  }

  int begin_rc() const {
    return begin_rc_;
  }

  int Commit() {
    int rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr);
    if (rc == SQLITE_OK) {
      committed_ = true;
    }
    return rc;
  }

 private:
  sqlite3* db_;
  int      begin_rc_ = SQLITE_OK;
  bool     committed_ = false;
};

Result ToJson(const google::protobuf::Struct& fields, std::string& json) {
  auto status = google::protobuf::util::MessageToJsonString(fields, &json);
  if (!status.ok()) {
    return Result::Err(ErrorCode::InvalidArgument, std::string(status.message()));
  }
  return Result::Ok();
}

Result FromJson(const std::string& json, google::protobuf::Struct& fields) {
  auto status = google::protobuf::util::JsonStringToMessage(json, &fields);
  if (!status.ok()) {
    return Result::Err(ErrorCode::Corruption, std::string(status.message()));
  }
  return Result::Ok();
}

} // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteDocumentStore requires a database");
  }
  db_->Migrate(kMigrations);
}

Result SqliteDocumentStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteDocumentStore::CreateRecord(model::DocumentRecord& record) {
  if (record.collection.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "collection must not be empty");
  }
  if (record.id.empty()) {
    record.id = util::GenerateId();
  }

  std::string json;
  if (auto r = ToJson(record.fields, json); !r) {
    return r;
  }

  const auto now       = util::ToUnixMillis(util::Now());
  record.created_at_ms = now;
  record.updated_at_ms = now;

  std::lock_guard<std::mutex> lock(mutex_);
  auto*                       db = db_->Handle();

  Statement stmt(db, "INSERT INTO document(collection,id,fields_json,created_at_ms,updated_at_ms) VALUES(?,?,?,?,?);");
  if (stmt.prepare_rc() != SQLITE_OK) return Translate(db, stmt.prepare_rc());

  stmt.BindText(1, record.collection);
  stmt.BindText(2, record.id);
  stmt.BindText(3, json);
  stmt.BindU64(4, record.created_at_ms);
  stmt.BindU64(5, record.updated_at_ms);

  return Translate(db, stmt.Step());
}

std::optional<model::DocumentRecord> SqliteDocumentStore::SelectLocked(const std::string& collection, const std::string& id,
                                                                       Result& result) {
  auto* db = db_->Handle();

  Statement stmt(db, "SELECT fields_json,created_at_ms,updated_at_ms FROM document WHERE collection=? AND id=?;");
  if (stmt.prepare_rc() != SQLITE_OK) {
    result = Translate(db, stmt.prepare_rc());
    return std::nullopt;
  }

  stmt.BindText(1, collection);
  stmt.BindText(2, id);

  const int rc = stmt.Step();
  if (rc == SQLITE_DONE) {
    result = Result::Err(ErrorCode::NotFound, collection + "/" + id);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    result = Translate(db, rc);
    return std::nullopt;
  }

  model::DocumentRecord record;
  record.collection    = collection;
  record.id            = id;
  record.created_at_ms = stmt.ColumnU64(1);
  record.updated_at_ms = stmt.ColumnU64(2);

  result = FromJson(stmt.ColumnText(0), record.fields);
  if (!result) {
    return std::nullopt;
  }
  return record;
}

Result SqliteDocumentStore::PatchRecord(const std::string& collection, const std::string& id, const google::protobuf::Struct& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto*                       db = db_->Handle();

  ScopedTransaction tx(db);
  if (tx.begin_rc() != SQLITE_OK) return Translate(db, tx.begin_rc());

  Result found;
  auto   record = SelectLocked(collection, id, found);
  if (!record) return found;

  MergeFields(record->fields, fields);

  std::string json;
  if (auto r = ToJson(record->fields, json); !r) {
    return r;
  }

  Statement stmt(db, "UPDATE document SET fields_json=?,updated_at_ms=? WHERE collection=? AND id=?;");
  if (stmt.prepare_rc() != SQLITE_OK) return Translate(db, stmt.prepare_rc());

  stmt.BindText(1, json);
  stmt.BindU64(2, util::ToUnixMillis(util::Now()));
  stmt.BindText(3, collection);
  stmt.BindText(4, id);

  if (auto r = Translate(db, stmt.Step()); !r) {
    return r;
  }
  return Translate(db, tx.Commit());
}

std::optional<model::DocumentRecord> SqliteDocumentStore::GetRecord(const std::string& collection, const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  Result result;
  auto   record = SelectLocked(collection, id, result);
  if (!record && result.code != ErrorCode::NotFound) {
    MEDIAFLOW_LOG_WARN("sqlite read failed", {observability::StringField("collection", collection), observability::StringField("id", id),
                                              observability::StringField("error", result.message)});
  }
  return record;
}

std::vector<model::DocumentRecord> SqliteDocumentStore::ListRecords(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto*                       db = db_->Handle();

  std::vector<model::DocumentRecord> out;

  Statement stmt(db, "SELECT id,fields_json,created_at_ms,updated_at_ms FROM document WHERE collection=? ORDER BY id;");
  if (stmt.prepare_rc() != SQLITE_OK) {
    MEDIAFLOW_LOG_WARN("sqlite list failed", {observability::StringField("error", sqlite3_errmsg(db))});
    return out;
  }
  stmt.BindText(1, collection);

  int rc = SQLITE_ROW;
  while ((rc = stmt.Step()) == SQLITE_ROW) {
    model::DocumentRecord record;
    record.collection    = collection;
    record.id            = stmt.ColumnText(0);
    record.created_at_ms = stmt.ColumnU64(2);
    record.updated_at_ms = stmt.ColumnU64(3);
    if (auto r = FromJson(stmt.ColumnText(1), record.fields); !r) {
      MEDIAFLOW_LOG_WARN("skipping unreadable document", {observability::StringField("id", record.id), observability::StringField("error", r.message)});
      continue;
    }
    out.push_back(std::move(record));
  }
  if (rc != SQLITE_DONE) {
    MEDIAFLOW_LOG_WARN("sqlite list interrupted", {observability::StringField("collection", collection),
                                                   observability::StringField("error", Translate(db, rc).message)});
  }
  return out;
}

} // namespace mediaflow::db::sqlite
