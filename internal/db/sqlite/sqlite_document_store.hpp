#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>

#include "internal/db/api/document_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace mediaflow::db::sqlite {

/*
  Documents stored as JSON text:

      document(collection, id, fields_json, created_at_ms, updated_at_ms)

  Patches run read-merge-write inside one IMMEDIATE transaction.
*/
class SqliteDocumentStore final : public db::DocumentStore {
 public:
  explicit SqliteDocumentStore(std::shared_ptr<SqliteDB> db);

  Result CreateRecord(model::DocumentRecord& record) override;
  Result PatchRecord(const std::string& collection, const std::string& id, const google::protobuf::Struct& fields) override;

  std::optional<model::DocumentRecord> GetRecord(const std::string& collection, const std::string& id) override;
  std::vector<model::DocumentRecord>   ListRecords(const std::string& collection) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::optional<model::DocumentRecord> SelectLocked(const std::string& collection, const std::string& id, Result& result);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace mediaflow::db::sqlite
