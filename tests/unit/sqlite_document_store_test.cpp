#include <cassert>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_store.hpp"
#include "tests/unit/document_store_contract.hpp"

namespace {

using namespace mediaflow;

void TestContractInMemory() {
  db::sqlite::SqliteDocumentStore store(std::make_shared<db::sqlite::SqliteDB>(":memory:"));
  testing::RunDocumentStoreContract(store);
}

void TestRecordsSurviveReopen() {
  const auto path = (std::filesystem::temp_directory_path() / "mediaflow_sqlite_document_store_test.db").string();
  std::filesystem::remove(path);

  std::string id;
  {
    db::sqlite::SqliteDocumentStore store(std::make_shared<db::sqlite::SqliteDB>(path));
    db::model::DocumentRecord       record;
    record.collection = "posts";
    record.fields     = testing::Fields({{"caption", "hello"}});
    assert(store.CreateRecord(record));
    id = record.id;
  }

  db::sqlite::SqliteDocumentStore reopened(std::make_shared<db::sqlite::SqliteDB>(path));
  auto                            record = reopened.GetRecord("posts", id);
  assert(record);
  assert(record->fields.fields().at("caption").string_value() == "hello");

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

void TestSchemaMigratesOnce() {
  auto db = std::make_shared<db::sqlite::SqliteDB>(":memory:");
  assert(db->UserVersion() == 0);

  db::sqlite::SqliteDocumentStore first(db);
  assert(db->UserVersion() == 2);

  // Already current: nothing reruns and existing rows stay.
  db::model::DocumentRecord record;
  record.collection = "posts";
  assert(first.CreateRecord(record));
  db::sqlite::SqliteDocumentStore second(db);
  assert(db->UserVersion() == 2);
  assert(second.GetRecord("posts", record.id));
}

void TestNewerSchemaRejected() {
  auto db = std::make_shared<db::sqlite::SqliteDB>(":memory:", db::sqlite::SqliteOptions{.busy_timeout_ms = 100});
  db->Exec("PRAGMA user_version=9;");

  bool threw = false;
  try {
    db::sqlite::SqliteDocumentStore store(db);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestNullDatabaseRejected() {
  bool threw = false;
  try {
    db::sqlite::SqliteDocumentStore store(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestContractInMemory();
  TestRecordsSurviveReopen();
  TestSchemaMigratesOnce();
  TestNewerSchemaRejected();
  TestNullDatabaseRejected();

  std::cout << "mediaflow_unit_sqlite_document_store: pass\n";
  return 0;
}
