#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/api/result.hpp"
#include "internal/db/model/document_record.hpp"

namespace mediaflow::db {

/*
  Document store abstraction.

  The upload queue only needs create + merge-patch. Reads exist for
  operators and tests.

  GUARANTEES:

  - CreateRecord assigns an id when record.id is empty
  - PatchRecord merges top-level fields; absent keys are left untouched
  - Backend errors are translated into db::Result
*/

class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  virtual Result CreateRecord(model::DocumentRecord& record) = 0;

  virtual Result PatchRecord(const std::string& collection, const std::string& id, const google::protobuf::Struct& fields) = 0;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::optional<model::DocumentRecord> GetRecord(const std::string& collection, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::DocumentRecord> ListRecords(const std::string& collection) = 0;
};

using DocumentStorePtr = std::shared_ptr<DocumentStore>;

// Top-level merge used by every adapter.
inline void MergeFields(google::protobuf::Struct& target, const google::protobuf::Struct& patch) {
  for (const auto& [key, value] : patch.fields()) {
    (*target.mutable_fields())[key] = value;
  }
}

} // namespace mediaflow::db
