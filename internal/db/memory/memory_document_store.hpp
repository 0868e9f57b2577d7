#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/document_store.hpp"

namespace mediaflow::db::memory {

class MemoryDocumentStore final : public db::DocumentStore {
 public:
  Result CreateRecord(model::DocumentRecord& record) override;
  Result PatchRecord(const std::string& collection, const std::string& id, const google::protobuf::Struct& fields) override;

  std::optional<model::DocumentRecord> GetRecord(const std::string& collection, const std::string& id) override;
  std::vector<model::DocumentRecord>   ListRecords(const std::string& collection) override;

 private:
  using Collection = std::map<std::string, model::DocumentRecord>;

  std::mutex                                  mutex_;
  std::unordered_map<std::string, Collection> collections_;
};

} // namespace mediaflow::db::memory
