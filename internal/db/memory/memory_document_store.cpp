#include "memory_document_store.hpp"

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace mediaflow::db::memory {

Result MemoryDocumentStore::CreateRecord(model::DocumentRecord& record) {
  if (record.collection.empty()) {
    return Result::Err(ErrorCode::InvalidArgument, "collection must not be empty");
  }
  if (record.id.empty()) {
    record.id = util::GenerateId();
  }

  const auto now       = util::ToUnixMillis(util::Now());
  record.created_at_ms = now;
  record.updated_at_ms = now;

  std::lock_guard<std::mutex> lock(mutex_);
  auto& collection = collections_[record.collection];
  if (!collection.emplace(record.id, record).second) {
    return Result::Err(ErrorCode::AlreadyExists, record.collection + "/" + record.id);
  }
  return Result::Ok();
}

Result MemoryDocumentStore::PatchRecord(const std::string& collection, const std::string& id, const google::protobuf::Struct& fields) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto c = collections_.find(collection);
  if (c == collections_.end()) {
    return Result::Err(ErrorCode::NotFound, collection + "/" + id);
  }
  auto it = c->second.find(id);
  if (it == c->second.end()) {
    return Result::Err(ErrorCode::NotFound, collection + "/" + id);
  }

  MergeFields(it->second.fields, fields);
  it->second.updated_at_ms = util::ToUnixMillis(util::Now());
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryDocumentStore::GetRecord(const std::string& collection, const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto c = collections_.find(collection);
  if (c == collections_.end()) {
    return std::nullopt;
  }
  auto it = c->second.find(id);
  if (it == c->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::DocumentRecord> MemoryDocumentStore::ListRecords(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<model::DocumentRecord> out;
  auto                               c = collections_.find(collection);
  if (c == collections_.end()) {
    return out;
  }
  out.reserve(c->second.size());
  for (const auto& [id, record] : c->second) {
    out.push_back(record);
  }
  return out;
}

} // namespace mediaflow::db::memory
