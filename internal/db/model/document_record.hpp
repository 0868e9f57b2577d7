#pragma once

#include <cstdint>
#include <string>

#include <google/protobuf/struct.pb.h>

namespace mediaflow::db::model {

/*
  One document: a bag of JSON-like fields addressed by (collection, id).
  Timestamps are unix milliseconds maintained by the store.
*/
struct DocumentRecord {
  std::string              collection;
  std::string              id;
  google::protobuf::Struct fields;
  std::uint64_t            created_at_ms = 0;
  std::uint64_t            updated_at_ms = 0;
};

} // namespace mediaflow::db::model
