#pragma once

#include "config/config.pb.h"
#include "internal/storage/blob_store.hpp"

namespace mediaflow::storage {

/*
  Builds the blob store from configuration.

      storage:
        root_uri: s3://media?endpoint_override=localhost:9000&scheme=http
        public_base_url: https://cdn.example.com
*/

class StorageFactory {
 public:
  static constexpr const char* kDefaultRootUri = "/tmp/mediaflow";

  static BlobStorePtr Build(const mediaflow::runtime::config::StorageConfig& cfg);
};

} // namespace mediaflow::storage
