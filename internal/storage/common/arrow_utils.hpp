#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/storage/blob_store.hpp"

namespace mediaflow::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Resolve a local path or filesystem URI (file://, s3://bucket/prefix?...)
  into a filesystem plus the root path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path);

/*
  Map an Arrow failure onto the blob error taxonomy. Arrow only carries
  text for remote errors, so this matches on the message.
*/
BlobErrorCode ClassifyStatus(const arrow::Status& status);

} // namespace mediaflow::storage::common
