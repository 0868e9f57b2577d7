#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace mediaflow::storage {

/*
  Blob storage abstraction.

  The upload pipeline hands a buffer to Put() and observes the transfer
  through events. The backend owns the I/O threads; callers never block
  inside Put().

  Implementations:
    ARROW  → arrow::fs::FileSystem (local disk, S3 / MinIO, ...)
    tests  → scripted fakes
*/

enum class BlobErrorCode {
  kUnauthorized,
  kForbidden,
  kQuotaExceeded,
  kCanceled,
  kNetwork,
  kTimeout,
  kUnknown,
};

std::string_view ToString(BlobErrorCode code);

struct BlobError {
  BlobErrorCode code{BlobErrorCode::kUnknown};
  std::string   message;
};

/*
  Exactly one of on_error / on_complete fires per Put(), after zero or more
  on_progress calls. Events arrive on a backend thread and may arrive
  before Put() returns.
*/
struct TransferEvents {
  std::function<void(std::uint64_t transferred, std::uint64_t total)> on_progress;
  std::function<void(const BlobError& error)>                         on_error;
  std::function<void(const std::string& url)>                         on_complete;
};

class TransferHandle {
 public:
  virtual ~TransferHandle() = default;

  // ------------------------------------------------------------------
  // Cancel
  // ------------------------------------------------------------------
  /*
    Best effort. The backend stops at its next chunk boundary and reports
    on_error(kCanceled); a transfer that already finished is unaffected.
  */
  virtual void Cancel() = 0;
};

using TransferHandlePtr = std::shared_ptr<TransferHandle>;

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // ------------------------------------------------------------------
  // Put
  // ------------------------------------------------------------------
  /*
    Start streaming `bytes` to `path` (relative to the store root).
    on_complete receives the final addressable URL.
  */
  virtual TransferHandlePtr Put(const std::string& path, std::shared_ptr<arrow::Buffer> bytes, const std::string& content_type,
                                TransferEvents events) = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace mediaflow::storage
