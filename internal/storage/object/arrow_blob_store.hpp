#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include "internal/storage/blob_store.hpp"

namespace mediaflow::storage {

/*
  Blob store on top of an Arrow filesystem (local disk, S3 / MinIO).

  Characteristics:
    - one backend thread per transfer, owned by the store
    - writes in fixed-size chunks, one progress event per chunk
    - cancellation observed between chunks; partial objects are deleted
    - final URL = public_base_url + "/" + key, or <scheme>://<path>
*/

class ArrowBlobStore final : public BlobStore {
 public:
  static constexpr std::uint64_t kDefaultChunkSize = 256 * 1024;

  ArrowBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string public_base_url,
                 std::uint64_t chunk_size = kDefaultChunkSize);
  ~ArrowBlobStore() override;

  ArrowBlobStore(const ArrowBlobStore&)            = delete;
  ArrowBlobStore& operator=(const ArrowBlobStore&) = delete;

  TransferHandlePtr Put(const std::string& path, std::shared_ptr<arrow::Buffer> bytes, const std::string& content_type,
                        TransferEvents events) override;

  std::string PublicUrl(const std::string& key) const;

 private:
  class Transfer;

  struct Worker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
    std::weak_ptr<Transfer>            transfer;
  };

  void Run(const std::shared_ptr<Transfer>& transfer, const std::string& key, const std::shared_ptr<arrow::Buffer>& bytes,
           const std::string& content_type, const TransferEvents& events) const;

  void ReapFinishedLocked();

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            public_base_url_;
  std::uint64_t                          chunk_size_;

  std::mutex          workers_mutex_;
  std::vector<Worker> workers_;
};

} // namespace mediaflow::storage
