#include "arrow_blob_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <algorithm>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace mediaflow::storage {

using namespace mediaflow::storage::common;

class ArrowBlobStore::Transfer final : public TransferHandle {
 public:
  void Cancel() override {
    cancelled_.store(true);
  }

  bool cancelled() const {
    return cancelled_.load();
  }

 private:
  std::atomic<bool> cancelled_{false};
};

ArrowBlobStore::ArrowBlobStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path, std::string public_base_url,
                               std::uint64_t chunk_size)
    : fs_(std::move(fs)), root_path_(std::move(root_path)), public_base_url_(std::move(public_base_url)), chunk_size_(chunk_size) {
  if (!fs_) {
    throw std::invalid_argument("ArrowBlobStore requires a filesystem");
  }
  if (chunk_size_ == 0) {
    chunk_size_ = kDefaultChunkSize;
  }
  while (!public_base_url_.empty() && public_base_url_.back() == '/') {
    public_base_url_.pop_back();
  }
}

ArrowBlobStore::~ArrowBlobStore() {
  std::vector<Worker> workers;
  {
    std::lock_guard lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (auto transfer = worker.transfer.lock()) {
      transfer->Cancel();
    }
  }
  for (auto& worker : workers) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

/*
  Public address layout:

      <public_base_url>/<key>        when configured
      <fs type>://<root>/<key>       otherwise (file:///..., s3://...)
*/
std::string ArrowBlobStore::PublicUrl(const std::string& key) const {
  if (!public_base_url_.empty()) {
    return public_base_url_ + "/" + key;
  }
  auto full_path = JoinPath(root_path_, key);
  auto scheme    = fs_->type_name();
  if (scheme == "local") {
    scheme = "file";
  }
  if (!full_path.empty() && full_path.front() == '/') {
    return scheme + "://" + full_path;
  }
  return scheme + ":///" + full_path;
}

TransferHandlePtr ArrowBlobStore::Put(const std::string& path, std::shared_ptr<arrow::Buffer> bytes, const std::string& content_type,
                                      TransferEvents events) {
  ValidateObjectKey(path);
  if (!bytes) {
    throw std::invalid_argument("Put requires a buffer");
  }

  auto transfer = std::make_shared<Transfer>();
  auto done     = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard lock(workers_mutex_);
  ReapFinishedLocked();

  Worker worker;
  worker.done     = done;
  worker.transfer = transfer;
  worker.thread   = std::thread([this, transfer, path, bytes = std::move(bytes), content_type, events = std::move(events), done]() {
    Run(transfer, path, bytes, content_type, events);
    done->store(true);
  });
  workers_.push_back(std::move(worker));

  return transfer;
}

void ArrowBlobStore::ReapFinishedLocked() {
  auto it = workers_.begin();
  while (it != workers_.end()) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

/*
  Stream the buffer into <root>/<key> chunk by chunk.
*/
void ArrowBlobStore::Run(const std::shared_ptr<Transfer>& transfer, const std::string& key, const std::shared_ptr<arrow::Buffer>& bytes,
                         const std::string& content_type, const TransferEvents& events) const {
  const auto full_path = JoinPath(root_path_, key);
  const auto total     = static_cast<std::uint64_t>(bytes->size());

  auto fail = [&events](BlobErrorCode code, std::string message) {
    if (events.on_error) {
      events.on_error(BlobError{code, std::move(message)});
    }
  };

  auto fail_status = [&](const arrow::Status& status) {
    MEDIAFLOW_LOG_WARN("blob transfer failed", {observability::StringField("path", full_path), observability::StringField("status", status.ToString())});
    fail(ClassifyStatus(status), status.ToString());
  };

  auto discard_partial = [&]() {
    auto status = fs_->DeleteFile(full_path);
    if (!status.ok()) {
      MEDIAFLOW_LOG_WARN("failed to delete partial object",
                         {observability::StringField("path", full_path), observability::StringField("status", status.ToString())});
    }
  };

  try {
    const auto parent = ParentPath(full_path);
    if (!parent.empty()) {
      auto status = fs_->CreateDir(parent, /*recursive=*/true);
      if (!status.ok()) {
        fail_status(status);
        return;
      }
    }

    auto metadata = arrow::key_value_metadata({"Content-Type"}, {content_type.empty() ? "application/octet-stream" : content_type});

    auto out_result = fs_->OpenOutputStream(full_path, metadata);
    if (!out_result.ok()) {
      fail_status(out_result.status());
      return;
    }
    auto out = *out_result;

    std::uint64_t written = 0;
    while (written < total) {
      if (transfer->cancelled()) {
        auto status = out->Abort();
        if (!status.ok()) {
          MEDIAFLOW_LOG_WARN("abort of cancelled transfer failed", {observability::StringField("status", status.ToString())});
        }
        discard_partial();
        fail(BlobErrorCode::kCanceled, "transfer cancelled");
        return;
      }

      const auto chunk  = std::min<std::uint64_t>(chunk_size_, total - written);
      auto       status = out->Write(bytes->data() + written, static_cast<int64_t>(chunk));
      if (!status.ok()) {
        auto abort_status = out->Abort();
        if (!abort_status.ok()) {
          MEDIAFLOW_LOG_WARN("abort after write failure failed", {observability::StringField("status", abort_status.ToString())});
        }
        discard_partial();
        fail_status(status);
        return;
      }

      written += chunk;
      if (events.on_progress) {
        events.on_progress(written, total);
      }
    }

    if (transfer->cancelled()) {
      auto status = out->Abort();
      if (!status.ok()) {
        MEDIAFLOW_LOG_WARN("abort of cancelled transfer failed", {observability::StringField("status", status.ToString())});
      }
      discard_partial();
      fail(BlobErrorCode::kCanceled, "transfer cancelled");
      return;
    }

    auto status = out->Close();
    if (!status.ok()) {
      discard_partial();
      fail_status(status);
      return;
    }
  } catch (const std::exception& e) {
    MEDIAFLOW_LOG_ERROR("blob transfer raised", {observability::StringField("path", full_path), observability::StringField("error", e.what())});
    fail(BlobErrorCode::kUnknown, e.what());
    return;
  }

  if (events.on_complete) {
    events.on_complete(PublicUrl(key));
  }
}

} // namespace mediaflow::storage
