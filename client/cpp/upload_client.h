#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <grpcpp/channel.h>
#include <grpcpp/support/sync_stream.h>

#include <cstdint>
#include <memory>
#include <string>

#include "mediaflow/uploader/v1.hpp"

namespace mediaflow::client {

/*
  Blocking client for the uploader service. Every call maps a non-OK gRPC
  status onto an arrow::Status carrying the server's message.
*/
class UploadClient {
 public:
  struct Submission {
    std::string                        owner_id;
    std::string                        caption;
    std::string                        content_type;
    std::string                        filename;
    mediaflow::uploader::v1::MediaKind media_kind = mediaflow::uploader::v1::MEDIA_KIND_IMAGE;
  };

  explicit UploadClient(std::shared_ptr<grpc::Channel> channel);

  // Returns the task id.
  arrow::Result<std::string> Submit(const Submission& submission, const std::shared_ptr<arrow::Buffer>& data) const;

  // Reads the file through arrow::io and submits it. An empty filename
  // in `submission` is replaced by the path's basename.
  arrow::Result<std::string> SubmitFile(Submission submission, const std::string& path) const;

  arrow::Status Retry(const std::string& task_id) const;

  arrow::Result<bool> Cancel(const std::string& task_id) const;

  arrow::Result<mediaflow::uploader::v1::QueueStatus> GetQueueStatus() const;

  std::unique_ptr<grpc::ClientReader<mediaflow::uploader::v1::TaskSnapshot>> WatchTasks(grpc::ClientContext* context) const;

  arrow::Result<mediaflow::uploader::v1::UploadEstimate> EstimateUpload(uint64_t size_bytes) const;

  arrow::Result<uint64_t> GetActiveTransfers() const;

  arrow::Result<uint64_t> CancelAllTransfers() const;

  arrow::Result<mediaflow::uploader::v1::NetworkStatus> GetNetworkStatus() const;

 private:
  std::unique_ptr<mediaflow::uploader::v1::UploadQueueService::Stub>   queue_stub_;
  std::unique_ptr<mediaflow::uploader::v1::TransferAdminService::Stub> admin_stub_;
};

} // namespace mediaflow::client
