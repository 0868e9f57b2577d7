#include "upload_queue_server.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace mediaflow::grpc {

using namespace mediaflow::uploader::v1;

namespace {

/*
  Holds only the newest snapshot. Queue deliveries never wait on a slow
  stream; intermediate snapshots are superseded.
*/
class SnapshotMailbox {
 public:
  void Post(const TaskSnapshot& snapshot) {
    {
      std::lock_guard lock(mutex_);
      latest_ = snapshot;
    }
    cv_.notify_one();
  }

  std::optional<TaskSnapshot> Take(std::chrono::milliseconds wait) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, wait, [&] { return latest_.has_value(); });
    std::optional<TaskSnapshot> out;
    out.swap(latest_);
    return out;
  }

 private:
  std::mutex                  mutex_;
  std::condition_variable     cv_;
  std::optional<TaskSnapshot> latest_;
};

constexpr std::chrono::milliseconds kCancelPollInterval{250};

} // namespace

UploadQueueServer::UploadQueueServer(std::shared_ptr<mediaflow::service::UploadQueueService> svc) : service_(std::move(svc)) {
}

::grpc::Status UploadQueueServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadQueueServer::Retry(::grpc::ServerContext*, const RetryRequest* req, google::protobuf::Empty*) {
  try {
    service_->Retry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadQueueServer::Cancel(::grpc::ServerContext*, const CancelRequest* req, CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadQueueServer::GetQueueStatus(::grpc::ServerContext*, const google::protobuf::Empty*, QueueStatus* resp) {
  try {
    *resp = service_->GetQueueStatus();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadQueueServer::WatchTasks(::grpc::ServerContext* ctx, const WatchTasksRequest*, ::grpc::ServerWriter<TaskSnapshot>* writer) {
  auto mailbox = std::make_shared<SnapshotMailbox>();

  mediaflow::service::UploadQueueService::Unsubscribe unsubscribe;
  try {
    unsubscribe = service_->Watch([mailbox](const TaskSnapshot& snapshot) { mailbox->Post(snapshot); });
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!ctx->IsCancelled()) {
    auto snapshot = mailbox->Take(kCancelPollInterval);
    if (!snapshot) continue;
    if (!writer->Write(*snapshot)) {
      MEDIAFLOW_LOG_DEBUG("task watcher went away");
      break;
    }
  }

  unsubscribe();
  return ::grpc::Status::OK;
}

::grpc::Status UploadQueueServer::EstimateUpload(::grpc::ServerContext*, const EstimateUploadRequest* req, UploadEstimate* resp) {
  try {
    *resp = service_->EstimateUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mediaflow::grpc
