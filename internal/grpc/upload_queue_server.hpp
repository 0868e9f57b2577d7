#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/upload_queue_service.hpp"
#include "mediaflow/uploader/v1.hpp"

namespace mediaflow::grpc {

class UploadQueueServer final : public mediaflow::uploader::v1::UploadQueueService::Service {
 public:
  explicit UploadQueueServer(std::shared_ptr<mediaflow::service::UploadQueueService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const mediaflow::uploader::v1::SubmitRequest*,
                        mediaflow::uploader::v1::SubmitResponse*) override;

  ::grpc::Status Retry(::grpc::ServerContext*, const mediaflow::uploader::v1::RetryRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const mediaflow::uploader::v1::CancelRequest*,
                        mediaflow::uploader::v1::CancelResponse*) override;

  ::grpc::Status GetQueueStatus(::grpc::ServerContext*, const google::protobuf::Empty*, mediaflow::uploader::v1::QueueStatus*) override;

  ::grpc::Status WatchTasks(::grpc::ServerContext*, const mediaflow::uploader::v1::WatchTasksRequest*,
                            ::grpc::ServerWriter<mediaflow::uploader::v1::TaskSnapshot>*) override;

  ::grpc::Status EstimateUpload(::grpc::ServerContext*, const mediaflow::uploader::v1::EstimateUploadRequest*,
                                mediaflow::uploader::v1::UploadEstimate*) override;

 private:
  std::shared_ptr<mediaflow::service::UploadQueueService> service_;
};

} // namespace mediaflow::grpc
