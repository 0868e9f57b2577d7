#include "client/cpp/upload_client.h"

#include <arrow/io/file.h>
#include <arrow/status.h>
#include <grpcpp/client_context.h>

#include <string_view>

namespace mediaflow::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return arrow::Status::CapacityError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

std::string Basename(const std::string& path) {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

UploadClient::UploadClient(std::shared_ptr<grpc::Channel> channel)
    : queue_stub_(mediaflow::uploader::v1::UploadQueueService::NewStub(channel)),
      admin_stub_(mediaflow::uploader::v1::TransferAdminService::NewStub(channel)) {
}

arrow::Result<std::string> UploadClient::Submit(const Submission& submission, const std::shared_ptr<arrow::Buffer>& data) const {
  if (!data || data->size() == 0) {
    return arrow::Status::Invalid("submit: data must not be empty");
  }

  mediaflow::uploader::v1::SubmitRequest request;
  request.set_owner_id(submission.owner_id);
  request.set_caption(submission.caption);
  request.set_content_type(submission.content_type);
  request.set_filename(submission.filename);
  request.set_media_kind(submission.media_kind);
  request.set_data(data->ToString());

  grpc::ClientContext                     context;
  mediaflow::uploader::v1::SubmitResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(queue_stub_->Submit(&context, request, &response), "Submit"));
  return response.task_id();
}

arrow::Result<std::string> UploadClient::SubmitFile(Submission submission, const std::string& path) const {
  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  ARROW_ASSIGN_OR_RAISE(auto data, file->Read(size));
  ARROW_RETURN_NOT_OK(file->Close());

  if (submission.filename.empty()) {
    submission.filename = Basename(path);
  }
  return Submit(submission, data);
}

arrow::Status UploadClient::Retry(const std::string& task_id) const {
  mediaflow::uploader::v1::RetryRequest request;
  request.set_task_id(task_id);

  grpc::ClientContext     context;
  google::protobuf::Empty response;
  return GrpcToArrow(queue_stub_->Retry(&context, request, &response), "Retry");
}

arrow::Result<bool> UploadClient::Cancel(const std::string& task_id) const {
  mediaflow::uploader::v1::CancelRequest request;
  request.set_task_id(task_id);

  grpc::ClientContext                     context;
  mediaflow::uploader::v1::CancelResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(queue_stub_->Cancel(&context, request, &response), "Cancel"));
  return response.cancelled();
}

arrow::Result<mediaflow::uploader::v1::QueueStatus> UploadClient::GetQueueStatus() const {
  grpc::ClientContext                  context;
  google::protobuf::Empty              request;
  mediaflow::uploader::v1::QueueStatus response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(queue_stub_->GetQueueStatus(&context, request, &response), "GetQueueStatus"));
  return response;
}

std::unique_ptr<grpc::ClientReader<mediaflow::uploader::v1::TaskSnapshot>> UploadClient::WatchTasks(grpc::ClientContext* context) const {
  return queue_stub_->WatchTasks(context, mediaflow::uploader::v1::WatchTasksRequest{});
}

arrow::Result<mediaflow::uploader::v1::UploadEstimate> UploadClient::EstimateUpload(uint64_t size_bytes) const {
  mediaflow::uploader::v1::EstimateUploadRequest request;
  request.set_size_bytes(size_bytes);

  grpc::ClientContext                     context;
  mediaflow::uploader::v1::UploadEstimate response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(queue_stub_->EstimateUpload(&context, request, &response), "EstimateUpload"));
  return response;
}

arrow::Result<uint64_t> UploadClient::GetActiveTransfers() const {
  grpc::ClientContext                              context;
  google::protobuf::Empty                          request;
  mediaflow::uploader::v1::ActiveTransfersResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetActiveTransfers(&context, request, &response), "GetActiveTransfers"));
  return response.active();
}

arrow::Result<uint64_t> UploadClient::CancelAllTransfers() const {
  grpc::ClientContext                                 context;
  google::protobuf::Empty                             request;
  mediaflow::uploader::v1::CancelAllTransfersResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->CancelAllTransfers(&context, request, &response), "CancelAllTransfers"));
  return response.cancelled();
}

arrow::Result<mediaflow::uploader::v1::NetworkStatus> UploadClient::GetNetworkStatus() const {
  grpc::ClientContext                    context;
  google::protobuf::Empty                request;
  mediaflow::uploader::v1::NetworkStatus response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->GetNetworkStatus(&context, request, &response), "GetNetworkStatus"));
  return response;
}

} // namespace mediaflow::client
