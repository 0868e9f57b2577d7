#include "upload_queue_service.hpp"

#include <arrow/buffer.h>

#include <stdexcept>

#include "internal/network/connectivity.hpp"
#include "internal/queue/upload_queue.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace mediaflow::service {

using namespace mediaflow::uploader::v1;

UploadQueueService::UploadQueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse UploadQueueService::Submit(const SubmitRequest& req) {
  return ObserveRpc("UploadQueueService.Submit", [&] {
    if (req.data().empty()) {
      throw std::invalid_argument("submit: data must not be empty");
    }

    model::MediaPayload payload;
    payload.bytes        = arrow::Buffer::FromString(req.data());
    payload.content_type = req.content_type().empty() ? "application/octet-stream" : req.content_type();
    payload.filename     = req.filename();

    SubmitResponse resp;
    resp.set_task_id(ctx_.queue->Submit(req.owner_id(), payload, req.caption(), FromProto(req.media_kind())));
    return resp;
  });
}

void UploadQueueService::Retry(const RetryRequest& req) {
  ObserveRpc("UploadQueueService.Retry", [&] { ctx_.queue->Retry(req.task_id()); });
}

CancelResponse UploadQueueService::Cancel(const CancelRequest& req) {
  return ObserveRpc("UploadQueueService.Cancel", [&] {
    CancelResponse resp;
    resp.set_cancelled(ctx_.queue->Cancel(req.task_id()));
    return resp;
  });
}

QueueStatus UploadQueueService::GetQueueStatus() {
  return ObserveRpc("UploadQueueService.GetQueueStatus", [&] { return ToProto(ctx_.queue->Status()); });
}

UploadQueueService::Unsubscribe UploadQueueService::Watch(SnapshotListener listener) {
  return ObserveRpc("UploadQueueService.WatchTasks", [&] {
    return ctx_.queue->Subscribe([listener = std::move(listener)](const queue::TaskSnapshot& snapshot) { listener(ToProto(snapshot)); });
  });
}

UploadEstimate UploadQueueService::EstimateUpload(const EstimateUploadRequest& req) {
  return ObserveRpc("UploadQueueService.EstimateUpload",
                    [&] { return ToProto(network::EstimateUpload(req.size_bytes(), ctx_.connectivity->Sample())); });
}

} // namespace mediaflow::service
