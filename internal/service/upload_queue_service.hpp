#pragma once

#include <functional>

#include "mediaflow/uploader/v1.hpp"
#include "service_context.hpp"

namespace mediaflow::service {

class UploadQueueService {
 public:
  using SnapshotListener = std::function<void(const mediaflow::uploader::v1::TaskSnapshot&)>;
  using Unsubscribe      = std::function<void()>;

  explicit UploadQueueService(ServiceContext ctx);

  mediaflow::uploader::v1::SubmitResponse Submit(const mediaflow::uploader::v1::SubmitRequest& req);

  void Retry(const mediaflow::uploader::v1::RetryRequest& req);

  mediaflow::uploader::v1::CancelResponse Cancel(const mediaflow::uploader::v1::CancelRequest& req);

  mediaflow::uploader::v1::QueueStatus GetQueueStatus();

  // Current snapshot first, then one per queue transition.
  Unsubscribe Watch(SnapshotListener listener);

  mediaflow::uploader::v1::UploadEstimate EstimateUpload(const mediaflow::uploader::v1::EstimateUploadRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace mediaflow::service
