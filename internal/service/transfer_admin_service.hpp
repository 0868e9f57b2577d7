#pragma once

#include "mediaflow/uploader/v1.hpp"
#include "service_context.hpp"

namespace mediaflow::service {

class TransferAdminService {
 public:
  explicit TransferAdminService(ServiceContext ctx);

  mediaflow::uploader::v1::ActiveTransfersResponse GetActiveTransfers();

  // Cancels every in-flight session on the controller. Affected queue
  // tasks end up failed and retryable.
  mediaflow::uploader::v1::CancelAllTransfersResponse CancelAllTransfers();

  mediaflow::uploader::v1::NetworkStatus GetNetworkStatus();

 private:
  ServiceContext ctx_;
};

} // namespace mediaflow::service
