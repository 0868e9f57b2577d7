#include "transfer_admin_service.hpp"

#include "internal/network/connectivity.hpp"
#include "internal/upload/upload_controller.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace mediaflow::service {

using namespace mediaflow::uploader::v1;

TransferAdminService::TransferAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ActiveTransfersResponse TransferAdminService::GetActiveTransfers() {
  return ObserveRpc("TransferAdminService.GetActiveTransfers", [&] {
    ActiveTransfersResponse resp;
    resp.set_active(ctx_.controller->ActiveCount());
    return resp;
  });
}

CancelAllTransfersResponse TransferAdminService::CancelAllTransfers() {
  return ObserveRpc("TransferAdminService.CancelAllTransfers", [&] {
    CancelAllTransfersResponse resp;
    resp.set_cancelled(ctx_.controller->CancelAll());
    MEDIAFLOW_LOG_WARN("all transfers cancelled by operator", {observability::IntField("cancelled", static_cast<std::int64_t>(resp.cancelled()))});
    return resp;
  });
}

NetworkStatus TransferAdminService::GetNetworkStatus() {
  return ObserveRpc("TransferAdminService.GetNetworkStatus", [&] { return ToProto(ctx_.connectivity->Sample()); });
}

} // namespace mediaflow::service
