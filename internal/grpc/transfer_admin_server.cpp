#include "transfer_admin_server.hpp"

#include "grpc_error.hpp"

namespace mediaflow::grpc {

using namespace mediaflow::uploader::v1;

TransferAdminServer::TransferAdminServer(std::shared_ptr<mediaflow::service::TransferAdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status TransferAdminServer::GetActiveTransfers(::grpc::ServerContext*, const google::protobuf::Empty*, ActiveTransfersResponse* resp) {
  try {
    *resp = service_->GetActiveTransfers();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferAdminServer::CancelAllTransfers(::grpc::ServerContext*, const google::protobuf::Empty*,
                                                       CancelAllTransfersResponse* resp) {
  try {
    *resp = service_->CancelAllTransfers();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferAdminServer::GetNetworkStatus(::grpc::ServerContext*, const google::protobuf::Empty*, NetworkStatus* resp) {
  try {
    *resp = service_->GetNetworkStatus();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace mediaflow::grpc
