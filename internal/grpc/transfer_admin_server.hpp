#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/transfer_admin_service.hpp"
#include "mediaflow/uploader/v1.hpp"

namespace mediaflow::grpc {

class TransferAdminServer final : public mediaflow::uploader::v1::TransferAdminService::Service {
 public:
  explicit TransferAdminServer(std::shared_ptr<mediaflow::service::TransferAdminService> svc);

  ::grpc::Status GetActiveTransfers(::grpc::ServerContext*, const google::protobuf::Empty*,
                                    mediaflow::uploader::v1::ActiveTransfersResponse*) override;

  ::grpc::Status CancelAllTransfers(::grpc::ServerContext*, const google::protobuf::Empty*,
                                    mediaflow::uploader::v1::CancelAllTransfersResponse*) override;

  ::grpc::Status GetNetworkStatus(::grpc::ServerContext*, const google::protobuf::Empty*, mediaflow::uploader::v1::NetworkStatus*) override;

 private:
  std::shared_ptr<mediaflow::service::TransferAdminService> service_;
};

} // namespace mediaflow::grpc
