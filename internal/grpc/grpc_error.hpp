#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace mediaflow::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace mediaflow::grpc
