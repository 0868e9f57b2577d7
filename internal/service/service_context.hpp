#pragma once

#include <memory>

namespace mediaflow::upload {
class UploadController;
}
namespace mediaflow::queue {
class UploadQueue;
}
namespace mediaflow::network {
class ConnectivityMonitor;
}

namespace mediaflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<mediaflow::upload::UploadController>     controller;
  std::shared_ptr<mediaflow::queue::UploadQueue>           queue;
  std::shared_ptr<mediaflow::network::ConnectivityMonitor> connectivity;
};

} // namespace mediaflow::service
