#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/document_store.hpp"
#include "internal/network/connectivity.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/upload/upload_controller.hpp"

namespace mediaflow::factory {

/*
  Application

  Everything the uploader process owns. The queue is started by Build()
  and must be stopped before the controller and stores go away; Shutdown()
  does that in order.
*/
struct Application {
  storage::BlobStorePtr                         blob_store;
  db::DocumentStorePtr                          documents;
  std::shared_ptr<network::StaticConnectivity>  connectivity;
  std::shared_ptr<upload::UploadController>     controller;
  std::shared_ptr<queue::UploadQueue>           queue;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  void Shutdown();
};

/*
  Build

  Composition root. The only place that knows concrete storage and
  document-store types.
*/
Application Build(const mediaflow::runtime::config::RuntimeConfig& config);

} // namespace mediaflow::factory
