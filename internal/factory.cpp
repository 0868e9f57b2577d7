#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/upload_tuning.hpp"
#include "internal/db/memory/memory_document_store.hpp"
#include "internal/grpc/transfer_admin_server.hpp"
#include "internal/grpc/upload_queue_server.hpp"
#include "internal/media/preview_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transfer_admin_service.hpp"
#include "internal/service/upload_queue_service.hpp"
#include "internal/storage/storage_factory.hpp"
#if MEDIAFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_store.hpp"
#endif

namespace mediaflow::factory {

namespace {

db::DocumentStorePtr BuildDocumentStore(const mediaflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MEDIAFLOW_DB_SQLITE
    db::sqlite::SqliteOptions options;
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    MEDIAFLOW_LOG_INFO("document store: sqlite", {observability::StringField("path", database.sqlite().path()),
                                                  observability::IntField("busy_timeout_ms", options.busy_timeout_ms)});
    return std::make_shared<db::sqlite::SqliteDocumentStore>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  MEDIAFLOW_LOG_INFO("document store: memory");
  return std::make_shared<db::memory::MemoryDocumentStore>();
}

} // namespace

void Application::Shutdown() {
  if (queue) queue->Stop();
  if (controller) controller->CancelAll();
}

/*
    Build full application dependency graph
*/
Application Build(const mediaflow::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.blob_store   = storage::StorageFactory::Build(config.storage());
  app.documents    = BuildDocumentStore(config);
  app.connectivity = network::StaticConnectivity::FromConfig(config.network());

  const auto preview_max_bytes = config.upload().queue().preview_max_bytes();
  auto       previews          = std::make_shared<media::InlinePreviewGenerator>(
      preview_max_bytes > 0 ? preview_max_bytes : media::InlinePreviewGenerator::kDefaultMaxBytes);

  // ------------------------------------------------------------------
  // Upload pipeline
  // ------------------------------------------------------------------
  app.controller = std::make_shared<upload::UploadController>(app.blob_store, app.connectivity, config::BuildControllerPolicy(config.upload()));
  app.queue      = std::make_shared<queue::UploadQueue>(app.controller, app.documents, std::move(previews),
                                                   config::BuildQueueOptions(config.upload().queue()));
  app.queue->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.controller   = app.controller;
  ctx.queue        = app.queue;
  ctx.connectivity = app.connectivity;

  auto queue_service = std::make_shared<service::UploadQueueService>(ctx);
  auto admin_service = std::make_shared<service::TransferAdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::UploadQueueServer>(queue_service));
  app.grpc_services.push_back(std::make_unique<grpc::TransferAdminServer>(admin_service));

  return app;
}

} // namespace mediaflow::factory
