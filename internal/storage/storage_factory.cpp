#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "object/arrow_blob_store.hpp"

namespace mediaflow::storage {

BlobStorePtr StorageFactory::Build(const mediaflow::runtime::config::StorageConfig& cfg) {
  const std::string root_uri = cfg.root_uri().empty() ? std::string{kDefaultRootUri} : cfg.root_uri();

  auto [fs, root_path] = common::Unwrap(common::ResolveFileSystem(root_uri));

  MEDIAFLOW_LOG_INFO("blob store ready", {observability::StringField("filesystem", fs->type_name()), observability::StringField("root", root_path)});

  return std::make_shared<ArrowBlobStore>(std::move(fs), std::move(root_path), cfg.public_base_url(), cfg.chunk_size_bytes());
}

} // namespace mediaflow::storage
