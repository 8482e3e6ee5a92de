#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "memory/memory_object_store.hpp"
#include "object/arrow_object_store.hpp"

namespace vidpipe::storage {

ObjectStorePtr StorageFactory::Build(const vidpipe::runtime::config::StorageConfig& cfg) {
  if (cfg.object_root() == "mem://") {
    return std::make_shared<MemoryObjectStore>();
  }

  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg.object_root(), cfg.s3()));
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
}

} // namespace vidpipe::storage
