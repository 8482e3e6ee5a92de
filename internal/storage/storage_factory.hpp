#pragma once

#include "config/config.pb.h"
#include "object_store.hpp"

namespace vidpipe::storage {

/*
  Builds the object store from configuration.

      object_root: mem://             MemoryObjectStore
      object_root: /srv/objects       ArrowObjectStore (local)
      object_root: s3://bucket/pfx    ArrowObjectStore (S3)
*/
class StorageFactory {
 public:
  static ObjectStorePtr Build(const vidpipe::runtime::config::StorageConfig& cfg);
};

} // namespace vidpipe::storage
