#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace vidpipe::storage {

/*
  Blob store abstraction.

  Keys are '/'-separated object keys (see object_keys.hpp). The store is
  trusted for durability; the pipeline only relies on key/value
  semantics:

    Put        overwrites atomically per key
    Get        returns the full object, util::NotFound if absent
    Remove     is a no-op for missing keys

  Implementations:
    ArrowObjectStore   local directory or S3 through arrow::fs
    MemoryObjectStore  tests and ephemeral deployments
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) = 0;

  virtual std::shared_ptr<arrow::Buffer> Get(const std::string& key) = 0;

  virtual bool Exists(const std::string& key) = 0;

  virtual uint64_t Size(const std::string& key) = 0;

  virtual void Remove(const std::string& key) = 0;

  // Stream a local file into the store.
  virtual void PutFile(const std::string& key, const std::filesystem::path& source);

  // Download an object into a local file, replacing it.
  virtual void GetToFile(const std::string& key, const std::filesystem::path& target);
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace vidpipe::storage
