#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store.hpp"

namespace vidpipe::storage {

/*
  In-process object store keyed by object key. Objects are immutable
  Arrow buffers, so Get is zero-copy.
*/
class MemoryObjectStore final : public ObjectStore {
 public:
  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  bool Exists(const std::string& key) override;
  uint64_t Size(const std::string& key) override;
  void Remove(const std::string& key) override;

  size_t ObjectCount() const;

 private:
  mutable std::shared_mutex                                       mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> objects_;
};

} // namespace vidpipe::storage
