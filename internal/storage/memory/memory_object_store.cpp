#include "memory_object_store.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace vidpipe::storage {

void MemoryObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  std::unique_lock lock(mutex_);
  objects_[key] = buffer;
}

std::shared_ptr<arrow::Buffer> MemoryObjectStore::Get(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = objects_.find(key);
  if (it == objects_.end()) throw util::NotFound("object not found: " + key);

  return it->second;
}

bool MemoryObjectStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return objects_.contains(key);
}

uint64_t MemoryObjectStore::Size(const std::string& key) {
  return static_cast<uint64_t>(Get(key)->size());
}

void MemoryObjectStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  objects_.erase(key);
}

size_t MemoryObjectStore::ObjectCount() const {
  std::shared_lock lock(mutex_);
  return objects_.size();
}

} // namespace vidpipe::storage
