#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace vidpipe::storage {

/*
  Object store over an Arrow filesystem (local directory or S3).

  Characteristics:
    - whole-object writes
    - parent "directories" created on demand (no-op on S3)
    - no fsync semantics
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  void Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) override;
  std::shared_ptr<arrow::Buffer> Get(const std::string& key) override;
  bool Exists(const std::string& key) override;
  uint64_t Size(const std::string& key) override;
  void Remove(const std::string& key) override;

  void PutFile(const std::string& key, const std::filesystem::path& source) override;

 private:
  std::string ObjectPath(const std::string& key) const;
  arrow::fs::FileInfo Stat(const std::string& key);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace vidpipe::storage
