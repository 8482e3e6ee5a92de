#include "object_store.hpp"

#include <arrow/io/file.h>

#include "internal/storage/common/arrow_utils.hpp"

namespace vidpipe::storage {

using common::Unwrap;

void ObjectStore::PutFile(const std::string& key, const std::filesystem::path& source) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(source.string()));
  Put(key, common::ReadAll(file));
  Unwrap(file->Close());
}

void ObjectStore::GetToFile(const std::string& key, const std::filesystem::path& target) {
  auto buffer = Get(key);

  if (target.has_parent_path()) std::filesystem::create_directories(target.parent_path());

  auto out = Unwrap(arrow::io::FileOutputStream::Open(target.string()));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

} // namespace vidpipe::storage
