#include "arrow_object_store.hpp"

#include <arrow/io/file.h>
#include <arrow/io/interfaces.h>


#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::storage {

using common::Unwrap;

namespace {

constexpr int64_t kCopyChunkBytes = 4 * 1024 * 1024;

std::string Parent(const std::string& path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? std::string{} : path.substr(0, pos);
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!root_path_.empty()) Unwrap(fs_->CreateDir(root_path_, true));
}

/*
  Object path layout:

      <root_path>/<key>
*/
std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  if (key.empty() || key.front() == '/') {
    throw std::invalid_argument("invalid object key: " + key);
  }
  if (root_path_.empty()) return key;
  if (root_path_.back() == '/') return root_path_ + key;
  return root_path_ + "/" + key;
}

arrow::fs::FileInfo ArrowObjectStore::Stat(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("object not found: " + key);
  }
  return info;
}

void ArrowObjectStore::Put(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto path   = ObjectPath(key);
  const auto parent = Parent(path);
  if (!parent.empty()) Unwrap(fs_->CreateDir(parent, true));

  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

/*
  Download full object
*/
std::shared_ptr<arrow::Buffer> ArrowObjectStore::Get(const std::string& key) {
  auto info  = Stat(key);
  auto input = Unwrap(fs_->OpenInputFile(info));
  return common::ReadAll(input);
}

bool ArrowObjectStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

uint64_t ArrowObjectStore::Size(const std::string& key) {
  return static_cast<uint64_t>(Stat(key).size());
}

void ArrowObjectStore::Remove(const std::string& key) {
  if (!Exists(key)) return;
  Unwrap(fs_->DeleteFile(ObjectPath(key)));
}

/*
  Stream in chunks instead of buffering whole renditions in memory.
*/
void ArrowObjectStore::PutFile(const std::string& key, const std::filesystem::path& source) {
  const auto path   = ObjectPath(key);
  const auto parent = Parent(path);
  if (!parent.empty()) Unwrap(fs_->CreateDir(parent, true));

  auto input = Unwrap(arrow::io::ReadableFile::Open(source.string()));
  auto out   = Unwrap(fs_->OpenOutputStream(path));

  for (;;) {
    auto chunk = Unwrap(input->Read(kCopyChunkBytes));
    if (chunk->size() == 0) break;
    Unwrap(out->Write(chunk));
  }

  Unwrap(out->Close());
  Unwrap(input->Close());
}

} // namespace vidpipe::storage
