#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace vidpipe::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw.

  Storage failures surface as util::TransientIo so the worker pool
  retries them with backoff.
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::TransientIo(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::TransientIo(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->ReadAt(0, size));
}

/*
  Resolve the object root into a filesystem plus base path.

    /var/lib/vidpipe/objects    local filesystem
    file:///srv/objects         local filesystem
    s3://bucket/prefix          S3FileSystem built from S3Options
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& root, const vidpipe::runtime::config::S3Options& s3_options);

} // namespace vidpipe::storage::common
