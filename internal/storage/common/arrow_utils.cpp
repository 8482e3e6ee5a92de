#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

namespace vidpipe::storage::common {

namespace {

bool IsS3Uri(const std::string& root) {
  return root.rfind("s3://", 0) == 0;
}

arrow::Status EnsureS3Initialized() {
  if (arrow::fs::IsS3Initialized()) return arrow::Status::OK();
  return arrow::fs::InitializeS3(arrow::fs::S3GlobalOptions::Defaults());
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& root, const vidpipe::runtime::config::S3Options& s3_options) {
  std::string resolved_path = root;

  if (!IsS3Uri(root)) {
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(root, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  ARROW_RETURN_NOT_OK(EnsureS3Initialized());

  // bucket/prefix part of the URI
  ARROW_ASSIGN_OR_RAISE(auto options, arrow::fs::S3Options::FromUri(root, &resolved_path));
  if (!s3_options.region().empty()) options.region = s3_options.region();
  if (!s3_options.endpoint_override().empty()) options.endpoint_override = s3_options.endpoint_override();
  if (!s3_options.scheme().empty()) options.scheme = s3_options.scheme();
  if (!s3_options.access_key().empty()) {
    options.ConfigureAccessKey(s3_options.access_key(), s3_options.secret_key());
  }
  options.force_virtual_addressing = s3_options.force_virtual_addressing();

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), resolved_path);
}

} // namespace vidpipe::storage::common
