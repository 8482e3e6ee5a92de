#include "staging_area.hpp"

#include <arrow/io/file.h>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/object_keys.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::ingest {

using storage::common::Unwrap;

StagingArea::StagingArea(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path StagingArea::PathFor(const std::string& upload_id) const {
  storage::keys::ValidateSegment(upload_id, "upload id");
  return root_ / (upload_id + ".part");
}

std::filesystem::path StagingArea::Create(const std::string& upload_id) {
  auto path = PathFor(upload_id);
  auto out  = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/false));
  Unwrap(out->Close());
  return path;
}

uint64_t StagingArea::Append(const std::filesystem::path& path, uint64_t offset, std::string_view data) {
  std::error_code ec;
  auto            current = std::filesystem::file_size(path, ec);
  if (ec) {
    throw util::TransientIo("staging file unavailable: " + path.string() + ": " + ec.message());
  }

  if (current < offset) {
    throw util::DataIntegrity("staging file shorter than confirmed offset: " + path.string());
  }
  if (current > offset) {
    // tail of an append that was never confirmed
    std::filesystem::resize_file(path, offset);
  }

  auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string(), /*append=*/true));
  Unwrap(out->Write(data.data(), static_cast<int64_t>(data.size())));
  Unwrap(out->Flush());
  Unwrap(out->Close());

  return offset + data.size();
}

std::string StagingArea::ReadHeader(const std::filesystem::path& path, size_t n) const {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = Unwrap(file->ReadAt(0, static_cast<int64_t>(n)));
  Unwrap(file->Close());
  return buffer->ToString();
}

uint64_t StagingArea::Size(const std::filesystem::path& path) const {
  return std::filesystem::file_size(path);
}

void StagingArea::Remove(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    VIDPIPE_LOG_WARN("failed to remove staging file",
                     {observability::StringField("path", path.string()), observability::StringField("error", ec.message())});
  }
}

} // namespace vidpipe::ingest
