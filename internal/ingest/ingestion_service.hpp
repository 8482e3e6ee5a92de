#pragma once

#include <arrow/buffer.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/video_status.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"
#include "staging_area.hpp"

namespace vidpipe::ingest {

struct IngestOptions {
  uint64_t                  max_upload_bytes = 500ull * 1024 * 1024;
  std::chrono::milliseconds upload_ttl{std::chrono::hours(24)};
  std::vector<std::string>  allowed_extensions;
  std::filesystem::path     staging_dir;

  static IngestOptions FromConfig(const vidpipe::runtime::config::RuntimeConfig& config);
};

struct UploadState {
  std::string upload_id;
  uint64_t    confirmed_offset = 0;
  uint64_t    declared_size    = 0;
  uint64_t    expires_at_ms    = 0;
  std::string video_id; // set once complete
};

struct AppendResult {
  uint64_t            confirmed_offset = 0;
  bool                completed        = false;
  std::string         video_id;
  model::VideoStatus  status = model::VideoStatus::kPending;
};

struct IngestResult {
  std::string        video_id;
  model::VideoStatus status = model::VideoStatus::kPending;
};

// Server side of the upload protocol. A finished upload becomes a pending video and its job in one transaction.
class IngestionService {
 public:
  IngestionService(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects,
                   std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<util::ClockSource> clock, IngestOptions options);

  UploadState CreateUpload(const std::string& upload_id, const std::string& owner_id, const std::string& filename,
                           uint64_t declared_size);

  UploadState QueryOffset(const std::string& upload_id);

  AppendResult AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data);

  void CancelUpload(const std::string& upload_id);

  IngestResult UploadVideo(const std::string& owner_id, const std::string& filename, uint64_t declared_size,
                           const std::shared_ptr<arrow::Buffer>& data);

  // Deletes expired, unfinished sessions and their staging files.
  size_t SweepExpiredUploads();

 private:
  void ValidateRequest(const std::string& owner_id, const std::string& filename, uint64_t declared_size) const;

  // object already stored under source_key; creates video + job (+ session update) atomically
  IngestResult Register(const std::string& owner_id, const std::string& filename, uint64_t size_bytes,
                        const std::string& video_id, const std::string& source_key, const std::string& upload_id);

  AppendResult Complete(const db::model::UploadRecord& upload);

  std::mutex& LockFor(const std::string& upload_id);

  std::shared_ptr<db::Repository>    repository_;
  storage::ObjectStorePtr            objects_;
  std::shared_ptr<queue::JobQueue>   queue_;
  std::shared_ptr<util::ClockSource> clock_;
  IngestOptions                      options_;
  StagingArea                        staging_;

  std::array<std::mutex, 32> upload_locks_;
};

} // namespace vidpipe::ingest
