#include "retention_sweeper.hpp"

#include <optional>
#include <set>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/model/video_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/object_keys.hpp"

namespace vidpipe::maintenance {

using observability::IntField;
using observability::StringField;

RetentionOptions RetentionOptions::FromConfig(const vidpipe::runtime::config::RuntimeConfig& config) {
  RetentionOptions options;
  options.enabled  = config.retention().enabled();
  options.max_age  = std::chrono::hours(24 * static_cast<int64_t>(config.retention().days()));
  options.interval = std::chrono::milliseconds(config.retention().sweep_interval_ms());
  return options;
}

RetentionSweeper::RetentionSweeper(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects,
                                   std::shared_ptr<ingest::IngestionService> ingestion,
                                   std::shared_ptr<util::ClockSource> clock, RetentionOptions options)
    : repository_(std::move(repository)), objects_(std::move(objects)), ingestion_(std::move(ingestion)),
      clock_(std::move(clock)), options_(options) {
}

RetentionSweeper::~RetentionSweeper() {
  Stop();
}

void RetentionSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RetentionSweeper::Loop, this);
}

void RetentionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RetentionSweeper::Loop() {
  while (running_) {
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      VIDPIPE_LOG_ERROR("retention sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.interval, [this] { return !running_.load(); });
  }
}

SweepReport RetentionSweeper::SweepOnce() {
  SweepReport report;
  report.uploads_expired = ingestion_->SweepExpiredUploads();

  if (!options_.enabled) return report;

  const uint64_t now    = clock_->NowMs();
  const uint64_t max_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.max_age).count());
  if (now < max_ms) return report;
  const uint64_t cutoff = now - max_ms;

  auto candidates = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ListVideosCreatedBefore(tx, cutoff);
  });

  for (const auto& candidate : candidates) {
    // row first: a video without a row is unreachable, objects without a row are only garbage
    auto deleted = db::RunInTransaction(*repository_, [&](db::Transaction& tx) -> std::optional<db::model::VideoRecord> {
      auto video = repository_->GetVideo(tx, candidate.video_id);
      if (!video || !model::IsTerminal(video->status)) return std::nullopt;
      db::ThrowIfError(repository_->DeleteVideo(tx, video->video_id), "delete expired video");
      return video;
    });
    if (!deleted) continue;

    report.videos_deleted++;
    report.objects_deleted += RemoveObjects(*deleted);
  }

  if (report.videos_deleted > 0 || report.uploads_expired > 0) {
    VIDPIPE_LOG_INFO("retention sweep", {IntField("videos_deleted", static_cast<int64_t>(report.videos_deleted)),
                                         IntField("objects_deleted", static_cast<int64_t>(report.objects_deleted)),
                                         IntField("uploads_expired", static_cast<int64_t>(report.uploads_expired))});
  }
  return report;
}

uint64_t RetentionSweeper::RemoveObjects(const db::model::VideoRecord& video) {
  std::set<std::string> keys;
  if (!video.source_object_key.empty()) keys.insert(video.source_object_key);
  for (const auto& rendition : video.manifest.renditions()) keys.insert(rendition.object_key());
  for (const auto& thumb : video.manifest.thumbnails()) keys.insert(thumb.object_key());
  if (!video.manifest.audio().object_key().empty()) keys.insert(video.manifest.audio().object_key());
  keys.insert(storage::keys::AudioKey(video.video_id));

  uint64_t removed = 0;
  for (const auto& key : keys) {
    try {
      if (!objects_->Exists(key)) continue;
      objects_->Remove(key);
      removed++;
    } catch (const std::exception& e) {
      VIDPIPE_LOG_WARN("retention could not remove object",
                       {StringField("video_id", video.video_id), StringField("key", key), StringField("error", e.what())});
    }
  }
  return removed;
}

} // namespace vidpipe::maintenance
