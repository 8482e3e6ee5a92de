#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vidpipe::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Videos
// ------------------------------------------------------------------

Result MemoryRepository::InsertVideo(Transaction& t, const model::VideoRecord& r) {
  if (TX(t).View().videos.contains(r.video_id)) return Result::Err(ErrorCode::AlreadyExists, r.video_id);
  TX(t).Mutable().videos[r.video_id] = r;
  return Result::Ok();
}

std::optional<model::VideoRecord> MemoryRepository::GetVideo(Transaction& t, const std::string& video_id) {
  const auto& s  = TX(t).View();
  auto        it = s.videos.find(video_id);
  if (it == s.videos.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateVideo(Transaction& t, const model::VideoRecord& r) {
  if (!TX(t).View().videos.contains(r.video_id)) return Result::Err(ErrorCode::NotFound, r.video_id);
  TX(t).Mutable().videos[r.video_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteVideo(Transaction& t, const std::string& video_id) {
  auto& s = TX(t).Mutable();
  s.videos.erase(video_id);
  // jobs reference their video
  if (auto it = s.job_by_video.find(video_id); it != s.job_by_video.end()) {
    s.jobs.erase(it->second);
    s.job_by_video.erase(it);
  }
  return Result::Ok();
}

std::vector<model::VideoRecord> MemoryRepository::ListVideosCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  std::vector<model::VideoRecord> out;
  for (const auto& [_, record] : TX(t).View().videos) {
    if (record.created_at_ms < cutoff_ms) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  const auto& view = TX(t).View();
  if (view.jobs.contains(r.job_id)) return Result::Err(ErrorCode::AlreadyExists, r.job_id);
  if (!view.videos.contains(r.video_id)) return Result::Err(ErrorCode::ConstraintViolation, "no video " + r.video_id);
  if (view.job_by_video.contains(r.video_id)) return Result::Err(ErrorCode::ConstraintViolation, "job already queued for video " + r.video_id);

  auto& s                    = TX(t).Mutable();
  s.jobs[r.job_id]           = r;
  s.job_by_video[r.video_id] = r.job_id;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& job_id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(job_id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::GetJobByVideo(Transaction& t, const std::string& video_id) {
  const auto& s  = TX(t).View();
  auto        it = s.job_by_video.find(video_id);
  if (it == s.job_by_video.end()) return std::nullopt;
  return s.jobs.at(it->second);
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  if (!TX(t).View().jobs.contains(r.job_id)) return Result::Err(ErrorCode::NotFound, r.job_id);
  TX(t).Mutable().jobs[r.job_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& job_id) {
  auto it = TX(t).View().jobs.find(job_id);
  if (it == TX(t).View().jobs.end()) return Result::Ok();

  const auto video_id = it->second.video_id;
  auto&      s        = TX(t).Mutable();
  s.jobs.erase(job_id);
  s.job_by_video.erase(video_id);
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::NextVisibleJob(Transaction& t, uint64_t now_ms) {
  const model::JobRecord* best = nullptr;
  for (const auto& [_, job] : TX(t).View().jobs) {
    if (job.visibility_deadline_ms > now_ms) continue;
    if (!best || job.enqueued_at_ms < best->enqueued_at_ms ||
        (job.enqueued_at_ms == best->enqueued_at_ms && job.job_id < best->job_id)) {
      best = &job;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

uint64_t MemoryRepository::CountJobs(Transaction& t) {
  return TX(t).View().jobs.size();
}

// ------------------------------------------------------------------
// Uploads
// ------------------------------------------------------------------

Result MemoryRepository::InsertUpload(Transaction& t, const model::UploadRecord& r) {
  if (TX(t).View().uploads.contains(r.upload_id)) return Result::Err(ErrorCode::AlreadyExists, r.upload_id);
  TX(t).Mutable().uploads[r.upload_id] = r;
  return Result::Ok();
}

std::optional<model::UploadRecord> MemoryRepository::GetUpload(Transaction& t, const std::string& upload_id) {
  const auto& s  = TX(t).View();
  auto        it = s.uploads.find(upload_id);
  if (it == s.uploads.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateUpload(Transaction& t, const model::UploadRecord& r) {
  if (!TX(t).View().uploads.contains(r.upload_id)) return Result::Err(ErrorCode::NotFound, r.upload_id);
  TX(t).Mutable().uploads[r.upload_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteUpload(Transaction& t, const std::string& upload_id) {
  TX(t).Mutable().uploads.erase(upload_id);
  return Result::Ok();
}

std::vector<model::UploadRecord> MemoryRepository::ListUploadsExpiredBefore(Transaction& t, uint64_t now_ms) {
  std::vector<model::UploadRecord> out;
  for (const auto& [_, record] : TX(t).View().uploads) {
    if (record.expires_at_ms != 0 && record.expires_at_ms <= now_ms) out.push_back(record);
  }
  return out;
}

} // namespace vidpipe::db::memory
