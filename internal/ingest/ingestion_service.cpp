#include "ingestion_service.hpp"

#include <algorithm>
#include <functional>
#include <optional>

#include "container_format.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/object_keys.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vidpipe::ingest {

using observability::IntField;
using observability::StringField;

IngestOptions IngestOptions::FromConfig(const vidpipe::runtime::config::RuntimeConfig& config) {
  IngestOptions options;
  options.max_upload_bytes = config.ingest().max_upload_bytes();
  options.upload_ttl       = std::chrono::seconds(config.ingest().upload_ttl_seconds());
  options.allowed_extensions.assign(config.ingest().allowed_extensions().begin(), config.ingest().allowed_extensions().end());
  options.staging_dir = config.storage().staging_dir();
  return options;
}

IngestionService::IngestionService(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects,
                                   std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<util::ClockSource> clock,
                                   IngestOptions options)
    : repository_(std::move(repository)),
      objects_(std::move(objects)),
      queue_(std::move(queue)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      staging_(options_.staging_dir) {
}

std::mutex& IngestionService::LockFor(const std::string& upload_id) {
  return upload_locks_[std::hash<std::string>{}(upload_id) % upload_locks_.size()];
}

void IngestionService::ValidateRequest(const std::string& owner_id, const std::string& filename,
                                       uint64_t declared_size) const {
  if (owner_id.empty()) {
    throw std::invalid_argument("owner id must not be empty");
  }
  storage::keys::ValidateSegment(filename, "filename");

  if (declared_size == 0) {
    throw util::DataIntegrity("empty upload: " + filename);
  }
  if (declared_size > options_.max_upload_bytes) {
    throw util::DataIntegrity("upload of " + std::to_string(declared_size) + " bytes exceeds maximum of " +
                              std::to_string(options_.max_upload_bytes));
  }
  if (!HasAllowedExtension(filename, options_.allowed_extensions)) {
    throw util::DataIntegrity("unsupported video format: " + filename);
  }
}

// ------------------------------------------------------------------
// Resumable sessions
// ------------------------------------------------------------------

UploadState IngestionService::CreateUpload(const std::string& upload_id, const std::string& owner_id,
                                           const std::string& filename, uint64_t declared_size) {
  storage::keys::ValidateSegment(upload_id, "upload id");
  ValidateRequest(owner_id, filename, declared_size);

  std::lock_guard lock(LockFor(upload_id));

  auto existing = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetUpload(tx, upload_id); });
  if (existing && existing->video_id.empty() && existing->expires_at_ms <= clock_->NowMs()) {
    // expired and never finished: start over under the same id
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfError(repository_->DeleteUpload(tx, upload_id), "discard expired upload");
    });
    staging_.Remove(existing->staging_path);
    existing.reset();
  }
  if (existing) {
    if (existing->owner_id != owner_id || existing->filename != filename || existing->declared_size != declared_size) {
      throw util::AlreadyExists("upload id already used for a different file: " + upload_id);
    }
    return UploadState{existing->upload_id, existing->confirmed_offset, existing->declared_size, existing->expires_at_ms,
                       existing->video_id};
  }

  db::model::UploadRecord record;
  record.upload_id     = upload_id;
  record.owner_id      = owner_id;
  record.filename      = filename;
  record.declared_size = declared_size;
  record.created_at_ms = clock_->NowMs();
  record.expires_at_ms = record.created_at_ms + static_cast<uint64_t>(options_.upload_ttl.count());
  record.staging_path  = staging_.Create(upload_id).string();

  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfError(repository_->InsertUpload(tx, record), "create upload");
    });
  } catch (const std::exception&) {
    staging_.Remove(record.staging_path);
    throw;
  }

  VIDPIPE_LOG_INFO("upload created", {StringField("upload_id", upload_id), StringField("owner_id", owner_id),
                                      IntField("declared_size", static_cast<int64_t>(declared_size))});
  return UploadState{upload_id, 0, declared_size, record.expires_at_ms, {}};
}

UploadState IngestionService::QueryOffset(const std::string& upload_id) {
  auto upload = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetUpload(tx, upload_id); });
  if (!upload) {
    throw util::NotFound("upload not found: " + upload_id);
  }
  if (upload->video_id.empty() && upload->expires_at_ms <= clock_->NowMs()) {
    throw util::NotFound("upload expired: " + upload_id);
  }
  return UploadState{upload->upload_id, upload->confirmed_offset, upload->declared_size, upload->expires_at_ms,
                     upload->video_id};
}

AppendResult IngestionService::AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data) {
  std::lock_guard lock(LockFor(upload_id));

  auto upload = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetUpload(tx, upload_id); });
  if (!upload) {
    throw util::NotFound("upload not found: " + upload_id);
  }

  // replayed final chunk after the response was lost
  if (!upload->video_id.empty()) {
    auto video = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetVideo(tx, upload->video_id); });
    return AppendResult{upload->declared_size, true, upload->video_id, video ? video->status : model::VideoStatus::kPending};
  }

  if (upload->expires_at_ms <= clock_->NowMs()) {
    throw util::NotFound("upload expired: " + upload_id);
  }
  if (offset != upload->confirmed_offset) {
    throw util::OffsetConflict("chunk offset " + std::to_string(offset) + " rejected for upload " + upload_id,
                               upload->confirmed_offset);
  }
  if (offset + data.size() > upload->declared_size) {
    throw util::DataIntegrity("chunk exceeds declared size " + std::to_string(upload->declared_size) + " for upload " +
                              upload_id);
  }

  if (!data.empty()) {
    const auto new_offset = staging_.Append(upload->staging_path, offset, data);

    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      auto current = repository_->GetUpload(tx, upload_id);
      if (!current) throw util::NotFound("upload not found: " + upload_id);
      current->confirmed_offset = new_offset;
      db::ThrowIfError(repository_->UpdateUpload(tx, *current), "confirm chunk");
    });

    observability::Metrics::Instance().RecordIngestedBytes(data.size());
    upload->confirmed_offset = new_offset;
  }

  if (upload->confirmed_offset < upload->declared_size) {
    return AppendResult{upload->confirmed_offset, false, {}, model::VideoStatus::kPending};
  }
  return Complete(*upload);
}

AppendResult IngestionService::Complete(const db::model::UploadRecord& upload) {
  const std::filesystem::path path(upload.staging_path);

  try {
    const auto actual = staging_.Size(path);
    if (actual != upload.declared_size) {
      throw util::DataIntegrity("received " + std::to_string(actual) + " bytes but " +
                                std::to_string(upload.declared_size) + " were declared");
    }
    ValidateContainer(upload.filename, staging_.ReadHeader(path, kSniffBytes), options_.allowed_extensions);
  } catch (const util::DataIntegrity& e) {
    // the content itself is bad, resending cannot fix it
    VIDPIPE_LOG_WARN("upload rejected", {StringField("upload_id", upload.upload_id), StringField("reason", e.what())});
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfError(repository_->DeleteUpload(tx, upload.upload_id), "discard upload");
    });
    staging_.Remove(path);
    throw;
  }

  const auto video_id   = util::NewId();
  const auto source_key = storage::keys::OriginalKey(video_id, upload.filename);
  objects_->PutFile(source_key, path);

  auto result = Register(upload.owner_id, upload.filename, upload.declared_size, video_id, source_key, upload.upload_id);
  staging_.Remove(path);

  return AppendResult{upload.declared_size, true, result.video_id, result.status};
}

void IngestionService::CancelUpload(const std::string& upload_id) {
  std::lock_guard lock(LockFor(upload_id));

  auto upload = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto current = repository_->GetUpload(tx, upload_id);
    if (!current) throw util::NotFound("upload not found: " + upload_id);
    if (!current->video_id.empty()) {
      throw util::InvalidState("upload already completed as video " + current->video_id);
    }
    db::ThrowIfError(repository_->DeleteUpload(tx, upload_id), "cancel upload");
    return *current;
  });

  staging_.Remove(upload.staging_path);
  VIDPIPE_LOG_INFO("upload cancelled", {StringField("upload_id", upload_id),
                                        IntField("confirmed_offset", static_cast<int64_t>(upload.confirmed_offset))});
}

// ------------------------------------------------------------------
// Single request path
// ------------------------------------------------------------------

IngestResult IngestionService::UploadVideo(const std::string& owner_id, const std::string& filename,
                                           uint64_t declared_size, const std::shared_ptr<arrow::Buffer>& data) {
  const uint64_t received = data ? static_cast<uint64_t>(data->size()) : 0;
  if (received == 0) {
    throw util::DataIntegrity("empty upload: " + filename);
  }
  ValidateRequest(owner_id, filename, declared_size);
  if (received != declared_size) {
    throw util::DataIntegrity("received " + std::to_string(received) + " bytes but " + std::to_string(declared_size) +
                              " were declared");
  }
  ValidateContainer(filename, std::string_view(reinterpret_cast<const char*>(data->data()), std::min<size_t>(received, kSniffBytes)),
                    options_.allowed_extensions);

  const auto video_id   = util::NewId();
  const auto source_key = storage::keys::OriginalKey(video_id, filename);
  objects_->Put(source_key, data);
  observability::Metrics::Instance().RecordIngestedBytes(received);

  return Register(owner_id, filename, received, video_id, source_key, {});
}

IngestResult IngestionService::Register(const std::string& owner_id, const std::string& filename, uint64_t size_bytes,
                                        const std::string& video_id, const std::string& source_key,
                                        const std::string& upload_id) {
  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::model::VideoRecord video;
      video.video_id          = video_id;
      video.owner_id          = owner_id;
      video.source_object_key = source_key;
      video.filename          = filename;
      video.size_bytes        = size_bytes;
      video.status            = model::VideoStatus::kPending;
      video.progress          = 0.0;
      video.created_at_ms     = clock_->NowMs();
      video.version           = 1;
      db::ThrowIfError(repository_->InsertVideo(tx, video), "insert video");

      queue_->Enqueue(tx, video_id);

      if (!upload_id.empty()) {
        auto upload = repository_->GetUpload(tx, upload_id);
        if (!upload) throw util::NotFound("upload not found: " + upload_id);
        upload->confirmed_offset = size_bytes;
        upload->video_id         = video_id;
        db::ThrowIfError(repository_->UpdateUpload(tx, *upload), "complete upload");
      }
    });
  } catch (const std::exception&) {
    // keep the store free of objects no video row points at
    try {
      objects_->Remove(source_key);
    } catch (const std::exception& cleanup) {
      VIDPIPE_LOG_ERROR("failed to remove orphaned source object",
                        {StringField("key", source_key), StringField("error", cleanup.what())});
    }
    throw;
  }

  VIDPIPE_LOG_INFO("video ingested", {StringField("video_id", video_id), StringField("owner_id", owner_id),
                                      StringField("source_key", source_key), IntField("size_bytes", static_cast<int64_t>(size_bytes))});
  return IngestResult{video_id, model::VideoStatus::kPending};
}

size_t IngestionService::SweepExpiredUploads() {
  const uint64_t now     = clock_->NowMs();
  auto           expired = db::ReadInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ListUploadsExpiredBefore(tx, now);
  });

  size_t removed = 0;
  for (const auto& listed : expired) {
    std::lock_guard lock(LockFor(listed.upload_id));
    // CreateUpload may have restarted this id since the listing
    auto stale = db::RunInTransaction(*repository_, [&](db::Transaction& tx) -> std::optional<db::model::UploadRecord> {
      auto current = repository_->GetUpload(tx, listed.upload_id);
      if (!current || current->expires_at_ms > now) return std::nullopt;
      db::ThrowIfError(repository_->DeleteUpload(tx, listed.upload_id), "expire upload");
      return current;
    });
    if (!stale) continue;
    staging_.Remove(stale->staging_path);
    ++removed;
  }

  if (removed > 0) {
    VIDPIPE_LOG_INFO("expired uploads removed", {IntField("count", static_cast<int64_t>(removed))});
  }
  return removed;
}

} // namespace vidpipe::ingest
