#include "pg_repository.hpp"

#include "internal/db/model/manifest_codec.hpp"

namespace vidpipe::db::postgres {

namespace {

model::VideoRecord ReadVideo(const pqxx::row& row) {
  model::VideoRecord r;
  r.video_id                   = row[0].c_str();
  r.owner_id                   = row[1].c_str();
  r.source_object_key          = row[2].c_str();
  r.filename                   = row[3].c_str();
  r.size_bytes                 = row[4].as<uint64_t>();
  r.status                     = static_cast<vidpipe::model::VideoStatus>(row[5].as<int>());
  r.progress                   = row[6].as<double>();
  r.manifest                   = model::DecodeManifest(row[7].c_str());
  r.error_message              = row[8].c_str();
  r.created_at_ms              = row[9].as<uint64_t>();
  r.processing_started_at_ms   = row[10].as<uint64_t>();
  r.processing_completed_at_ms = row[11].as<uint64_t>();
  r.version                    = row[12].as<uint64_t>();
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.job_id                 = row[0].c_str();
  r.video_id               = row[1].c_str();
  r.attempt                = row[2].as<uint32_t>();
  r.enqueued_at_ms         = row[3].as<uint64_t>();
  r.visibility_deadline_ms = row[4].as<uint64_t>();
  r.lease_id               = row[5].c_str();
  r.last_error             = row[6].c_str();
  r.reduced_concurrency    = row[7].as<bool>();
  return r;
}

model::UploadRecord ReadUpload(const pqxx::row& row) {
  model::UploadRecord r;
  r.upload_id        = row[0].c_str();
  r.owner_id         = row[1].c_str();
  r.filename         = row[2].c_str();
  r.declared_size    = row[3].as<uint64_t>();
  r.confirmed_offset = row[4].as<uint64_t>();
  r.staging_path     = row[5].c_str();
  r.created_at_ms    = row[6].as<uint64_t>();
  r.expires_at_ms    = row[7].as<uint64_t>();
  r.video_id         = row[8].c_str();
  return r;
}

// An UPDATE that matched no row means the record is gone.
Result Affected(const pqxx::result& res, const std::string& key) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, key);
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Videos
// ------------------------------------------------------------------

Result PgRepository::InsertVideo(Transaction& t, const model::VideoRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_video", r.video_id, r.owner_id, r.source_object_key, r.filename, r.size_bytes,
                               static_cast<int>(r.status), r.progress, model::EncodeManifest(r.manifest),
                               r.error_message, r.created_at_ms, r.processing_started_at_ms,
                               r.processing_completed_at_ms, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VideoRecord> PgRepository::GetVideo(Transaction& t, const std::string& video_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_video", video_id);
    if (res.empty()) return std::nullopt;
    return ReadVideo(res[0]);
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "get video");
    throw;
  }
}

Result PgRepository::UpdateVideo(Transaction& t, const model::VideoRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_video", r.video_id, r.owner_id, r.source_object_key, r.filename,
                                          r.size_bytes, static_cast<int>(r.status), r.progress,
                                          model::EncodeManifest(r.manifest), r.error_message, r.created_at_ms,
                                          r.processing_started_at_ms, r.processing_completed_at_ms, r.version);
    return Affected(res, r.video_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteVideo(Transaction& t, const std::string& video_id) {
  try {
    TX(t).Work().exec_prepared("delete_video", video_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::VideoRecord> PgRepository::ListVideosCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("list_videos_created_before", cutoff_ms);

    std::vector<model::VideoRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadVideo(row));
    return out;
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "list videos");
    throw;
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_job", r.job_id, r.video_id, r.attempt, r.enqueued_at_ms,
                               r.visibility_deadline_ms, r.lease_id, r.last_error, r.reduced_concurrency);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& job_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_job", job_id);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "get job");
    throw;
  }
}

std::optional<model::JobRecord> PgRepository::GetJobByVideo(Transaction& t, const std::string& video_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_job_by_video", video_id);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "get job by video");
    throw;
  }
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.job_id, r.video_id, r.attempt, r.enqueued_at_ms,
                                          r.visibility_deadline_ms, r.lease_id, r.last_error, r.reduced_concurrency);
    return Affected(res, r.job_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteJob(Transaction& t, const std::string& job_id) {
  try {
    TX(t).Work().exec_prepared("delete_job", job_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::NextVisibleJob(Transaction& t, uint64_t now_ms) {
  // SKIP LOCKED: concurrent claimers each get a different row
  try {
    auto res = TX(t).Work().exec_prepared("next_visible_job", now_ms);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "next visible job");
    throw;
  }
}

uint64_t PgRepository::CountJobs(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("count_jobs");
    return res[0][0].as<uint64_t>();
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "count jobs");
    throw;
  }
}

// ------------------------------------------------------------------
// Uploads
// ------------------------------------------------------------------

Result PgRepository::InsertUpload(Transaction& t, const model::UploadRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_upload", r.upload_id, r.owner_id, r.filename, r.declared_size,
                               r.confirmed_offset, r.staging_path, r.created_at_ms, r.expires_at_ms, r.video_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UploadRecord> PgRepository::GetUpload(Transaction& t, const std::string& upload_id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_upload", upload_id);
    if (res.empty()) return std::nullopt;
    return ReadUpload(res[0]);
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "get upload");
    throw;
  }
}

Result PgRepository::UpdateUpload(Transaction& t, const model::UploadRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_upload", r.upload_id, r.owner_id, r.filename, r.declared_size,
                                          r.confirmed_offset, r.staging_path, r.created_at_ms, r.expires_at_ms,
                                          r.video_id);
    return Affected(res, r.upload_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteUpload(Transaction& t, const std::string& upload_id) {
  try {
    TX(t).Work().exec_prepared("delete_upload", upload_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UploadRecord> PgRepository::ListUploadsExpiredBefore(Transaction& t, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("list_uploads_expired_before", now_ms);

    std::vector<model::UploadRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadUpload(row));
    return out;
  } catch (const pqxx::sql_error& e) {
    ThrowIfError(Translate(e), "list expired uploads");
    throw;
  }
}

} // namespace vidpipe::db::postgres
