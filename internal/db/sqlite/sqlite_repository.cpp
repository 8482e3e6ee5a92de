#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/model/manifest_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace vidpipe::db::sqlite {

using vidpipe::db::ErrorCode;
using vidpipe::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

/*
  Statement handle that finalizes on scope exit. Prepare failures on
  reads are real errors (schema drift, closed handle), so they throw.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

// column order follows sql::SELECT_VIDEO
model::VideoRecord ReadVideo(sqlite3_stmt* st) {
  model::VideoRecord r;
  r.video_id                   = ColText(st, 0);
  r.owner_id                   = ColText(st, 1);
  r.source_object_key          = ColText(st, 2);
  r.filename                   = ColText(st, 3);
  r.size_bytes                 = ColU64(st, 4);
  r.status                     = static_cast<vidpipe::model::VideoStatus>(ColI32(st, 5));
  r.progress                   = ColDouble(st, 6);
  r.manifest                   = model::DecodeManifest(ColText(st, 7));
  r.error_message              = ColText(st, 8);
  r.created_at_ms              = ColU64(st, 9);
  r.processing_started_at_ms   = ColU64(st, 10);
  r.processing_completed_at_ms = ColU64(st, 11);
  r.version                    = ColU64(st, 12);
  return r;
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.job_id                 = ColText(st, 0);
  r.video_id               = ColText(st, 1);
  r.attempt                = static_cast<uint32_t>(ColI32(st, 2));
  r.enqueued_at_ms         = ColU64(st, 3);
  r.visibility_deadline_ms = ColU64(st, 4);
  r.lease_id               = ColText(st, 5);
  r.last_error             = ColText(st, 6);
  r.reduced_concurrency    = ColI32(st, 7) != 0;
  return r;
}

model::UploadRecord ReadUpload(sqlite3_stmt* st) {
  model::UploadRecord r;
  r.upload_id        = ColText(st, 0);
  r.owner_id         = ColText(st, 1);
  r.filename         = ColText(st, 2);
  r.declared_size    = ColU64(st, 3);
  r.confirmed_offset = ColU64(st, 4);
  r.staging_path     = ColText(st, 5);
  r.created_at_ms    = ColU64(st, 6);
  r.expires_at_ms    = ColU64(st, 7);
  r.video_id         = ColText(st, 8);
  return r;
}

template <typename Reader>
auto QueryOne(sqlite3* db, const char* sql, const std::string& key, Reader read) -> std::optional<decltype(read(nullptr))> {
  Statement st(db, sql);
  BindText(st.get(), 1, key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return read(st.get());
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, std::unique_lock<std::mutex>(connection_mutex_));
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Videos
// ------------------------------------------------------------------

Result SqliteRepository::InsertVideo(Transaction& t, const model::VideoRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::INSERT_VIDEO);

  BindText(st.get(), 1, r.video_id);
  BindText(st.get(), 2, r.owner_id);
  BindText(st.get(), 3, r.source_object_key);
  BindText(st.get(), 4, r.filename);
  BindU64(st.get(), 5, r.size_bytes);
  BindI32(st.get(), 6, static_cast<int>(r.status));
  BindDouble(st.get(), 7, r.progress);
  BindText(st.get(), 8, model::EncodeManifest(r.manifest));
  BindText(st.get(), 9, r.error_message);
  BindU64(st.get(), 10, r.created_at_ms);
  BindU64(st.get(), 11, r.processing_started_at_ms);
  BindU64(st.get(), 12, r.processing_completed_at_ms);
  BindU64(st.get(), 13, r.version);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VideoRecord> SqliteRepository::GetVideo(Transaction& t, const std::string& video_id) {
  return QueryOne(TX(t).Handle(), sql::SELECT_VIDEO, video_id, ReadVideo);
}

Result SqliteRepository::UpdateVideo(Transaction& t, const model::VideoRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::UPDATE_VIDEO);

  BindText(st.get(), 1, r.owner_id);
  BindText(st.get(), 2, r.source_object_key);
  BindText(st.get(), 3, r.filename);
  BindU64(st.get(), 4, r.size_bytes);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindDouble(st.get(), 6, r.progress);
  BindText(st.get(), 7, model::EncodeManifest(r.manifest));
  BindText(st.get(), 8, r.error_message);
  BindU64(st.get(), 9, r.created_at_ms);
  BindU64(st.get(), 10, r.processing_started_at_ms);
  BindU64(st.get(), 11, r.processing_completed_at_ms);
  BindU64(st.get(), 12, r.version);
  BindText(st.get(), 13, r.video_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.video_id);
  return Result::Ok();
}

Result SqliteRepository::DeleteVideo(Transaction& t, const std::string& video_id) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::DELETE_VIDEO);
  BindText(st.get(), 1, video_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::VideoRecord> SqliteRepository::ListVideosCreatedBefore(Transaction& t, uint64_t cutoff_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_VIDEOS_CREATED_BEFORE);
  BindU64(st.get(), 1, cutoff_ms);

  std::vector<model::VideoRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadVideo(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::INSERT_JOB);

  BindText(st.get(), 1, r.job_id);
  BindText(st.get(), 2, r.video_id);
  BindI32(st.get(), 3, static_cast<int>(r.attempt));
  BindU64(st.get(), 4, r.enqueued_at_ms);
  BindU64(st.get(), 5, r.visibility_deadline_ms);
  BindText(st.get(), 6, r.lease_id);
  BindText(st.get(), 7, r.last_error);
  BindI32(st.get(), 8, r.reduced_concurrency ? 1 : 0);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& job_id) {
  return QueryOne(TX(t).Handle(), sql::SELECT_JOB, job_id, ReadJob);
}

std::optional<model::JobRecord> SqliteRepository::GetJobByVideo(Transaction& t, const std::string& video_id) {
  return QueryOne(TX(t).Handle(), sql::SELECT_JOB_BY_VIDEO, video_id, ReadJob);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::UPDATE_JOB);

  BindText(st.get(), 1, r.video_id);
  BindI32(st.get(), 2, static_cast<int>(r.attempt));
  BindU64(st.get(), 3, r.enqueued_at_ms);
  BindU64(st.get(), 4, r.visibility_deadline_ms);
  BindText(st.get(), 5, r.lease_id);
  BindText(st.get(), 6, r.last_error);
  BindI32(st.get(), 7, r.reduced_concurrency ? 1 : 0);
  BindText(st.get(), 8, r.job_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.job_id);
  return Result::Ok();
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& job_id) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::DELETE_JOB);
  BindText(st.get(), 1, job_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::NextVisibleJob(Transaction& t, uint64_t now_ms) {
  // BEGIN IMMEDIATE already serializes writers, so select-then-update is a claim
  Statement st(TX(t).Handle(), sql::SELECT_NEXT_VISIBLE_JOB);
  BindU64(st.get(), 1, now_ms);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadJob(st.get());
}

uint64_t SqliteRepository::CountJobs(Transaction& t) {
  Statement st(TX(t).Handle(), sql::COUNT_JOBS);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Uploads
// ------------------------------------------------------------------

Result SqliteRepository::InsertUpload(Transaction& t, const model::UploadRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::INSERT_UPLOAD);

  BindText(st.get(), 1, r.upload_id);
  BindText(st.get(), 2, r.owner_id);
  BindText(st.get(), 3, r.filename);
  BindU64(st.get(), 4, r.declared_size);
  BindU64(st.get(), 5, r.confirmed_offset);
  BindText(st.get(), 6, r.staging_path);
  BindU64(st.get(), 7, r.created_at_ms);
  BindU64(st.get(), 8, r.expires_at_ms);
  BindText(st.get(), 9, r.video_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UploadRecord> SqliteRepository::GetUpload(Transaction& t, const std::string& upload_id) {
  return QueryOne(TX(t).Handle(), sql::SELECT_UPLOAD, upload_id, ReadUpload);
}

Result SqliteRepository::UpdateUpload(Transaction& t, const model::UploadRecord& r) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::UPDATE_UPLOAD);

  BindText(st.get(), 1, r.owner_id);
  BindText(st.get(), 2, r.filename);
  BindU64(st.get(), 3, r.declared_size);
  BindU64(st.get(), 4, r.confirmed_offset);
  BindText(st.get(), 5, r.staging_path);
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.expires_at_ms);
  BindText(st.get(), 8, r.video_id);
  BindText(st.get(), 9, r.upload_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.upload_id);
  return Result::Ok();
}

Result SqliteRepository::DeleteUpload(Transaction& t, const std::string& upload_id) {
  auto* db = TX(t).Handle();
  Statement st(db, sql::DELETE_UPLOAD);
  BindText(st.get(), 1, upload_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::UploadRecord> SqliteRepository::ListUploadsExpiredBefore(Transaction& t, uint64_t now_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_UPLOADS_EXPIRED_BEFORE);
  BindU64(st.get(), 1, now_ms);

  std::vector<model::UploadRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(ReadUpload(st.get()));
  return out;
}

} // namespace vidpipe::db::sqlite
