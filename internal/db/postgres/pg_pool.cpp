#include "pg_pool.hpp"

namespace vidpipe::db::postgres {

namespace {

constexpr const char* kVideoColumns =
    "video_id,owner_id,source_object_key,filename,size_bytes,status,progress,manifest_json,"
    "error_message,created_at_ms,processing_started_at_ms,processing_completed_at_ms,version";

constexpr const char* kJobColumns =
    "job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,last_error,reduced_concurrency";

constexpr const char* kUploadColumns =
    "upload_id,owner_id,filename,declared_size,confirmed_offset,staging_path,created_at_ms,expires_at_ms,video_id";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::Bootstrap() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS videos (video_id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, source_object_key TEXT NOT NULL, "
      "filename TEXT NOT NULL, size_bytes BIGINT NOT NULL, status SMALLINT NOT NULL, progress DOUBLE PRECISION NOT NULL, "
      "manifest_json TEXT NOT NULL, error_message TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, "
      "processing_started_at_ms BIGINT NOT NULL DEFAULT 0, processing_completed_at_ms BIGINT NOT NULL DEFAULT 0, "
      "version BIGINT NOT NULL);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS processing_jobs (job_id TEXT PRIMARY KEY, "
      "video_id TEXT NOT NULL UNIQUE REFERENCES videos(video_id) ON DELETE CASCADE, attempt INTEGER NOT NULL, "
      "enqueued_at_ms BIGINT NOT NULL, visibility_deadline_ms BIGINT NOT NULL, lease_id TEXT NOT NULL DEFAULT '', "
      "last_error TEXT NOT NULL DEFAULT '', reduced_concurrency BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec(
      "CREATE INDEX IF NOT EXISTS processing_jobs_visibility ON processing_jobs(visibility_deadline_ms, enqueued_at_ms);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS upload_sessions (upload_id TEXT PRIMARY KEY, owner_id TEXT NOT NULL, filename TEXT NOT NULL, "
      "declared_size BIGINT NOT NULL, confirmed_offset BIGINT NOT NULL, staging_path TEXT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, video_id TEXT NOT NULL DEFAULT '');");

  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // videos
  conn.prepare("insert_video",
               "INSERT INTO videos(video_id,owner_id,source_object_key,filename,size_bytes,status,progress,manifest_json,"
               "error_message,created_at_ms,processing_started_at_ms,processing_completed_at_ms,version) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13)");
  conn.prepare("get_video", Select(kVideoColumns, "FROM videos WHERE video_id=$1"));
  conn.prepare("update_video",
               "UPDATE videos SET owner_id=$2,source_object_key=$3,filename=$4,size_bytes=$5,status=$6,progress=$7,"
               "manifest_json=$8,error_message=$9,created_at_ms=$10,processing_started_at_ms=$11,"
               "processing_completed_at_ms=$12,version=$13 WHERE video_id=$1");
  conn.prepare("delete_video", "DELETE FROM videos WHERE video_id=$1");
  conn.prepare("list_videos_created_before",
               Select(kVideoColumns, "FROM videos WHERE created_at_ms<$1 ORDER BY created_at_ms ASC"));

  // jobs
  conn.prepare("insert_job",
               "INSERT INTO processing_jobs(job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,"
               "last_error,reduced_concurrency) VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  // row locks keep lease checks and the following write atomic under READ COMMITTED
  conn.prepare("get_job", Select(kJobColumns, "FROM processing_jobs WHERE job_id=$1 FOR UPDATE"));
  conn.prepare("get_job_by_video", Select(kJobColumns, "FROM processing_jobs WHERE video_id=$1 FOR UPDATE"));
  conn.prepare("update_job",
               "UPDATE processing_jobs SET video_id=$2,attempt=$3,enqueued_at_ms=$4,visibility_deadline_ms=$5,"
               "lease_id=$6,last_error=$7,reduced_concurrency=$8 WHERE job_id=$1");
  conn.prepare("delete_job", "DELETE FROM processing_jobs WHERE job_id=$1");
  conn.prepare("next_visible_job",
               Select(kJobColumns,
                      "FROM processing_jobs WHERE visibility_deadline_ms<=$1 "
                      "ORDER BY enqueued_at_ms ASC, job_id ASC LIMIT 1 FOR UPDATE SKIP LOCKED"));
  conn.prepare("count_jobs", "SELECT COUNT(*) FROM processing_jobs");

  // uploads
  conn.prepare("insert_upload",
               "INSERT INTO upload_sessions(upload_id,owner_id,filename,declared_size,confirmed_offset,staging_path,"
               "created_at_ms,expires_at_ms,video_id) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");
  conn.prepare("get_upload", Select(kUploadColumns, "FROM upload_sessions WHERE upload_id=$1 FOR UPDATE"));
  conn.prepare("update_upload",
               "UPDATE upload_sessions SET owner_id=$2,filename=$3,declared_size=$4,confirmed_offset=$5,"
               "staging_path=$6,created_at_ms=$7,expires_at_ms=$8,video_id=$9 WHERE upload_id=$1");
  conn.prepare("delete_upload", "DELETE FROM upload_sessions WHERE upload_id=$1");
  conn.prepare("list_uploads_expired_before",
               Select(kUploadColumns, "FROM upload_sessions WHERE expires_at_ms<>0 AND expires_at_ms<=$1"));
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace vidpipe::db::postgres
