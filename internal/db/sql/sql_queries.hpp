#pragma once

namespace vidpipe::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements.
*/

// schema

static constexpr const char* CREATE_VIDEOS =
    "CREATE TABLE IF NOT EXISTS videos ("
    " video_id TEXT PRIMARY KEY,"
    " owner_id TEXT NOT NULL,"
    " source_object_key TEXT NOT NULL,"
    " filename TEXT NOT NULL,"
    " size_bytes INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " progress REAL NOT NULL,"
    " manifest_json TEXT NOT NULL,"
    " error_message TEXT NOT NULL DEFAULT '',"
    " created_at_ms INTEGER NOT NULL,"
    " processing_started_at_ms INTEGER NOT NULL DEFAULT 0,"
    " processing_completed_at_ms INTEGER NOT NULL DEFAULT 0,"
    " version INTEGER NOT NULL);";

static constexpr const char* CREATE_JOBS =
    "CREATE TABLE IF NOT EXISTS processing_jobs ("
    " job_id TEXT PRIMARY KEY,"
    " video_id TEXT NOT NULL UNIQUE REFERENCES videos(video_id) ON DELETE CASCADE,"
    " attempt INTEGER NOT NULL,"
    " enqueued_at_ms INTEGER NOT NULL,"
    " visibility_deadline_ms INTEGER NOT NULL,"
    " lease_id TEXT NOT NULL DEFAULT '',"
    " last_error TEXT NOT NULL DEFAULT '',"
    " reduced_concurrency INTEGER NOT NULL DEFAULT 0);";

static constexpr const char* CREATE_JOBS_VISIBILITY_INDEX =
    "CREATE INDEX IF NOT EXISTS processing_jobs_visibility"
    " ON processing_jobs(visibility_deadline_ms, enqueued_at_ms);";

static constexpr const char* CREATE_UPLOADS =
    "CREATE TABLE IF NOT EXISTS upload_sessions ("
    " upload_id TEXT PRIMARY KEY,"
    " owner_id TEXT NOT NULL,"
    " filename TEXT NOT NULL,"
    " declared_size INTEGER NOT NULL,"
    " confirmed_offset INTEGER NOT NULL,"
    " staging_path TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " expires_at_ms INTEGER NOT NULL,"
    " video_id TEXT NOT NULL DEFAULT '');";

// videos

static constexpr const char* INSERT_VIDEO =
    "INSERT INTO videos(video_id,owner_id,source_object_key,filename,size_bytes,status,progress,manifest_json,"
    "error_message,created_at_ms,processing_started_at_ms,processing_completed_at_ms,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_VIDEO =
    "SELECT video_id,owner_id,source_object_key,filename,size_bytes,status,progress,manifest_json,"
    "error_message,created_at_ms,processing_started_at_ms,processing_completed_at_ms,version"
    " FROM videos WHERE video_id=?;";

static constexpr const char* UPDATE_VIDEO =
    "UPDATE videos SET owner_id=?,source_object_key=?,filename=?,size_bytes=?,status=?,progress=?,manifest_json=?,"
    "error_message=?,created_at_ms=?,processing_started_at_ms=?,processing_completed_at_ms=?,version=?"
    " WHERE video_id=?;";

static constexpr const char* DELETE_VIDEO =
    "DELETE FROM videos WHERE video_id=?;";

static constexpr const char* SELECT_VIDEOS_CREATED_BEFORE =
    "SELECT video_id,owner_id,source_object_key,filename,size_bytes,status,progress,manifest_json,"
    "error_message,created_at_ms,processing_started_at_ms,processing_completed_at_ms,version"
    " FROM videos WHERE created_at_ms<? ORDER BY created_at_ms ASC;";

// jobs

static constexpr const char* INSERT_JOB =
    "INSERT INTO processing_jobs(job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,last_error,"
    "reduced_concurrency) VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_JOB =
    "SELECT job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,last_error,reduced_concurrency"
    " FROM processing_jobs WHERE job_id=?;";

static constexpr const char* SELECT_JOB_BY_VIDEO =
    "SELECT job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,last_error,reduced_concurrency"
    " FROM processing_jobs WHERE video_id=?;";

static constexpr const char* UPDATE_JOB =
    "UPDATE processing_jobs SET video_id=?,attempt=?,enqueued_at_ms=?,visibility_deadline_ms=?,lease_id=?,"
    "last_error=?,reduced_concurrency=? WHERE job_id=?;";

static constexpr const char* DELETE_JOB =
    "DELETE FROM processing_jobs WHERE job_id=?;";

static constexpr const char* SELECT_NEXT_VISIBLE_JOB =
    "SELECT job_id,video_id,attempt,enqueued_at_ms,visibility_deadline_ms,lease_id,last_error,reduced_concurrency"
    " FROM processing_jobs WHERE visibility_deadline_ms<=? ORDER BY enqueued_at_ms ASC, job_id ASC LIMIT 1;";

static constexpr const char* COUNT_JOBS =
    "SELECT COUNT(*) FROM processing_jobs;";

// uploads

static constexpr const char* INSERT_UPLOAD =
    "INSERT INTO upload_sessions(upload_id,owner_id,filename,declared_size,confirmed_offset,staging_path,"
    "created_at_ms,expires_at_ms,video_id) VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_UPLOAD =
    "SELECT upload_id,owner_id,filename,declared_size,confirmed_offset,staging_path,created_at_ms,expires_at_ms,video_id"
    " FROM upload_sessions WHERE upload_id=?;";

static constexpr const char* UPDATE_UPLOAD =
    "UPDATE upload_sessions SET owner_id=?,filename=?,declared_size=?,confirmed_offset=?,staging_path=?,"
    "created_at_ms=?,expires_at_ms=?,video_id=? WHERE upload_id=?;";

static constexpr const char* DELETE_UPLOAD =
    "DELETE FROM upload_sessions WHERE upload_id=?;";

static constexpr const char* SELECT_UPLOADS_EXPIRED_BEFORE =
    "SELECT upload_id,owner_id,filename,declared_size,confirmed_offset,staging_path,created_at_ms,expires_at_ms,video_id"
    " FROM upload_sessions WHERE expires_at_ms<>0 AND expires_at_ms<=?;";

} // namespace vidpipe::db::sql
