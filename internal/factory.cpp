#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/grpc/video_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/ffmpeg_transcoder.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/service/video_service.hpp"
#include "internal/storage/storage_factory.hpp"
#if VIDPIPE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if VIDPIPE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace vidpipe::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const vidpipe::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if VIDPIPE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->Bootstrap();
    VIDPIPE_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if VIDPIPE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    VIDPIPE_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  VIDPIPE_LOG_WARN("using in-memory repository, state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const vidpipe::runtime::config::RuntimeConfig& config) {
  const auto& tools = config.pipeline();
  return Build(config, util::DefaultClock(),
               std::make_shared<pipeline::FfmpegTranscoder>(tools.ffmpeg_path(), tools.ffprobe_path(),
                                                            std::chrono::milliseconds(tools.stage_timeout_ms())));
}

/*
    Build full application dependency graph
*/
Application Build(const vidpipe::runtime::config::RuntimeConfig& config, std::shared_ptr<util::ClockSource> clock,
                  std::shared_ptr<pipeline::MediaTranscoder> transcoder) {
  Application app;

  // ------------------------------------------------------------------
  // Storage and state
  // ------------------------------------------------------------------
  app.objects    = storage::StorageFactory::Build(config.storage());
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Queue, ingestion, pipeline
  // ------------------------------------------------------------------
  app.queue = std::make_shared<queue::JobQueue>(app.repository, clock,
                                                std::chrono::milliseconds(config.queue().lease_duration_ms()));

  app.ingestion = std::make_shared<ingest::IngestionService>(app.repository, app.objects, app.queue, clock,
                                                             ingest::IngestOptions::FromConfig(config));

  app.runner = std::make_shared<pipeline::PipelineRunner>(app.repository, app.queue, app.objects, std::move(transcoder),
                                                          clock, pipeline::PipelineOptions::FromConfig(config));

  app.workers = std::make_shared<worker::WorkerPool>(app.queue, app.runner, worker::WorkerOptions::FromConfig(config));

  app.retention = std::make_shared<maintenance::RetentionSweeper>(app.repository, app.objects, app.ingestion, clock,
                                                                  maintenance::RetentionOptions::FromConfig(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.queue      = app.queue;
  ctx.ingestion  = app.ingestion;
  ctx.clock      = clock;

  auto upload_service = std::make_shared<service::UploadService>(ctx);
  auto video_service  = std::make_shared<service::VideoService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::UploadServer>(upload_service));
  app.grpc_services.push_back(std::make_unique<grpc::VideoServer>(video_service));

  return app;
}

void Application::StartBackground() {
  workers->Start();
  retention->Start();
}

void Application::StopBackground() {
  if (retention) retention->Stop();
  if (workers) workers->Stop();
  if (runner) runner->CloseEvents();
}

} // namespace vidpipe::factory
