#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/maintenance/retention_sweeper.hpp"
#include "internal/pipeline/media_transcoder.hpp"
#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/worker_pool.hpp"

namespace vidpipe::factory {

/*
  Application

  Owns all long-lived components used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  storage::ObjectStorePtr                     objects;
  std::shared_ptr<queue::JobQueue>            queue;
  std::shared_ptr<ingest::IngestionService>   ingestion;
  std::shared_ptr<pipeline::PipelineRunner>   runner;
  std::shared_ptr<worker::WorkerPool>         workers;
  std::shared_ptr<maintenance::RetentionSweeper> retention;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  void StartBackground();
  void StopBackground();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const vidpipe::runtime::config::RuntimeConfig& config);

// Same graph with injected clock and transcoder, for tests.
Application Build(const vidpipe::runtime::config::RuntimeConfig& config, std::shared_ptr<util::ClockSource> clock,
                  std::shared_ptr<pipeline::MediaTranscoder> transcoder);

std::shared_ptr<db::Repository> BuildRepository(const vidpipe::runtime::config::RuntimeConfig& config);

} // namespace vidpipe::factory
