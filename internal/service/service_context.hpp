#pragma once

#include <memory>

namespace vidpipe::db { class Repository; }
namespace vidpipe::queue { class JobQueue; }
namespace vidpipe::ingest { class IngestionService; }
namespace vidpipe::util { class ClockSource; }

namespace vidpipe::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vidpipe::db::Repository>         repository;
  std::shared_ptr<vidpipe::queue::JobQueue>        queue;
  std::shared_ptr<vidpipe::ingest::IngestionService> ingestion;
  std::shared_ptr<vidpipe::util::ClockSource>      clock;
};

} // namespace vidpipe::service
