#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/time.hpp"

namespace vidpipe::maintenance {

struct RetentionOptions {
  bool                      enabled = false;
  std::chrono::hours        max_age{24 * 30};
  std::chrono::milliseconds interval{std::chrono::hours(1)};

  static RetentionOptions FromConfig(const vidpipe::runtime::config::RuntimeConfig& config);
};

struct SweepReport {
  uint64_t videos_deleted   = 0;
  uint64_t objects_deleted  = 0;
  uint64_t uploads_expired  = 0;
};

/*
  Periodic cleanup.

  Deletes videos older than max_age together with every object the
  manifest or the key layout points at, and expired upload sessions.
  Videos still being processed are skipped until they reach a terminal
  state.
*/
class RetentionSweeper {
 public:
  RetentionSweeper(std::shared_ptr<db::Repository> repository, storage::ObjectStorePtr objects,
                   std::shared_ptr<ingest::IngestionService> ingestion, std::shared_ptr<util::ClockSource> clock,
                   RetentionOptions options);
  ~RetentionSweeper();

  void Start();
  void Stop();

  SweepReport SweepOnce();

 private:
  void Loop();

  uint64_t RemoveObjects(const db::model::VideoRecord& video);

  std::shared_ptr<db::Repository>           repository_;
  storage::ObjectStorePtr                   objects_;
  std::shared_ptr<ingest::IngestionService> ingestion_;
  std::shared_ptr<util::ClockSource>        clock_;
  RetentionOptions                          options_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace vidpipe::maintenance
