#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/video_status.hpp"
#include "internal/queue/job_lease.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/event_channel.hpp"
#include "internal/util/time.hpp"
#include "media_transcoder.hpp"
#include "stages.hpp"

namespace vidpipe::pipeline {

enum class JobOutcome {
  kCompleted,
  kRetryScheduled,
  kFailed,
  // lease lost to another worker, nothing written
  kAbandoned,
};

const char* ToString(JobOutcome outcome);

struct StageEvent {
  std::string          video_id;
  model::VideoStatus   status = model::VideoStatus::kPending;
  double               progress = 0.0;
  std::string          error_message;
};

/*
  Drives one leased job through the remaining stages. Each stage result
  is written under a lease re-check.

  DataIntegrity and InvalidState fail at once, ResourceExhausted gets one
  single-threaded retry, other errors retry with backoff.
*/
class PipelineRunner {
 public:
  PipelineRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<queue::JobQueue> queue,
                 storage::ObjectStorePtr objects, std::shared_ptr<MediaTranscoder> transcoder,
                 std::shared_ptr<util::ClockSource> clock, PipelineOptions options);

  JobOutcome Run(const queue::JobLease& lease);

  std::shared_ptr<util::EventChannel<StageEvent>::Subscription> Subscribe() {
    return events_.Subscribe();
  }

  void CloseEvents() {
    events_.Close();
  }

  const PipelineOptions& Options() const {
    return options_;
  }

 private:
  db::model::VideoRecord Load(const queue::JobLease& lease);
  db::model::VideoRecord Persist(const queue::JobLease& lease, db::model::VideoRecord next);

  void       Finish(const queue::JobLease& lease, db::model::VideoRecord next);
  JobOutcome Fail(const queue::JobLease& lease, const std::string& message);
  JobOutcome RetryOrFail(const queue::JobLease& lease, const std::string& error, bool reduced_concurrency);

  void Publish(const db::model::VideoRecord& video);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<queue::JobQueue>   queue_;
  storage::ObjectStorePtr            objects_;
  std::shared_ptr<MediaTranscoder>   transcoder_;
  std::shared_ptr<util::ClockSource> clock_;
  PipelineOptions                    options_;

  util::EventChannel<StageEvent> events_;
};

} // namespace vidpipe::pipeline
