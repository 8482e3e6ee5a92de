#pragma once

#include <cstdint>
#include <string>

namespace vidpipe::db::model {

/*
  Queued processing job.

  visibility_deadline_ms doubles as lease expiry: a job is claimable
  once the deadline has passed. lease_id is the fencing token of the
  most recent claim; it is empty while the job waits in the queue.
*/
struct JobRecord {
  std::string job_id;
  std::string video_id;

  // executions started so far, incremented on every claim
  uint32_t attempt = 0;

  uint64_t enqueued_at_ms         = 0;
  uint64_t visibility_deadline_ms = 0;

  std::string lease_id;
  std::string last_error;

  // set after a resource-exhaustion failure
  bool reduced_concurrency = false;
};

} // namespace vidpipe::db::model
