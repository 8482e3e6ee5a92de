#pragma once

#include <cstdint>
#include <string>

namespace vidpipe::queue {

// lease_id fences every ack, extend and video write against the job row.
struct JobLease {
  std::string job_id;
  std::string video_id;
  std::string lease_id;

  // 1 on first delivery
  uint32_t attempt = 0;

  std::string last_error;
  bool        reduced_concurrency = false;

  uint64_t expires_at_ms = 0;
};

} // namespace vidpipe::queue
