#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "job_lease.hpp"

namespace vidpipe::queue {

// At-least-once queue over the repository; an unacked lease becomes visible again at its deadline.
class JobQueue {
 public:
  JobQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock,
           std::chrono::milliseconds default_lease);

  // Runs inside the caller's transaction so the job commits with its video.
  db::model::JobRecord Enqueue(db::Transaction& tx, const std::string& video_id);

  std::optional<JobLease> Dequeue();
  std::optional<JobLease> Dequeue(std::chrono::milliseconds lease_duration);

  // Deletes the job. Throws LeaseConflict if the lease is stale.
  void Ack(const JobLease& lease);

  // Releases the lease, job is visible again immediately.
  void Nack(const JobLease& lease);

  // Returns the lease with its new expiry. Throws LeaseConflict if stale.
  JobLease ExtendLease(const JobLease& lease, std::chrono::milliseconds duration);

  // Releases the lease and hides the job for `delay`.
  void Retry(const JobLease& lease, std::chrono::milliseconds delay, const std::string& error,
             bool reduced_concurrency);

  /*
    Fenced access for writers holding a lease. Must be called inside the
    same transaction as the write it protects.
  */
  db::model::JobRecord VerifyLease(db::Transaction& tx, const JobLease& lease) const;

  // Ack inside a caller transaction (terminal video write + job removal).
  void AckIn(db::Transaction& tx, const JobLease& lease);

  // Retry inside a caller transaction.
  void RetryIn(db::Transaction& tx, const JobLease& lease, std::chrono::milliseconds delay,
               const std::string& error, bool reduced_concurrency);

  /*
    Removes a waiting job for video_id. Returns false when no job exists.
    Throws LeaseConflict when a worker currently holds an unexpired lease.
  */
  bool CancelQueued(db::Transaction& tx, const std::string& video_id);

  uint64_t Depth();

  std::chrono::milliseconds DefaultLease() const {
    return default_lease_;
  }

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<util::ClockSource> clock_;
  std::chrono::milliseconds          default_lease_;
};

} // namespace vidpipe::queue
