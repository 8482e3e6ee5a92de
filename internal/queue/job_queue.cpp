#include "job_queue.hpp"

#include "internal/db/api/transaction_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace vidpipe::queue {

using observability::IntField;
using observability::StringField;

namespace {

JobLease ToLease(const db::model::JobRecord& job) {
  JobLease lease;
  lease.job_id              = job.job_id;
  lease.video_id            = job.video_id;
  lease.lease_id            = job.lease_id;
  lease.attempt             = job.attempt;
  lease.last_error          = job.last_error;
  lease.reduced_concurrency = job.reduced_concurrency;
  lease.expires_at_ms       = job.visibility_deadline_ms;
  return lease;
}

} // namespace

JobQueue::JobQueue(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::ClockSource> clock,
                   std::chrono::milliseconds default_lease)
    : repository_(std::move(repository)), clock_(std::move(clock)), default_lease_(default_lease) {
}

db::model::JobRecord JobQueue::Enqueue(db::Transaction& tx, const std::string& video_id) {
  db::model::JobRecord job;
  job.job_id                 = util::NewId();
  job.video_id               = video_id;
  job.enqueued_at_ms         = clock_->NowMs();
  job.visibility_deadline_ms = job.enqueued_at_ms;

  db::ThrowIfError(repository_->InsertJob(tx, job), "enqueue job");
  return job;
}

std::optional<JobLease> JobQueue::Dequeue() {
  return Dequeue(default_lease_);
}

std::optional<JobLease> JobQueue::Dequeue(std::chrono::milliseconds lease_duration) {
  auto claimed = db::RunInTransaction(*repository_, [&](db::Transaction& tx) -> std::optional<db::model::JobRecord> {
    const uint64_t now = clock_->NowMs();
    auto           job = repository_->NextVisibleJob(tx, now);
    if (!job) return std::nullopt;

    job->attempt += 1;
    job->lease_id               = util::NewId();
    job->visibility_deadline_ms = now + static_cast<uint64_t>(lease_duration.count());

    db::ThrowIfError(repository_->UpdateJob(tx, *job), "claim job");
    return job;
  });

  if (!claimed) return std::nullopt;

  VIDPIPE_LOG_DEBUG("job claimed", {StringField("job_id", claimed->job_id), StringField("video_id", claimed->video_id),
                                     IntField("attempt", claimed->attempt)});
  return ToLease(*claimed);
}

db::model::JobRecord JobQueue::VerifyLease(db::Transaction& tx, const JobLease& lease) const {
  auto job = repository_->GetJob(tx, lease.job_id);
  if (!job) {
    throw util::LeaseConflict("job no longer exists: " + lease.job_id);
  }
  if (job->lease_id != lease.lease_id) {
    throw util::LeaseConflict("lease superseded for job " + lease.job_id);
  }
  if (job->visibility_deadline_ms <= clock_->NowMs()) {
    throw util::LeaseConflict("lease expired for job " + lease.job_id);
  }
  return *job;
}

void JobQueue::Ack(const JobLease& lease) {
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) { AckIn(tx, lease); });
}

void JobQueue::AckIn(db::Transaction& tx, const JobLease& lease) {
  VerifyLease(tx, lease);
  db::ThrowIfError(repository_->DeleteJob(tx, lease.job_id), "ack job");
}

void JobQueue::Nack(const JobLease& lease) {
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto job = VerifyLease(tx, lease);
    job.lease_id.clear();
    job.visibility_deadline_ms = clock_->NowMs();
    db::ThrowIfError(repository_->UpdateJob(tx, job), "nack job");
  });
}

JobLease JobQueue::ExtendLease(const JobLease& lease, std::chrono::milliseconds duration) {
  auto job = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto current                   = VerifyLease(tx, lease);
    current.visibility_deadline_ms = clock_->NowMs() + static_cast<uint64_t>(duration.count());
    db::ThrowIfError(repository_->UpdateJob(tx, current), "extend lease");
    return current;
  });
  return ToLease(job);
}

void JobQueue::Retry(const JobLease& lease, std::chrono::milliseconds delay, const std::string& error,
                     bool reduced_concurrency) {
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) { RetryIn(tx, lease, delay, error, reduced_concurrency); });
}

void JobQueue::RetryIn(db::Transaction& tx, const JobLease& lease, std::chrono::milliseconds delay,
                       const std::string& error, bool reduced_concurrency) {
  auto job = VerifyLease(tx, lease);
  job.lease_id.clear();
  job.last_error             = error;
  job.reduced_concurrency    = reduced_concurrency;
  job.visibility_deadline_ms = clock_->NowMs() + static_cast<uint64_t>(delay.count());
  db::ThrowIfError(repository_->UpdateJob(tx, job), "retry job");
}

bool JobQueue::CancelQueued(db::Transaction& tx, const std::string& video_id) {
  auto job = repository_->GetJobByVideo(tx, video_id);
  if (!job) return false;

  if (!job->lease_id.empty() && job->visibility_deadline_ms > clock_->NowMs()) {
    throw util::LeaseConflict("video " + video_id + " is being processed");
  }

  db::ThrowIfError(repository_->DeleteJob(tx, job->job_id), "cancel job");
  return true;
}

uint64_t JobQueue::Depth() {
  return db::ReadInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->CountJobs(tx); });
}

} // namespace vidpipe::queue
