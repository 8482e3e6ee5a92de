#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::worker {

using observability::IntField;
using observability::StringField;

WorkerOptions WorkerOptions::FromConfig(const vidpipe::runtime::config::RuntimeConfig& config) {
  WorkerOptions options;
  options.threads            = config.workers().has_threads() ? config.workers().threads() : 2;
  options.poll_interval      = std::chrono::milliseconds(config.queue().poll_interval_ms());
  options.lease_duration     = std::chrono::milliseconds(config.queue().lease_duration_ms());
  options.heartbeat_interval = config.workers().heartbeat_interval_ms() > 0
                                   ? std::chrono::milliseconds(config.workers().heartbeat_interval_ms())
                                   : options.lease_duration / 3;
  options.stage_timeout = std::chrono::milliseconds(config.pipeline().stage_timeout_ms());
  return options;
}

WorkerPool::WorkerPool(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<pipeline::PipelineRunner> runner,
                       WorkerOptions options)
    : queue_(std::move(queue)), runner_(std::move(runner)), options_(options) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  for (uint32_t i = 0; i < options_.threads; ++i) {
    threads_.emplace_back(&WorkerPool::Loop, this, i);
  }
  VIDPIPE_LOG_INFO("worker pool started", {IntField("threads", options_.threads),
                                           IntField("lease_ms", options_.lease_duration.count())});
}

void WorkerPool::Stop() {
  {
    std::lock_guard lock(stop_mutex_);
    if (!running_.exchange(false) && threads_.empty()) return;
  }
  stop_cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
  VIDPIPE_LOG_INFO("worker pool stopped", {IntField("jobs_executed", static_cast<int64_t>(executed_.load()))});
}

bool WorkerPool::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, duration, [this] { return !running_.load(); });
}

std::optional<pipeline::JobOutcome> WorkerPool::RunOnce() {
  auto lease = queue_->Dequeue(options_.lease_duration);
  if (!lease) return std::nullopt;
  return Execute(*lease);
}

void WorkerPool::Loop(uint32_t index) {
  while (running_) {
    std::optional<queue::JobLease> lease;
    try {
      observability::Metrics::Instance().ObserveQueueDepth(queue_->Depth());
      lease = queue_->Dequeue(options_.lease_duration);
    } catch (const std::exception& e) {
      VIDPIPE_LOG_ERROR("dequeue failed", {IntField("worker", index), StringField("error", e.what())});
    }

    if (!lease) {
      if (!WaitFor(options_.poll_interval)) break;
      continue;
    }

    try {
      Execute(*lease);
    } catch (const std::exception& e) {
      // outcome could not be recorded; the lease expires and the job is redelivered
      VIDPIPE_LOG_ERROR("job execution aborted", {IntField("worker", index), StringField("job_id", lease->job_id),
                                                   StringField("video_id", lease->video_id),
                                                   StringField("error", e.what())});
    }
  }
}

pipeline::JobOutcome WorkerPool::Execute(const queue::JobLease& lease) {
  std::atomic<bool>       done{false};
  std::mutex              mutex;
  std::condition_variable cv;

  std::thread heartbeat;
  if (options_.heartbeat_interval.count() > 0) {
    heartbeat = std::thread(&WorkerPool::Heartbeat, this, lease, runner_->Subscribe(), std::ref(done), std::ref(mutex),
                            std::ref(cv));
  }

  struct StopHeartbeat {
    std::atomic<bool>&       done;
    std::mutex&              mutex;
    std::condition_variable& cv;
    std::thread&             thread;

    ~StopHeartbeat() {
      {
        std::lock_guard lock(mutex);
        done = true;
      }
      cv.notify_all();
      if (thread.joinable()) thread.join();
    }
  } stop{done, mutex, cv, heartbeat};

  VIDPIPE_LOG_INFO("job started", {StringField("job_id", lease.job_id), StringField("video_id", lease.video_id),
                                   IntField("attempt", lease.attempt)});

  const auto outcome = runner_->Run(lease);
  executed_++;

  VIDPIPE_LOG_INFO("job finished", {StringField("job_id", lease.job_id), StringField("video_id", lease.video_id),
                                    StringField("outcome", pipeline::ToString(outcome))});
  return outcome;
}

void WorkerPool::Heartbeat(queue::JobLease lease,
                           std::shared_ptr<util::EventChannel<pipeline::StageEvent>::Subscription> progress,
                           std::atomic<bool>& done, std::mutex& mutex, std::condition_variable& cv) {
  auto last_progress = std::chrono::steady_clock::now();
  for (;;) {
    {
      std::unique_lock lock(mutex);
      if (cv.wait_for(lock, options_.heartbeat_interval, [&] { return done.load(); })) return;
    }

    const auto now = std::chrono::steady_clock::now();
    for (const auto& event : progress->Drain()) {
      if (event.video_id == lease.video_id) last_progress = now;
    }
    if (options_.stage_timeout.count() > 0 && now - last_progress > options_.stage_timeout) {
      VIDPIPE_LOG_WARN("job stalled, letting its lease lapse",
                       {StringField("job_id", lease.job_id), StringField("video_id", lease.video_id),
                        IntField("stage_timeout_ms", options_.stage_timeout.count())});
      return;
    }

    try {
      lease = queue_->ExtendLease(lease, options_.lease_duration);
    } catch (const util::LeaseConflict& e) {
      VIDPIPE_LOG_WARN("heartbeat lost lease", {StringField("job_id", lease.job_id), StringField("error", e.what())});
      return;
    } catch (const std::exception& e) {
      VIDPIPE_LOG_WARN("heartbeat failed", {StringField("job_id", lease.job_id), StringField("error", e.what())});
    }
  }
}

} // namespace vidpipe::worker
