#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/queue/job_queue.hpp"

namespace vidpipe::worker {

struct WorkerOptions {
  uint32_t                  threads = 2;
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds heartbeat_interval{10000};
  std::chrono::milliseconds lease_duration{30000};
  // heartbeats stop once a job publishes no stage snapshot for this long; zero disables
  std::chrono::milliseconds stage_timeout{0};

  static WorkerOptions FromConfig(const vidpipe::runtime::config::RuntimeConfig& config);
};

/*
  While a job runs, a heartbeat thread extends its lease. A stalled job
  stops being extended, so its lease lapses and another worker takes it.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<pipeline::PipelineRunner> runner,
             WorkerOptions options);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // Claims and runs at most one job on the calling thread.
  std::optional<pipeline::JobOutcome> RunOnce();

  uint64_t JobsExecuted() const {
    return executed_.load();
  }

 private:
  void                Loop(uint32_t index);
  pipeline::JobOutcome Execute(const queue::JobLease& lease);
  void                Heartbeat(queue::JobLease lease,
                                std::shared_ptr<util::EventChannel<pipeline::StageEvent>::Subscription> progress,
                                std::atomic<bool>& done, std::mutex& mutex, std::condition_variable& cv);

  // false once Stop() was requested
  bool WaitFor(std::chrono::milliseconds duration);

  std::shared_ptr<queue::JobQueue>          queue_;
  std::shared_ptr<pipeline::PipelineRunner> runner_;
  WorkerOptions                             options_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
  std::atomic<uint64_t>    executed_{0};

  std::mutex              stop_mutex_;
  std::condition_variable stop_cv_;
};

} // namespace vidpipe::worker
