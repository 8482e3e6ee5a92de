#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "client/cpp/chunk_transfer.h"
#include "client/cpp/resumable_endpoint.h"
#include "internal/util/event_channel.hpp"
#include "internal/util/retry_policy.hpp"

namespace vidpipe::client {

enum class UploadStatus {
  kQueued,
  kUploading,
  kPaused,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* ToString(UploadStatus status);

struct UploadRequest {
  std::string source_path;
  std::string owner_id;
  // defaults to the source file name
  std::string filename;
  // defaults to a fresh id
  std::string upload_id;
};

struct UploadTask {
  std::string  id;
  std::string  source_path;
  std::string  filename;
  std::string  owner_id;
  uint64_t     total_bytes       = 0;
  uint64_t     bytes_transferred = 0;
  UploadStatus status            = UploadStatus::kQueued;
  uint32_t     retry_count       = 0;
  double       speed_sample      = 0.0; // bytes per second
  std::string  video_id;
  std::string  last_error;
};

struct UploadEvent {
  std::string  task_id;
  UploadStatus status            = UploadStatus::kQueued;
  uint64_t     bytes_transferred = 0;
  uint64_t     total_bytes       = 0;
  std::string  video_id;
  std::string  message;
};

struct UploadQueueOptions {
  uint32_t          max_concurrent = 2;
  uint64_t          chunk_size     = kDefaultChunkSize;
  util::RetryPolicy retry          = util::RetryPolicy::UploadDefault();
};

// FIFO scheduler, at most max_concurrent transfers. Completed and
// cancelled tasks are dropped once their final UploadEvent is published.
class UploadQueueManager {
 public:
  UploadQueueManager(std::shared_ptr<ResumableEndpoint> endpoint, UploadQueueOptions options = {});
  ~UploadQueueManager();

  UploadQueueManager(const UploadQueueManager&)            = delete;
  UploadQueueManager& operator=(const UploadQueueManager&) = delete;

  void Start();
  void Stop();

  arrow::Result<std::string> Enqueue(const UploadRequest& request);

  arrow::Status Pause(const std::string& task_id);
  arrow::Status Resume(const std::string& task_id);
  arrow::Status Cancel(const std::string& task_id);
  // Manual retry of a failed task, resets the retry count.
  arrow::Status Retry(const std::string& task_id);

  void SetNetworkAvailable(bool available);

  std::optional<UploadTask> Get(const std::string& task_id) const;
  std::vector<UploadTask>   List() const;

  size_t ActiveCount() const;
  size_t PeakActiveCount() const;

  // Blocks until no task is queued, waiting for retry or active.
  bool WaitIdle(std::chrono::milliseconds timeout);

  std::shared_ptr<util::EventChannel<UploadEvent>::Subscription> Subscribe() {
    return events_.Subscribe();
  }

 private:
  struct Entry {
    UploadTask                       task;
    std::shared_ptr<TransferControl> control = std::make_shared<TransferControl>();
    bool                             paused_by_network = false;
    bool                             cancel_requested  = false;
    uint64_t                         sequence          = 0; // admission order
  };

  using SteadyClock = std::chrono::steady_clock;

  void Loop();
  void Execute(const std::string& task_id);
  void Settle(const std::string& task_id, const TransferResult& result);

  // callers hold mutex_
  void PromoteDueLocked(SteadyClock::time_point now);
  void PublishLocked(const Entry& entry, std::string message = {});
  void DropPendingLocked(const std::string& task_id);
  bool IdleLocked() const;

  void DiscardRemote(const std::string& task_id);

  std::shared_ptr<ResumableEndpoint> endpoint_;
  UploadQueueOptions                 options_;

  mutable std::mutex                                          mutex_;
  std::condition_variable                                     cv_;
  std::unordered_map<std::string, Entry>                      tasks_;
  std::deque<std::string>                                     ready_;
  std::multimap<SteadyClock::time_point, std::string>         delayed_;
  std::set<std::string>                                       active_;
  size_t                                                      peak_active_ = 0;
  uint64_t                                                    next_sequence_ = 0;
  bool                                                        network_     = true;
  bool                                                        stopping_    = false;

  std::vector<std::thread> threads_;

  util::EventChannel<UploadEvent> events_;
};

} // namespace vidpipe::client
