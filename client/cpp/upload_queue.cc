#include "client/cpp/upload_queue.h"

#include <algorithm>
#include <filesystem>
#include <iterator>

#include "internal/util/uuid.hpp"

namespace vidpipe::client {

const char* ToString(UploadStatus status) {
  switch (status) {
    case UploadStatus::kQueued:
      return "queued";
    case UploadStatus::kUploading:
      return "uploading";
    case UploadStatus::kPaused:
      return "paused";
    case UploadStatus::kCompleted:
      return "completed";
    case UploadStatus::kFailed:
      return "failed";
    case UploadStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

UploadQueueManager::UploadQueueManager(std::shared_ptr<ResumableEndpoint> endpoint, UploadQueueOptions options)
    : endpoint_(std::move(endpoint)), options_(std::move(options)) {
  if (options_.max_concurrent == 0) options_.max_concurrent = 1;
}

UploadQueueManager::~UploadQueueManager() {
  Stop();
}

void UploadQueueManager::Start() {
  std::lock_guard lock(mutex_);
  if (!threads_.empty()) return;
  stopping_ = false;
  for (uint32_t i = 0; i < options_.max_concurrent; ++i) {
    threads_.emplace_back(&UploadQueueManager::Loop, this);
  }
}

void UploadQueueManager::Stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    for (const auto& id : active_) {
      tasks_.at(id).control->RequestPause();
    }
    threads.swap(threads_);
  }
  cv_.notify_all();
  for (auto& thread : threads) {
    if (thread.joinable()) thread.join();
  }
  events_.Close();
}

// ---------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------

arrow::Result<std::string> UploadQueueManager::Enqueue(const UploadRequest& request) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(request.source_path, ec);
  if (ec) {
    return arrow::Status::IOError("cannot stat ", request.source_path, ": ", ec.message());
  }

  Entry entry;
  entry.task.id          = request.upload_id.empty() ? util::NewId() : request.upload_id;
  entry.task.source_path = request.source_path;
  entry.task.filename =
      request.filename.empty() ? std::filesystem::path(request.source_path).filename().string() : request.filename;
  entry.task.owner_id    = request.owner_id;
  entry.task.total_bytes = size;
  entry.task.status      = UploadStatus::kQueued;

  const auto id = entry.task.id;
  {
    std::lock_guard lock(mutex_);
    if (tasks_.count(id) > 0) {
      return arrow::Status::AlreadyExists("upload task ", id, " already queued");
    }
    entry.sequence = next_sequence_++;
    auto& stored   = tasks_.emplace(id, std::move(entry)).first->second;
    ready_.push_back(id);
    PublishLocked(stored);
  }
  cv_.notify_all();
  return id;
}

arrow::Status UploadQueueManager::Pause(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(task_id);
  if (it == tasks_.end()) return arrow::Status::KeyError("unknown upload task ", task_id);

  auto& entry = it->second;
  switch (entry.task.status) {
    case UploadStatus::kQueued:
      DropPendingLocked(task_id);
      entry.task.status       = UploadStatus::kPaused;
      entry.paused_by_network = false;
      PublishLocked(entry);
      return arrow::Status::OK();
    case UploadStatus::kUploading:
      entry.paused_by_network = false;
      entry.control->RequestPause();
      return arrow::Status::OK();
    case UploadStatus::kPaused:
      entry.paused_by_network = false;
      return arrow::Status::OK();
    default:
      return arrow::Status::Invalid("cannot pause upload in state ", ToString(entry.task.status));
  }
}

arrow::Status UploadQueueManager::Resume(const std::string& task_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it == tasks_.end()) return arrow::Status::KeyError("unknown upload task ", task_id);

    auto& entry = it->second;
    if (entry.task.status == UploadStatus::kUploading) {
      // pause not yet observed by the transfer
      if (!entry.cancel_requested) entry.control->Reset();
      return arrow::Status::OK();
    }
    if (entry.task.status != UploadStatus::kPaused) {
      return arrow::Status::Invalid("cannot resume upload in state ", ToString(entry.task.status));
    }
    entry.task.status       = UploadStatus::kQueued;
    entry.paused_by_network = false;
    ready_.push_back(task_id);
    PublishLocked(entry);
  }
  cv_.notify_all();
  return arrow::Status::OK();
}

arrow::Status UploadQueueManager::Cancel(const std::string& task_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it == tasks_.end()) return arrow::Status::KeyError("unknown upload task ", task_id);

    auto& entry = it->second;
    switch (entry.task.status) {
      case UploadStatus::kUploading:
        entry.cancel_requested = true;
        entry.control->RequestCancel();
        return arrow::Status::OK();
      case UploadStatus::kQueued:
      case UploadStatus::kPaused:
      case UploadStatus::kFailed:
        DropPendingLocked(task_id);
        entry.task.status = UploadStatus::kCancelled;
        PublishLocked(entry);
        tasks_.erase(it);
        break;
      default:
        return arrow::Status::Invalid("cannot cancel upload in state ", ToString(entry.task.status));
    }
  }
  cv_.notify_all();
  DiscardRemote(task_id);
  return arrow::Status::OK();
}

arrow::Status UploadQueueManager::Retry(const std::string& task_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(task_id);
    if (it == tasks_.end()) return arrow::Status::KeyError("unknown upload task ", task_id);

    auto& entry = it->second;
    if (entry.task.status != UploadStatus::kFailed) {
      return arrow::Status::Invalid("only failed uploads can be retried, task is ", ToString(entry.task.status));
    }
    entry.task.status      = UploadStatus::kQueued;
    entry.task.retry_count = 0;
    entry.task.last_error.clear();
    ready_.push_back(task_id);
    PublishLocked(entry);
  }
  cv_.notify_all();
  return arrow::Status::OK();
}

void UploadQueueManager::SetNetworkAvailable(bool available) {
  {
    std::lock_guard lock(mutex_);
    if (network_ == available) return;
    network_ = available;

    if (!available) {
      for (const auto& id : active_) {
        auto& entry             = tasks_.at(id);
        entry.paused_by_network = true;
        entry.control->RequestPause();
      }
    } else {
      // every paused task comes back, ahead of fresh work and in admission order
      std::vector<Entry*> resumed;
      for (auto& [id, entry] : tasks_) {
        if (entry.task.status == UploadStatus::kPaused) resumed.push_back(&entry);
      }
      std::sort(resumed.begin(), resumed.end(), [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });
      for (auto it = resumed.rbegin(); it != resumed.rend(); ++it) {
        auto* entry              = *it;
        entry->task.status       = UploadStatus::kQueued;
        entry->paused_by_network = false;
        ready_.push_front(entry->task.id);
        PublishLocked(*entry);
      }
    }
  }
  cv_.notify_all();
}

std::optional<UploadTask> UploadQueueManager::Get(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second.task;
}

std::vector<UploadTask> UploadQueueManager::List() const {
  std::lock_guard         lock(mutex_);
  std::vector<UploadTask> out;
  out.reserve(tasks_.size());
  for (const auto& [id, entry] : tasks_) out.push_back(entry.task);
  return out;
}

size_t UploadQueueManager::ActiveCount() const {
  std::lock_guard lock(mutex_);
  return active_.size();
}

size_t UploadQueueManager::PeakActiveCount() const {
  std::lock_guard lock(mutex_);
  return peak_active_;
}

bool UploadQueueManager::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return IdleLocked(); });
}

// ---------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------

bool UploadQueueManager::IdleLocked() const {
  if (!active_.empty()) return false;
  for (const auto& [id, entry] : tasks_) {
    if (entry.task.status == UploadStatus::kQueued) return false;
  }
  return true;
}

void UploadQueueManager::PromoteDueLocked(SteadyClock::time_point now) {
  while (!delayed_.empty() && delayed_.begin()->first <= now) {
    ready_.push_back(delayed_.begin()->second);
    delayed_.erase(delayed_.begin());
  }
}

void UploadQueueManager::DropPendingLocked(const std::string& task_id) {
  ready_.erase(std::remove(ready_.begin(), ready_.end(), task_id), ready_.end());
  for (auto it = delayed_.begin(); it != delayed_.end();) {
    it = it->second == task_id ? delayed_.erase(it) : std::next(it);
  }
}

void UploadQueueManager::PublishLocked(const Entry& entry, std::string message) {
  UploadEvent event;
  event.task_id           = entry.task.id;
  event.status            = entry.task.status;
  event.bytes_transferred = entry.task.bytes_transferred;
  event.total_bytes       = entry.task.total_bytes;
  event.video_id          = entry.task.video_id;
  event.message           = message.empty() ? entry.task.last_error : std::move(message);
  events_.Publish(event);
}

void UploadQueueManager::Loop() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    PromoteDueLocked(SteadyClock::now());

    std::string next;
    while (network_ && !ready_.empty()) {
      auto id = ready_.front();
      ready_.pop_front();
      auto it = tasks_.find(id);
      // stale entry: paused, cancelled or already picked up
      if (it != tasks_.end() && it->second.task.status == UploadStatus::kQueued && active_.count(id) == 0) {
        next = std::move(id);
        break;
      }
    }

    if (next.empty()) {
      if (!delayed_.empty()) {
        cv_.wait_until(lock, delayed_.begin()->first);
      } else {
        cv_.wait(lock);
      }
      continue;
    }

    auto& entry       = tasks_.at(next);
    entry.task.status = UploadStatus::kUploading;
    entry.control->Reset();
    entry.cancel_requested = false;
    active_.insert(next);
    peak_active_ = std::max(peak_active_, active_.size());
    PublishLocked(entry);

    lock.unlock();
    Execute(next);
    lock.lock();
  }
}

void UploadQueueManager::Execute(const std::string& task_id) {
  TransferSpec                     spec;
  std::shared_ptr<TransferControl> control;
  uint64_t                         start_offset = 0;
  {
    std::lock_guard lock(mutex_);
    const auto&     entry = tasks_.at(task_id);
    spec.upload_id        = entry.task.id;
    spec.owner_id         = entry.task.owner_id;
    spec.source_path      = entry.task.source_path;
    spec.filename         = entry.task.filename;
    spec.total_bytes      = entry.task.total_bytes;
    control               = entry.control;
    start_offset          = entry.task.bytes_transferred;
  }

  ChunkTransferAdapter adapter(endpoint_, options_.chunk_size);

  TransferResult result;
  auto           opened = adapter.Open(spec);
  if (!opened.ok()) {
    result.code             = opened.IsInvalid() ? TransferCode::kRejected : TransferCode::kInterrupted;
    result.confirmed_offset = start_offset;
    result.message          = opened.ToString();
  } else {
    auto last_tick  = SteadyClock::now();
    auto last_bytes = adapter.CurrentOffset();

    result = adapter.SendFrom(start_offset, *control, [&](uint64_t confirmed, uint64_t total) {
      const auto now     = SteadyClock::now();
      const auto seconds = std::chrono::duration<double>(now - last_tick).count();

      std::lock_guard lock(mutex_);
      auto&           entry = tasks_.at(task_id);
      if (seconds > 0 && confirmed >= last_bytes) {
        const double sample     = static_cast<double>(confirmed - last_bytes) / seconds;
        entry.task.speed_sample = entry.task.speed_sample == 0.0 ? sample : 0.7 * entry.task.speed_sample + 0.3 * sample;
      }
      entry.task.bytes_transferred = confirmed;
      entry.task.total_bytes       = total;
      last_tick                    = now;
      last_bytes                   = confirmed;
      PublishLocked(entry);
    });
  }

  Settle(task_id, result);
}

void UploadQueueManager::Settle(const std::string& task_id, const TransferResult& result) {
  bool discard = false;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = tasks_.at(task_id);
    active_.erase(task_id);

    entry.task.bytes_transferred = std::max(entry.task.bytes_transferred, result.confirmed_offset);

    switch (result.code) {
      case TransferCode::kCompleted:
        entry.task.status            = UploadStatus::kCompleted;
        entry.task.bytes_transferred = entry.task.total_bytes;
        entry.task.video_id          = result.video_id;
        entry.task.last_error.clear();
        break;

      case TransferCode::kCancelled:
        entry.task.status = UploadStatus::kCancelled;
        discard           = true;
        break;

      case TransferCode::kPaused:
        if (entry.cancel_requested) {
          entry.task.status = UploadStatus::kCancelled;
          discard           = true;
        } else if (entry.paused_by_network && network_ && !stopping_) {
          // network came back before the pause landed
          entry.task.status       = UploadStatus::kQueued;
          entry.paused_by_network = false;
          ready_.push_front(task_id);
        } else {
          entry.task.status = stopping_ && !entry.paused_by_network ? UploadStatus::kQueued : UploadStatus::kPaused;
        }
        break;

      case TransferCode::kRejected:
        entry.task.status     = UploadStatus::kFailed;
        entry.task.last_error = result.message;
        break;

      case TransferCode::kInterrupted:
        entry.task.last_error = result.message;
        if (entry.cancel_requested) {
          entry.task.status = UploadStatus::kCancelled;
          discard           = true;
        } else if (!network_) {
          // the network drop hit mid-chunk; keep progress and wait for it
          entry.task.status       = UploadStatus::kPaused;
          entry.paused_by_network = true;
        } else if (options_.retry.ShouldRetry(entry.task.retry_count)) {
          const auto delay = options_.retry.Delay(entry.task.retry_count);
          entry.task.retry_count++;
          entry.task.status = UploadStatus::kQueued;
          if (delay.count() == 0) {
            ready_.push_back(task_id);
          } else {
            delayed_.emplace(SteadyClock::now() + delay, task_id);
          }
        } else {
          entry.task.status = UploadStatus::kFailed;
        }
        break;
    }

    PublishLocked(entry, result.message);
    if (entry.task.status == UploadStatus::kCompleted || entry.task.status == UploadStatus::kCancelled) {
      tasks_.erase(task_id);
    }
  }
  cv_.notify_all();

  if (discard) DiscardRemote(task_id);
}

void UploadQueueManager::DiscardRemote(const std::string& task_id) {
  auto status = endpoint_->CancelUpload(task_id);
  if (status.ok() || status.IsKeyError()) return;

  // the task is already gone from tasks_
  UploadEvent event;
  event.task_id = task_id;
  event.status  = UploadStatus::kCancelled;
  event.message = "server did not discard partial upload: " + status.ToString();
  events_.Publish(event);
}

} // namespace vidpipe::client
