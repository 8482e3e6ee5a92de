#include "client/cpp/upload_queue.h"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "tests/support/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using vidpipe::client::UploadEvent;
using vidpipe::client::UploadQueueManager;
using vidpipe::client::UploadQueueOptions;
using vidpipe::client::UploadRequest;
using vidpipe::client::UploadStatus;
using vidpipe::testing::Eventually;
using vidpipe::testing::Harness;
using vidpipe::testing::InProcessEndpoint;

struct Fixture {
  explicit Fixture(const std::string& name)
      : h(name), endpoint(std::make_shared<InProcessEndpoint>(h.ingestion)) {
  }

  std::string File(const std::string& name, size_t size) {
    const auto path = h.root / name;
    vidpipe::testing::WriteFile(path, vidpipe::testing::Mp4Bytes(size));
    return path.string();
  }

  Harness                            h;
  std::shared_ptr<InProcessEndpoint> endpoint;
};

UploadQueueOptions FastOptions(uint32_t max_concurrent, uint64_t chunk_size) {
  UploadQueueOptions options;
  options.max_concurrent = max_concurrent;
  options.chunk_size     = chunk_size;
  options.retry          = vidpipe::util::RetryPolicy{3, {0ms, 10ms}};
  return options;
}

std::string MustEnqueue(UploadQueueManager& manager, const std::string& path, const std::string& id = {}) {
  auto result = manager.Enqueue(UploadRequest{path, "owner-1", {}, id});
  assert(result.ok());
  return *result;
}

// Finished tasks leave the manager, so their outcome is read off the event stream.
class EventLog {
 public:
  explicit EventLog(UploadQueueManager& manager) : subscription_(manager.Subscribe()) {}

  const std::vector<UploadEvent>& All() {
    auto fresh = subscription_->Drain();
    seen_.insert(seen_.end(), fresh.begin(), fresh.end());
    return seen_;
  }

  std::optional<UploadEvent> Last(const std::string& task_id) {
    const auto& events = All();
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
      if (it->task_id == task_id) return *it;
    }
    return std::nullopt;
  }

  bool Reached(const std::string& task_id, UploadStatus status) {
    return Eventually([&] {
      auto last = Last(task_id);
      return last && last->status == status;
    });
  }

  size_t FirstIndex(const std::string& task_id, UploadStatus status) {
    const auto& events = All();
    for (size_t i = 0; i < events.size(); ++i) {
      if (events[i].task_id == task_id && events[i].status == status) return i;
    }
    return events.size();
  }

  // automatic retries republish kQueued with the failure message
  size_t Requeues(const std::string& task_id) {
    const auto& events = All();
    return std::count_if(events.begin(), events.end(), [&](const UploadEvent& e) {
      return e.task_id == task_id && e.status == UploadStatus::kQueued && !e.message.empty();
    });
  }

 private:
  std::shared_ptr<vidpipe::util::EventChannel<UploadEvent>::Subscription> subscription_;
  std::vector<UploadEvent>                                                 seen_;
};

void AssertCompleted(EventLog& log, const std::string& task_id, uint64_t total) {
  assert(log.Reached(task_id, UploadStatus::kCompleted));
  auto last = log.Last(task_id);
  assert(last->bytes_transferred == total);
  assert(!last->video_id.empty());
}

void TestThirdUploadWaitsForAFreeSlot() {
  Fixture f("queue_ceiling");
  f.endpoint->append_delay_ms = 5;

  UploadQueueManager manager(f.endpoint, FastOptions(2, 1000));
  EventLog           log(manager);

  const auto a = MustEnqueue(manager, f.File("a.mp4", 6000));
  const auto b = MustEnqueue(manager, f.File("b.mp4", 6000));
  const auto c = MustEnqueue(manager, f.File("c.mp4", 6000));
  assert(manager.Get(c)->status == UploadStatus::kQueued);

  manager.Start();
  assert(manager.WaitIdle(10s));

  assert(manager.PeakActiveCount() == 2);
  for (const auto& id : {a, b, c}) {
    AssertCompleted(log, id, 6000);
    assert(!manager.Get(id).has_value());
  }
  assert(manager.List().empty());

  const auto c_started     = log.FirstIndex(c, UploadStatus::kUploading);
  const auto first_release = std::min(log.FirstIndex(a, UploadStatus::kCompleted), log.FirstIndex(b, UploadStatus::kCompleted));
  assert(c_started < log.All().size());
  assert(first_release < c_started);
  assert(f.h.queue->Depth() == 3);
  manager.Stop();
}

void TestNetworkToggleResumesUserPausedUploadInPlace() {
  Fixture            f("queue_pause");
  UploadQueueManager manager(f.endpoint, FastOptions(1, 1000));
  EventLog           log(manager);

  std::string           id;
  std::mutex            mutex;
  std::vector<uint64_t> offsets;
  std::atomic<bool>     paused{false};
  f.endpoint->on_append = [&](uint64_t offset) {
    {
      std::lock_guard lock(mutex);
      offsets.push_back(offset);
    }
    if (offset == 4000 && !paused.exchange(true)) (void)manager.Pause(id);
  };

  id = MustEnqueue(manager, f.File("clip.mp4", 10'000), "pause-me");
  manager.Start();

  assert(Eventually([&] { return manager.Get(id)->status == UploadStatus::kPaused; }));
  const auto paused_at = manager.Get(id)->bytes_transferred;
  assert(paused_at >= 4000);
  assert(paused_at < 10'000);

  size_t sent_before_toggle = 0;
  {
    std::lock_guard lock(mutex);
    sent_before_toggle = offsets.size();
  }

  // no explicit Resume: regaining the network picks the paused task back up
  manager.SetNetworkAvailable(false);
  manager.SetNetworkAvailable(true);
  AssertCompleted(log, id, 10'000);

  std::lock_guard lock(mutex);
  assert(offsets.size() > sent_before_toggle);
  for (size_t i = sent_before_toggle; i < offsets.size(); ++i) assert(offsets[i] >= paused_at);
  assert(std::is_sorted(offsets.begin(), offsets.end()));
  assert(std::adjacent_find(offsets.begin(), offsets.end()) == offsets.end());
  assert(f.endpoint->bytes_received == 10'000);
  assert(!manager.Get(id).has_value());
  manager.Stop();
}

void TestPauseResumeOfQueuedTaskKeepsBackoff() {
  Fixture f("queue_backoff");

  UploadQueueOptions options = FastOptions(1, 1000);
  options.retry              = vidpipe::util::RetryPolicy{3, {300ms}};
  UploadQueueManager manager(f.endpoint, options);
  EventLog           log(manager);

  std::mutex                                         mutex;
  std::vector<std::chrono::steady_clock::time_point> attempts;
  f.endpoint->on_append = [&](uint64_t offset) {
    if (offset != 0) return;
    std::lock_guard lock(mutex);
    attempts.push_back(std::chrono::steady_clock::now());
  };
  f.endpoint->transient_failures = 1;

  const auto id = MustEnqueue(manager, f.File("clip.mp4", 2000));
  assert(manager.Pause(id).ok());
  assert(manager.Resume(id).ok());
  assert(manager.Get(id)->status == UploadStatus::kQueued);

  manager.Start();
  AssertCompleted(log, id, 2000);
  assert(log.Requeues(id) == 1);

  std::lock_guard lock(mutex);
  assert(attempts.size() == 2);
  assert(attempts[1] - attempts[0] >= 250ms);
  manager.Stop();
}

void TestNetworkLossPausesAndRestoresRunningUploads() {
  Fixture            f("queue_network");
  UploadQueueManager manager(f.endpoint, FastOptions(2, 1000));
  EventLog           log(manager);

  std::atomic<bool> dropped{false};
  f.endpoint->on_append = [&](uint64_t offset) {
    if (offset == 4000 && !dropped.exchange(true)) manager.SetNetworkAvailable(false);
  };

  const auto a = MustEnqueue(manager, f.File("a.mp4", 10'000));
  const auto b = MustEnqueue(manager, f.File("b.mp4", 10'000));
  manager.Start();

  assert(Eventually([&] {
    return manager.Get(a)->status == UploadStatus::kPaused && manager.Get(b)->status == UploadStatus::kPaused;
  }));
  // whichever transfer tripped the drop kept its progress
  const auto furthest = std::max(manager.Get(a)->bytes_transferred, manager.Get(b)->bytes_transferred);
  assert(furthest >= 4000);
  assert(furthest < 10'000);

  // queued work is held while offline
  const auto c = MustEnqueue(manager, f.File("c.mp4", 2000));
  std::this_thread::sleep_for(30ms);
  assert(manager.Get(c)->status == UploadStatus::kQueued);

  manager.SetNetworkAvailable(true);
  assert(manager.WaitIdle(10s));
  AssertCompleted(log, a, 10'000);
  AssertCompleted(log, b, 10'000);
  AssertCompleted(log, c, 2000);
  assert(f.endpoint->bytes_received == 22'000);
  manager.Stop();
}

void TestConcurrencyCeilingUnderRandomLoad() {
  Fixture f("queue_random");
  f.endpoint->append_delay_ms = 1;

  std::mt19937                          rng(1234);
  std::uniform_int_distribution<size_t> size(500, 8000);

  UploadQueueManager       manager(f.endpoint, FastOptions(3, 700));
  EventLog                 log(manager);
  std::vector<std::string> ids;
  std::vector<uint64_t>    sizes;
  for (int i = 0; i < 10; ++i) {
    sizes.push_back(size(rng));
    ids.push_back(MustEnqueue(manager, f.File("r" + std::to_string(i) + ".mp4", sizes.back())));
  }

  manager.Start();
  for (int i = 0; i < 5; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(rng() % 10));
    assert(manager.ActiveCount() <= 3);
  }
  assert(manager.WaitIdle(20s));

  assert(manager.PeakActiveCount() <= 3);
  for (size_t i = 0; i < ids.size(); ++i) AssertCompleted(log, ids[i], sizes[i]);
  assert(f.h.queue->Depth() == ids.size());
  manager.Stop();
}

void TestTransientFailuresRetryThenFail() {
  Fixture            f("queue_retry");
  UploadQueueManager manager(f.endpoint, FastOptions(1, 1000));
  EventLog           log(manager);

  f.endpoint->transient_failures = 2;
  const auto recovered           = MustEnqueue(manager, f.File("ok.mp4", 3000));
  manager.Start();
  assert(manager.WaitIdle(10s));
  AssertCompleted(log, recovered, 3000);
  assert(log.Requeues(recovered) == 2);

  f.endpoint->transient_failures = 1000;
  const auto doomed              = MustEnqueue(manager, f.File("doomed.mp4", 3000));
  assert(Eventually([&] { return manager.Get(doomed)->status == UploadStatus::kFailed; }));
  auto failed = manager.Get(doomed);
  assert(failed->retry_count == 3);
  assert(!failed->last_error.empty());

  // manual retry starts a fresh budget
  f.endpoint->transient_failures = 0;
  assert(manager.Retry(doomed).ok());
  AssertCompleted(log, doomed, 3000);
  assert(log.Requeues(doomed) == 3);
  manager.Stop();
}

void TestRejectedUploadFailsWithoutRetry() {
  Fixture f("queue_rejected");
  const auto path = f.h.root / "fake.mp4";
  vidpipe::testing::WriteFile(path, std::string(3000, 'x'));

  UploadQueueManager manager(f.endpoint, FastOptions(1, 1000));
  const auto         id = MustEnqueue(manager, path.string());
  manager.Start();

  assert(Eventually([&] { return manager.Get(id)->status == UploadStatus::kFailed; }));
  assert(manager.Get(id)->retry_count == 0);
  assert(f.endpoint->append_calls == 3);
  assert(f.h.queue->Depth() == 0);
  manager.Stop();
}

void TestCancelQueuedAndActiveUploads() {
  Fixture            f("queue_cancel");
  UploadQueueManager manager(f.endpoint, FastOptions(1, 1000));
  EventLog           log(manager);

  std::string active;
  f.endpoint->on_append = [&](uint64_t offset) {
    if (offset == 2000) (void)manager.Cancel(active);
  };

  active              = MustEnqueue(manager, f.File("a.mp4", 8000), "active");
  const auto waiting  = MustEnqueue(manager, f.File("b.mp4", 8000), "waiting");
  assert(manager.Cancel(waiting).ok());
  assert(log.Last(waiting)->status == UploadStatus::kCancelled);
  assert(!manager.Get(waiting).has_value());

  manager.Start();
  assert(log.Reached(active, UploadStatus::kCancelled));
  assert(manager.WaitIdle(5s));

  // the partial server session is gone too
  assert(f.endpoint->QueryOffset(active).status().IsKeyError());
  assert(f.h.queue->Depth() == 0);
  assert(!manager.Get(active).has_value());
  assert(manager.Cancel(active).IsKeyError());
  manager.Stop();
}

void TestRequestValidation() {
  Fixture            f("queue_validation");
  UploadQueueManager manager(f.endpoint, FastOptions(1, 1000));

  assert(manager.Enqueue(UploadRequest{(f.h.root / "nope.mp4").string(), "owner-1", {}, {}}).status().IsIOError());

  const auto path = f.File("clip.mp4", 1000);
  MustEnqueue(manager, path, "dup");
  assert(manager.Enqueue(UploadRequest{path, "owner-1", {}, "dup"}).status().IsAlreadyExists());

  assert(manager.Pause("missing").IsKeyError());
  assert(manager.Resume("dup").IsInvalid());
  assert(manager.Retry("dup").IsInvalid());
  assert(manager.List().size() == 1);
  assert(manager.Get("dup")->filename == "clip.mp4");
}

} // namespace

int main() {
  TestThirdUploadWaitsForAFreeSlot();
  TestNetworkToggleResumesUserPausedUploadInPlace();
  TestPauseResumeOfQueuedTaskKeepsBackoff();
  TestNetworkLossPausesAndRestoresRunningUploads();
  TestConcurrencyCeilingUnderRandomLoad();
  TestTransientFailuresRetryThenFail();
  TestRejectedUploadFailsWithoutRetry();
  TestCancelQueuedAndActiveUploads();
  TestRequestValidation();

  std::cout << "vidpipe_unit_upload_queue: pass\n";
  return 0;
}
