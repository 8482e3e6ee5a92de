#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/api/transaction_runner.hpp"
#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/storage/common/object_keys.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using vidpipe::model::VideoStatus;
using vidpipe::pipeline::JobOutcome;
using vidpipe::pipeline::PipelineRunner;
using vidpipe::testing::FakeTranscoder;
using vidpipe::testing::Harness;

namespace keys = vidpipe::storage::keys;

// Escapes the runner's handlers like a process dying mid-stage.
struct WorkerCrash {};

struct Fixture {
  explicit Fixture(const std::string& name)
      : h(name), transcoder(std::make_shared<FakeTranscoder>()),
        runner(std::make_shared<PipelineRunner>(h.repository, h.queue, h.objects, transcoder, h.clock,
                                                h.PipelineOptions())) {
  }

  JobOutcome RunNext() {
    auto lease = h.queue->Dequeue();
    assert(lease.has_value());
    return runner->Run(*lease);
  }

  Harness                         h;
  std::shared_ptr<FakeTranscoder> transcoder;
  std::shared_ptr<PipelineRunner> runner;
};

void TestHappyPathProducesFullManifest() {
  Fixture    f("runner_happy");
  auto       events   = f.runner->Subscribe();
  const auto video_id = f.h.IngestVideo();

  assert(f.RunNext() == JobOutcome::kCompleted);

  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kCompleted);
  assert(video->progress == 1.0);
  assert(video->error_message.empty());
  assert(video->processing_started_at_ms > 0);
  assert(video->processing_completed_at_ms >= video->processing_started_at_ms);

  const auto& manifest = video->manifest;
  assert(manifest.media().duration_s() == 12.0);
  assert(manifest.renditions_size() == 2);
  assert(manifest.renditions(0).quality() == "360p");
  assert(manifest.renditions(1).object_key() == keys::RenditionKey("720p", video_id));
  assert(manifest.renditions(1).width() == 1280 && manifest.renditions(1).height() == 720);
  assert(manifest.thumbnails_size() == 3);
  assert(manifest.thumbnails(0).object_key() == keys::ThumbnailKey(video_id, 0));
  assert(manifest.audio().object_key() == keys::AudioKey(video_id));

  assert(f.h.objects->Exists(keys::RenditionKey("360p", video_id)));
  assert(f.h.objects->Exists(keys::ThumbnailKey(video_id, 2)));
  assert(f.h.objects->Exists(keys::AudioKey(video_id)));
  assert(f.h.queue->Depth() == 0);

  // progress never moves backwards and ends at completed
  auto   published = events->Drain();
  double last      = -1.0;
  assert(!published.empty());
  for (const auto& event : published) {
    assert(event.video_id == video_id);
    assert(event.progress >= last);
    last = event.progress;
  }
  assert(published.back().status == VideoStatus::kCompleted);
  assert(published.front().status == VideoStatus::kDownloading);
}

void TestSourceWithoutAudioSkipsExtraction() {
  Fixture f("runner_silent");
  f.transcoder->probe.audio_codec.clear();
  const auto video_id = f.h.IngestVideo();

  assert(f.RunNext() == JobOutcome::kCompleted);
  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kCompleted);
  assert(!video->manifest.has_audio());
  assert(f.transcoder->AudioCalls() == 0);
  assert(!f.h.objects->Exists(keys::AudioKey(video_id)));
}

void TestRedeliveryAfterCrashSkipsFinishedRenditions() {
  Fixture    f("runner_crash");
  const auto video_id = f.h.IngestVideo();

  bool crash = true;
  f.transcoder->before = [&](const std::string& op, const std::string&) {
    if (op == "frame" && crash) throw WorkerCrash{};
  };

  bool crashed = false;
  try {
    (void)f.RunNext();
  } catch (const WorkerCrash&) {
    crashed = true;
  }
  assert(crashed);

  auto stalled = f.h.Video(video_id);
  assert(stalled->status == VideoStatus::kThumbnailing);
  assert(stalled->manifest.renditions_size() == 2);
  const double stalled_progress = stalled->progress;

  // nothing is claimable until the dead worker's lease runs out
  assert(!f.h.queue->Dequeue().has_value());
  f.h.clock->Advance(30'001ms);

  crash = false;
  auto lease = f.h.queue->Dequeue();
  assert(lease->attempt == 2);
  assert(f.runner->Run(*lease) == JobOutcome::kCompleted);

  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kCompleted);
  assert(video->progress >= stalled_progress);
  assert(f.transcoder->Transcodes("360p") == 1);
  assert(f.transcoder->Transcodes("720p") == 1);
}

void TestRepeatedCrashesEndInFailure() {
  Fixture    f("runner_crash_loop");
  const auto video_id = f.h.IngestVideo();

  int frames = 0;
  f.transcoder->before = [&](const std::string& op, const std::string&) {
    if (op == "frame") {
      ++frames;
      throw WorkerCrash{};
    }
  };

  for (uint32_t attempt = 1; attempt <= 3; ++attempt) {
    auto lease = f.h.queue->Dequeue();
    assert(lease.has_value());
    assert(lease->attempt == attempt);
    bool crashed = false;
    try {
      (void)f.runner->Run(*lease);
    } catch (const WorkerCrash&) {
      crashed = true;
    }
    assert(crashed);
    f.h.clock->Advance(30'001ms);
  }
  assert(frames == 3);
  const double frozen = f.h.Video(video_id)->progress;

  // the fourth delivery gives up before touching any stage
  auto lease = f.h.queue->Dequeue();
  assert(lease.has_value());
  assert(lease->attempt == 4);
  assert(f.runner->Run(*lease) == JobOutcome::kFailed);
  assert(frames == 3);

  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kFailed);
  assert(video->progress == frozen);
  assert(video->error_message.find("exceeded 3 attempts") != std::string::npos);

  f.h.clock->Advance(std::chrono::hours(1));
  assert(!f.h.queue->Dequeue().has_value());
  assert(f.h.queue->Depth() == 0);
}

void TestTransientFailuresExhaustRetries() {
  Fixture    f("runner_retries");
  const auto video_id = f.h.IngestVideo();

  int attempts = 0;
  f.transcoder->before = [&](const std::string& op, const std::string&) {
    if (op == "transcode") {
      ++attempts;
      throw vidpipe::util::TransientIo("encoder exited with code 1");
    }
  };

  assert(f.RunNext() == JobOutcome::kRetryScheduled);
  auto job = f.h.JobFor(video_id);
  assert(job->last_error.find("encoder exited") != std::string::npos);
  assert(f.h.Video(video_id)->status == VideoStatus::kTranscoding);
  const double frozen = f.h.Video(video_id)->progress;

  // first backoff is one minute
  f.h.clock->Advance(59'000ms);
  assert(!f.h.queue->Dequeue().has_value());
  f.h.clock->Advance(1'000ms);
  assert(f.RunNext() == JobOutcome::kRetryScheduled);

  f.h.clock->Advance(120'000ms);
  assert(f.RunNext() == JobOutcome::kFailed);
  assert(attempts == 3);

  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kFailed);
  assert(video->progress == frozen);
  assert(video->error_message.find("after 3 attempts") != std::string::npos);

  f.h.clock->Advance(std::chrono::hours(1));
  assert(!f.h.queue->Dequeue().has_value());
  assert(attempts == 3);
}

void TestDataIntegrityFailsWithoutRetry() {
  Fixture f("runner_integrity");
  f.transcoder->probe.duration_s = 301.0;
  const auto long_id             = f.h.IngestVideo("long.mp4");

  assert(f.RunNext() == JobOutcome::kFailed);
  auto video = f.h.Video(long_id);
  assert(video->status == VideoStatus::kFailed);
  assert(video->error_message.find("maximum") != std::string::npos);
  assert(f.h.queue->Depth() == 0);

  f.transcoder->probe.duration_s = 10.0;
  const auto lost_id             = f.h.IngestVideo("lost.mp4");
  f.h.objects->Remove(f.h.Video(lost_id)->source_object_key);

  assert(f.RunNext() == JobOutcome::kFailed);
  assert(f.h.Video(lost_id)->error_message.find("source object missing") != std::string::npos);
  assert(f.transcoder->TotalTranscodes() == 0);
}

void TestMalformedPresetFailsWithoutRetry() {
  Fixture f("runner_bad_preset");
  auto    options = f.h.PipelineOptions();
  options.qualities[0].video_bitrate = "fast";
  auto runner = std::make_shared<PipelineRunner>(f.h.repository, f.h.queue, f.h.objects, f.transcoder, f.h.clock, options);

  const auto video_id = f.h.IngestVideo();
  auto       lease    = f.h.queue->Dequeue();
  assert(lease.has_value());
  assert(runner->Run(*lease) == JobOutcome::kFailed);

  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kFailed);
  assert(video->error_message.find("invalid bitrate") != std::string::npos);
  assert(f.h.queue->Depth() == 0);
  assert(f.transcoder->TotalTranscodes() == 0);
}

void TestResourceExhaustionRetriesSingleThreaded() {
  Fixture    f("runner_oom");
  const auto video_id = f.h.IngestVideo();

  bool first = true;
  f.transcoder->before = [&](const std::string& op, const std::string&) {
    if (op == "transcode" && first) {
      first = false;
      throw vidpipe::util::ResourceExhausted("encoder killed (out of memory)");
    }
  };

  assert(f.RunNext() == JobOutcome::kRetryScheduled);
  assert(f.h.JobFor(video_id)->reduced_concurrency);

  f.h.clock->Advance(60'000ms);
  assert(f.RunNext() == JobOutcome::kCompleted);
  for (auto threads : f.transcoder->ThreadArgs()) assert(threads == 1);
}

void TestResourceExhaustionAtReducedConcurrencyFails() {
  Fixture    f("runner_oom_twice");
  const auto video_id = f.h.IngestVideo();

  f.transcoder->before = [](const std::string& op, const std::string&) {
    if (op == "transcode") throw vidpipe::util::ResourceExhausted("scratch disk full");
  };

  assert(f.RunNext() == JobOutcome::kRetryScheduled);
  f.h.clock->Advance(60'000ms);
  assert(f.RunNext() == JobOutcome::kFailed);
  assert(f.h.Video(video_id)->status == VideoStatus::kFailed);
  assert(f.h.queue->Depth() == 0);
}

void TestLostLeaseAbandonsWithoutWriting() {
  Fixture    f("runner_lease_lost");
  const auto video_id = f.h.IngestVideo();

  std::optional<vidpipe::queue::JobLease> thief;
  f.transcoder->before = [&](const std::string& op, const std::string&) {
    if (op == "frame" && !thief) {
      f.h.clock->Advance(30'001ms);
      thief = f.h.queue->Dequeue();
    }
  };

  assert(f.RunNext() == JobOutcome::kAbandoned);
  assert(thief.has_value());

  // the stale worker's thumbnails never reached the row
  auto video = f.h.Video(video_id);
  assert(video->status == VideoStatus::kThumbnailing);
  assert(video->manifest.thumbnails_size() == 0);

  f.transcoder->before = nullptr;
  assert(f.runner->Run(*thief) == JobOutcome::kCompleted);
}

void TestTerminalVideoJobIsDropped() {
  Fixture    f("runner_terminal");
  const auto video_id = f.h.IngestVideo();

  vidpipe::db::RunInTransaction(*f.h.repository, [&](vidpipe::db::Transaction& tx) {
    auto video          = f.h.repository->GetVideo(tx, video_id);
    video->status       = VideoStatus::kCompleted;
    video->progress     = 1.0;
    video->version     += 1;
    vidpipe::db::ThrowIfError(f.h.repository->UpdateVideo(tx, *video), "test update");
  });

  assert(f.RunNext() == JobOutcome::kFailed);
  assert(f.h.Video(video_id)->status == VideoStatus::kCompleted);
  assert(f.h.queue->Depth() == 0);
  assert(f.transcoder->ProbeCalls() == 0);
}

} // namespace

int main() {
  TestHappyPathProducesFullManifest();
  TestSourceWithoutAudioSkipsExtraction();
  TestRedeliveryAfterCrashSkipsFinishedRenditions();
  TestRepeatedCrashesEndInFailure();
  TestTransientFailuresExhaustRetries();
  TestDataIntegrityFailsWithoutRetry();
  TestMalformedPresetFailsWithoutRetry();
  TestResourceExhaustionRetriesSingleThreaded();
  TestResourceExhaustionAtReducedConcurrencyFails();
  TestLostLeaseAbandonsWithoutWriting();
  TestTerminalVideoJobIsDropped();

  std::cout << "vidpipe_unit_pipeline_runner: pass\n";
  return 0;
}
