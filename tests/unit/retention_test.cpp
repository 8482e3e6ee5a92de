#include "internal/maintenance/retention_sweeper.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/pipeline/pipeline_runner.hpp"
#include "internal/storage/common/object_keys.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using vidpipe::maintenance::RetentionOptions;
using vidpipe::maintenance::RetentionSweeper;
using vidpipe::testing::FakeTranscoder;
using vidpipe::testing::Harness;

namespace keys = vidpipe::storage::keys;

RetentionOptions Enabled() {
  RetentionOptions options;
  options.enabled  = true;
  options.max_age  = std::chrono::hours(24 * 30);
  options.interval = 10ms;
  return options;
}

void Process(Harness& h, const std::shared_ptr<FakeTranscoder>& transcoder) {
  vidpipe::pipeline::PipelineRunner runner(h.repository, h.queue, h.objects, transcoder, h.clock, h.PipelineOptions());
  while (auto lease = h.queue->Dequeue()) {
    (void)runner.Run(*lease);
  }
}

void TestOldTerminalVideosAreDeletedWithObjects() {
  Harness h("retention_delete");
  auto    transcoder = std::make_shared<FakeTranscoder>();

  const auto old_id = h.IngestVideo("old.mp4");
  Process(h, transcoder);
  const auto source_key = h.Video(old_id)->source_object_key;
  assert(h.objects->ObjectCount() == 1 + 2 + 3 + 1);

  h.clock->Advance(std::chrono::hours(24 * 31));
  const auto fresh_id = h.IngestVideo("fresh.mp4");
  Process(h, transcoder);

  RetentionSweeper sweeper(h.repository, h.objects, h.ingestion, h.clock, Enabled());
  auto             report = sweeper.SweepOnce();
  assert(report.videos_deleted == 1);
  assert(report.objects_deleted == 7);

  assert(!h.Video(old_id).has_value());
  assert(!h.objects->Exists(source_key));
  assert(!h.objects->Exists(keys::RenditionKey("360p", old_id)));
  assert(!h.objects->Exists(keys::ThumbnailKey(old_id, 0)));
  assert(!h.objects->Exists(keys::AudioKey(old_id)));

  assert(h.Video(fresh_id).has_value());
  assert(h.objects->Exists(keys::AudioKey(fresh_id)));
  assert(sweeper.SweepOnce().videos_deleted == 0);
}

void TestVideosInFlightAreKept() {
  Harness    h("retention_inflight");
  const auto video_id = h.IngestVideo();
  h.clock->Advance(std::chrono::hours(24 * 31));

  RetentionSweeper sweeper(h.repository, h.objects, h.ingestion, h.clock, Enabled());
  assert(sweeper.SweepOnce().videos_deleted == 0);
  assert(h.Video(video_id).has_value());
  assert(h.queue->Depth() == 1);
}

void TestDisabledSweepStillExpiresUploads() {
  Harness h("retention_disabled");
  auto    transcoder = std::make_shared<FakeTranscoder>();
  const auto video_id = h.IngestVideo();
  Process(h, transcoder);
  h.ingestion->CreateUpload("u-stale", "owner-1", "clip.mp4", 100);

  h.clock->Advance(std::chrono::hours(24 * 365));
  RetentionSweeper sweeper(h.repository, h.objects, h.ingestion, h.clock, RetentionOptions{});
  auto             report = sweeper.SweepOnce();
  assert(report.uploads_expired == 1);
  assert(report.videos_deleted == 0);
  assert(h.Video(video_id).has_value());
}

void TestBackgroundLoopRunsAndStops() {
  Harness h("retention_loop");
  h.ingestion->CreateUpload("u-stale", "owner-1", "clip.mp4", 100);
  h.clock->Advance(std::chrono::hours(25));

  RetentionSweeper sweeper(h.repository, h.objects, h.ingestion, h.clock, Enabled());
  sweeper.Start();
  const bool swept = vidpipe::testing::Eventually([&] {
    try {
      (void)h.ingestion->QueryOffset("u-stale");
      return false;
    } catch (const vidpipe::util::NotFound&) {
      auto tx = h.repository->Begin();
      return !h.repository->GetUpload(*tx, "u-stale").has_value();
    }
  });
  sweeper.Stop();
  sweeper.Stop();
  assert(swept);
}

void TestOptionsFromConfig() {
  vidpipe::runtime::config::RuntimeConfig config;
  config.mutable_retention()->set_enabled(true);
  config.mutable_retention()->set_days(7);
  config.mutable_retention()->set_sweep_interval_ms(5000);

  auto options = RetentionOptions::FromConfig(config);
  assert(options.enabled);
  assert(options.max_age == std::chrono::hours(24 * 7));
  assert(options.interval == 5000ms);
}

} // namespace

int main() {
  TestOldTerminalVideosAreDeletedWithObjects();
  TestVideosInFlightAreKept();
  TestDisabledSweepStillExpiresUploads();
  TestBackgroundLoopRunsAndStops();
  TestOptionsFromConfig();

  std::cout << "vidpipe_unit_retention: pass\n";
  return 0;
}
