#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/model/video_record.hpp"
#include "internal/storage/object_store.hpp"
#include "internal/util/retry_policy.hpp"
#include "internal/util/time.hpp"
#include "media_transcoder.hpp"
#include "quality.hpp"
#include "scratch_space.hpp"

namespace vidpipe::pipeline {

struct PipelineOptions {
  std::vector<QualityPreset> qualities;

  uint32_t   thumbnail_count = 5;
  Dimensions thumbnail_size{320, 180};

  std::string audio_bitrate = "192k";

  double max_duration_s = 300.0;

  std::filesystem::path scratch_dir;

  util::RetryPolicy retry = util::RetryPolicy::ProcessingDefault();

  static PipelineOptions FromConfig(const vidpipe::runtime::config::RuntimeConfig& config);
};

struct StageContext {
  storage::ObjectStore&    objects;
  MediaTranscoder&         transcoder;
  const PipelineOptions&   options;
  const ScratchSpace&      scratch;
  const util::ClockSource& clock;

  // single-threaded encoder after a resource exhaustion failure
  bool reduced_concurrency = false;
};

/*
  Stage functions.

  Each takes the persisted snapshot of the video and returns the next
  one; none of them writes the video row. The runner persists every
  returned snapshot before calling the next stage, so a crashed or
  re-delivered job resumes from the last persisted status and skips
  work already recorded in the manifest.

    pending           -> downloading       StartProcessing
    downloading       -> transcoding       FetchAndProbe
    transcoding       -> transcoding       TranscodeNext (one rendition per call)
    transcoding       -> thumbnailing
    thumbnailing      -> extracting_audio  ExtractThumbnails
    extracting_audio  -> completed         ExtractAudioTrack
*/

db::model::VideoRecord StartProcessing(const db::model::VideoRecord& in, StageContext& ctx);

db::model::VideoRecord FetchAndProbe(const db::model::VideoRecord& in, StageContext& ctx);

db::model::VideoRecord TranscodeNext(const db::model::VideoRecord& in, StageContext& ctx);

db::model::VideoRecord ExtractThumbnails(const db::model::VideoRecord& in, StageContext& ctx);

db::model::VideoRecord ExtractAudioTrack(const db::model::VideoRecord& in, StageContext& ctx);

// Dispatch on in.status. Throws util::InvalidState for terminal videos.
db::model::VideoRecord Advance(const db::model::VideoRecord& in, StageContext& ctx);

/*
  Local copy of the source in scratch, downloaded on first use. A
  missing or truncated source raises util::DataIntegrity.
*/
std::filesystem::path EnsureSource(const db::model::VideoRecord& video, StageContext& ctx);

// Configured qualities not yet present in the manifest, in config order.
std::vector<QualityPreset> MissingRenditions(const db::model::VideoRecord& video, const PipelineOptions& options);

} // namespace vidpipe::pipeline
