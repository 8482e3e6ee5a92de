#include "stages.hpp"

#include <algorithm>

#include "internal/model/video_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/object_keys.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::pipeline {

using db::model::VideoRecord;
using model::StageCompletedProgress;
using model::VideoStatus;
using observability::IntField;
using observability::StringField;

PipelineOptions PipelineOptions::FromConfig(const vidpipe::runtime::config::RuntimeConfig& config) {
  PipelineOptions options;
  for (const auto& tier : config.pipeline().qualities()) {
    options.qualities.push_back(QualityPreset::FromConfig(tier));
  }
  options.thumbnail_count = config.pipeline().thumbnails().count();
  options.thumbnail_size  = {config.pipeline().thumbnails().width(), config.pipeline().thumbnails().height()};
  options.audio_bitrate   = config.pipeline().audio().bitrate();
  options.max_duration_s  = config.pipeline().max_duration_seconds();
  options.scratch_dir     = config.storage().scratch_dir();

  options.retry.limit = config.retry().max_attempts();
  options.retry.backoff.clear();
  for (auto ms : config.retry().backoff_ms()) {
    options.retry.backoff.emplace_back(static_cast<int64_t>(ms));
  }
  return options;
}

namespace {

void Expect(const VideoRecord& in, VideoStatus status, const char* stage) {
  if (in.status != status) {
    throw util::InvalidState(std::string(stage) + " invoked for video " + in.video_id + " in status " +
                             std::string(model::ToString(in.status)));
  }
}

VideoRecord Next(const VideoRecord& in, VideoStatus status) {
  VideoRecord out = in;
  out.status      = status;
  out.progress    = std::max(in.progress, StageCompletedProgress(in.status));
  return out;
}

} // namespace

std::vector<QualityPreset> MissingRenditions(const VideoRecord& video, const PipelineOptions& options) {
  std::vector<QualityPreset> missing;
  for (const auto& preset : options.qualities) {
    const auto& renditions = video.manifest.renditions();
    const bool  done       = std::any_of(renditions.begin(), renditions.end(),
                                         [&](const auto& rendition) { return rendition.quality() == preset.name; });
    if (!done) missing.push_back(preset);
  }
  return missing;
}

std::filesystem::path EnsureSource(const VideoRecord& video, StageContext& ctx) {
  if (video.source_object_key.empty()) {
    throw util::InvalidState("video " + video.video_id + " has no source object key");
  }

  const auto local = ctx.scratch.File("source" + std::filesystem::path(video.filename).extension().string());
  if (std::filesystem::exists(local)) return local;

  try {
    ctx.objects.GetToFile(video.source_object_key, local);
  } catch (const util::NotFound&) {
    throw util::DataIntegrity("source object missing: " + video.source_object_key);
  }

  const auto size = std::filesystem::file_size(local);
  if (size != video.size_bytes) {
    std::filesystem::remove(local);
    throw util::DataIntegrity("source object truncated: " + std::to_string(size) + " of " +
                              std::to_string(video.size_bytes) + " bytes");
  }
  return local;
}

VideoRecord StartProcessing(const VideoRecord& in, StageContext& ctx) {
  Expect(in, VideoStatus::kPending, "start");

  VideoRecord out = Next(in, VideoStatus::kDownloading);
  if (out.processing_started_at_ms == 0) out.processing_started_at_ms = ctx.clock.NowMs();
  out.error_message.clear();
  return out;
}

VideoRecord FetchAndProbe(const VideoRecord& in, StageContext& ctx) {
  Expect(in, VideoStatus::kDownloading, "download");

  const auto source = EnsureSource(in, ctx);
  const auto probe  = ctx.transcoder.Probe(source);

  if (ctx.options.max_duration_s > 0 && probe.duration_s > ctx.options.max_duration_s) {
    throw util::DataIntegrity("video is " + std::to_string(static_cast<int64_t>(probe.duration_s)) +
                              "s long, maximum is " + std::to_string(static_cast<int64_t>(ctx.options.max_duration_s)) + "s");
  }

  VideoRecord out = Next(in, VideoStatus::kTranscoding);
  auto*       media = out.manifest.mutable_media();
  media->set_duration_s(probe.duration_s);
  media->set_width(probe.width);
  media->set_height(probe.height);
  media->set_video_codec(probe.video_codec);
  media->set_audio_codec(probe.audio_codec);
  return out;
}

VideoRecord TranscodeNext(const VideoRecord& in, StageContext& ctx) {
  Expect(in, VideoStatus::kTranscoding, "transcode");

  const auto missing = MissingRenditions(in, ctx.options);
  if (missing.empty()) {
    return Next(in, VideoStatus::kThumbnailing);
  }

  const auto& media = in.manifest.media();
  if (media.width() == 0 || media.height() == 0) {
    throw util::InvalidState("transcode invoked for video " + in.video_id + " without probed media info");
  }

  const auto& preset = missing.front();
  const auto  size    = FitWithin(media.width(), media.height(), preset.width, preset.height);
  const auto  bitrate = ParseBitrate(preset.video_bitrate);
  const auto  source  = EnsureSource(in, ctx);
  const auto  output  = ctx.scratch.File(preset.name + ".mp4");
  const auto  key     = storage::keys::RenditionKey(preset.name, in.video_id);

  ctx.transcoder.Transcode(source, output, preset, size, ctx.reduced_concurrency ? 1 : 0);
  ctx.objects.PutFile(key, output);
  std::filesystem::remove(output);

  VideoRecord out       = in;
  auto*       rendition = out.manifest.add_renditions();
  rendition->set_quality(preset.name);
  rendition->set_object_key(key);
  rendition->set_width(size.width);
  rendition->set_height(size.height);
  rendition->set_bitrate(bitrate);

  // progress spreads across renditions between the download and transcode marks
  const double done  = static_cast<double>(ctx.options.qualities.size() - missing.size() + 1);
  const double total = static_cast<double>(ctx.options.qualities.size());
  const double from  = StageCompletedProgress(VideoStatus::kDownloading);
  const double to    = StageCompletedProgress(VideoStatus::kTranscoding);
  out.progress       = std::max(in.progress, from + (to - from) * done / total);

  VIDPIPE_LOG_INFO("rendition stored", {StringField("video_id", in.video_id), StringField("quality", preset.name),
                                        StringField("key", key)});
  return out;
}

VideoRecord ExtractThumbnails(const VideoRecord& in, StageContext& ctx) {
  Expect(in, VideoStatus::kThumbnailing, "thumbnail");

  VideoRecord out = Next(in, VideoStatus::kExtractingAudio);
  out.manifest.clear_thumbnails();

  const auto source     = EnsureSource(in, ctx);
  const auto timestamps = ThumbnailTimestamps(in.manifest.media().duration_s(), ctx.options.thumbnail_count);

  for (uint32_t i = 0; i < timestamps.size(); ++i) {
    const auto local = ctx.scratch.File("thumb_" + std::to_string(i) + ".jpg");
    const auto key   = storage::keys::ThumbnailKey(in.video_id, i);

    ctx.transcoder.ExtractFrame(source, local, timestamps[i], ctx.options.thumbnail_size);
    ctx.objects.PutFile(key, local);

    auto* thumb = out.manifest.add_thumbnails();
    thumb->set_index(i);
    thumb->set_object_key(key);
    thumb->set_timestamp_s(timestamps[i]);
  }
  return out;
}

VideoRecord ExtractAudioTrack(const VideoRecord& in, StageContext& ctx) {
  Expect(in, VideoStatus::kExtractingAudio, "audio");

  VideoRecord out = Next(in, VideoStatus::kCompleted);

  if (in.manifest.media().audio_codec().empty()) {
    VIDPIPE_LOG_INFO("source has no audio stream", {StringField("video_id", in.video_id)});
    out.manifest.clear_audio();
  } else {
    const auto bitrate = ParseBitrate(ctx.options.audio_bitrate);
    const auto source  = EnsureSource(in, ctx);
    const auto local   = ctx.scratch.File("audio.mp3");
    const auto key     = storage::keys::AudioKey(in.video_id);

    ctx.transcoder.ExtractAudio(source, local, ctx.options.audio_bitrate);
    ctx.objects.PutFile(key, local);

    auto* audio = out.manifest.mutable_audio();
    audio->set_object_key(key);
    audio->set_codec("mp3");
    audio->set_bitrate(bitrate);
  }

  out.progress                   = 1.0;
  out.processing_completed_at_ms = ctx.clock.NowMs();
  return out;
}

VideoRecord Advance(const VideoRecord& in, StageContext& ctx) {
  switch (in.status) {
    case VideoStatus::kPending:
      return StartProcessing(in, ctx);
    case VideoStatus::kDownloading:
      return FetchAndProbe(in, ctx);
    case VideoStatus::kTranscoding:
      return TranscodeNext(in, ctx);
    case VideoStatus::kThumbnailing:
      return ExtractThumbnails(in, ctx);
    case VideoStatus::kExtractingAudio:
      return ExtractAudioTrack(in, ctx);
    case VideoStatus::kCompleted:
    case VideoStatus::kFailed:
      break;
  }
  throw util::InvalidState("no stage for video " + in.video_id + " in status " + std::string(model::ToString(in.status)));
}

} // namespace vidpipe::pipeline
