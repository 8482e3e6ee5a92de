#include "ffmpeg_transcoder.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <csignal>
#include <cstdio>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vidpipe::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

std::string FormatSeconds(double seconds) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

std::string ScaleFilter(Dimensions size) {
  return "scale=" + std::to_string(size.width) + ":" + std::to_string(size.height);
}

const google::protobuf::Value* Field(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  return it == object.fields().end() ? nullptr : &it->second;
}

std::string StringOf(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  return value && value->has_string_value() ? value->string_value() : std::string{};
}

// ffprobe prints dimensions as numbers and durations as strings
double NumberOf(const google::protobuf::Struct& object, const std::string& key) {
  const auto* value = Field(object, key);
  if (!value) return 0.0;
  if (value->has_number_value()) return value->number_value();
  if (value->has_string_value()) {
    try {
      return std::stod(value->string_value());
    } catch (const std::exception&) {
      return 0.0;
    }
  }
  return 0.0;
}

} // namespace

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg_path, std::string ffprobe_path,
                                   std::chrono::milliseconds run_timeout)
    : ffmpeg_path_(std::move(ffmpeg_path)), ffprobe_path_(std::move(ffprobe_path)), run_timeout_(run_timeout) {
}

std::vector<std::string> FfmpegTranscoder::ProbeArgs(const std::filesystem::path& input) const {
  return {ffprobe_path_, "-v", "error", "-print_format", "json", "-show_format", "-show_streams", input.string()};
}

std::vector<std::string> FfmpegTranscoder::TranscodeArgs(const std::filesystem::path& input,
                                                         const std::filesystem::path& output, const QualityPreset& preset,
                                                         Dimensions size, uint32_t threads) const {
  std::vector<std::string> args = {ffmpeg_path_, "-y", "-hide_banner", "-loglevel", "error", "-i", input.string(),
                                   "-vf", ScaleFilter(size), "-c:v", "libx264", "-c:a", "aac",
                                   "-b:v", preset.video_bitrate, "-b:a", preset.audio_bitrate,
                                   "-preset", preset.preset, "-crf", std::to_string(preset.crf),
                                   "-movflags", "+faststart", "-pix_fmt", "yuv420p"};
  if (threads > 0) {
    args.push_back("-threads");
    args.push_back(std::to_string(threads));
  }
  args.push_back(output.string());
  return args;
}

std::vector<std::string> FfmpegTranscoder::FrameArgs(const std::filesystem::path& input,
                                                     const std::filesystem::path& output, double timestamp_s,
                                                     Dimensions size) const {
  return {ffmpeg_path_, "-y", "-hide_banner", "-loglevel", "error", "-ss", FormatSeconds(timestamp_s), "-i",
          input.string(), "-vf", ScaleFilter(size), "-frames:v", "1", output.string()};
}

std::vector<std::string> FfmpegTranscoder::AudioArgs(const std::filesystem::path& input,
                                                     const std::filesystem::path& output,
                                                     const std::string& bitrate) const {
  return {ffmpeg_path_, "-y", "-hide_banner", "-loglevel", "error", "-i", input.string(),
          "-vn", "-c:a", "libmp3lame", "-b:a", bitrate, output.string()};
}

void FfmpegTranscoder::ThrowOnFailure(const ProcessResult& result, const std::string& what) {
  if (result.exit_code == 0) return;

  const auto& err = result.err_tail;
  if (result.term_signal == SIGKILL || result.exit_code == 137 || err.find("Cannot allocate memory") != std::string::npos) {
    throw util::ResourceExhausted(what + ": transcoder killed (out of memory)");
  }
  if (err.find("No space left on device") != std::string::npos) {
    throw util::ResourceExhausted(what + ": scratch disk full");
  }
  if (result.exit_code == 127) {
    throw util::TransientIo(what + ": transcoder binary not runnable");
  }
  if (err.find("Invalid data found when processing input") != std::string::npos ||
      err.find("moov atom not found") != std::string::npos) {
    throw util::DataIntegrity(what + ": corrupt source: " + err);
  }

  if (result.term_signal != 0) {
    throw util::TransientIo(what + ": terminated by signal " + std::to_string(result.term_signal));
  }
  throw util::TransientIo(what + ": exit code " + std::to_string(result.exit_code) + ": " + err);
}

MediaProbe FfmpegTranscoder::ParseProbeJson(const std::string& json) {
  google::protobuf::Struct root;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &root);
  if (!status.ok()) {
    throw util::DataIntegrity("unreadable probe output: " + std::string(status.message()));
  }

  MediaProbe probe;
  bool       has_video = false;

  if (const auto* streams = Field(root, "streams"); streams && streams->has_list_value()) {
    for (const auto& entry : streams->list_value().values()) {
      if (!entry.has_struct_value()) continue;
      const auto& stream = entry.struct_value();
      const auto  type   = StringOf(stream, "codec_type");
      if (type == "video" && !has_video) {
        has_video         = true;
        probe.width       = static_cast<uint32_t>(NumberOf(stream, "width"));
        probe.height      = static_cast<uint32_t>(NumberOf(stream, "height"));
        probe.video_codec = StringOf(stream, "codec_name");
      } else if (type == "audio" && probe.audio_codec.empty()) {
        probe.audio_codec = StringOf(stream, "codec_name");
      }
    }
  }
  if (!has_video || probe.width == 0 || probe.height == 0) {
    throw util::DataIntegrity("no video stream found");
  }

  if (const auto* format = Field(root, "format"); format && format->has_struct_value()) {
    probe.duration_s = NumberOf(format->struct_value(), "duration");
  }
  if (probe.duration_s <= 0.0) {
    throw util::DataIntegrity("source has no duration");
  }
  return probe;
}

MediaProbe FfmpegTranscoder::Probe(const std::filesystem::path& input) {
  auto result = RunProcess(ProbeArgs(input), run_timeout_);
  if (result.exit_code != 0 && result.exit_code != 127 && result.term_signal == 0) {
    // ffprobe only fails this way on input it cannot parse
    throw util::DataIntegrity("probe failed: " + result.err_tail);
  }
  ThrowOnFailure(result, "probe");
  return ParseProbeJson(result.out);
}

void FfmpegTranscoder::Transcode(const std::filesystem::path& input, const std::filesystem::path& output,
                                 const QualityPreset& preset, Dimensions size, uint32_t threads) {
  VIDPIPE_LOG_DEBUG("transcoding", {StringField("quality", preset.name), IntField("width", size.width),
                                    IntField("height", size.height), IntField("threads", threads)});
  ThrowOnFailure(RunProcess(TranscodeArgs(input, output, preset, size, threads), run_timeout_), "transcode " + preset.name);
}

void FfmpegTranscoder::ExtractFrame(const std::filesystem::path& input, const std::filesystem::path& output,
                                    double timestamp_s, Dimensions size) {
  ThrowOnFailure(RunProcess(FrameArgs(input, output, timestamp_s, size), run_timeout_), "thumbnail at " + FormatSeconds(timestamp_s));
}

void FfmpegTranscoder::ExtractAudio(const std::filesystem::path& input, const std::filesystem::path& output,
                                    const std::string& bitrate) {
  ThrowOnFailure(RunProcess(AudioArgs(input, output, bitrate), run_timeout_), "extract audio");
}

} // namespace vidpipe::pipeline
