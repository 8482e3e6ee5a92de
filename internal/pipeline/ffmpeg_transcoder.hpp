#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "media_transcoder.hpp"
#include "subprocess.hpp"

namespace vidpipe::pipeline {

/*
  MediaTranscoder backed by the ffmpeg / ffprobe command line tools.

  Encoding follows the playback requirements of the mobile players:
  H.264 + AAC, yuv420p, faststart moov atom.
*/
class FfmpegTranscoder final : public MediaTranscoder {
 public:
  // run_timeout bounds every tool invocation; zero means unbounded
  FfmpegTranscoder(std::string ffmpeg_path, std::string ffprobe_path,
                   std::chrono::milliseconds run_timeout = std::chrono::milliseconds::zero());

  MediaProbe Probe(const std::filesystem::path& input) override;

  void Transcode(const std::filesystem::path& input, const std::filesystem::path& output, const QualityPreset& preset,
                 Dimensions size, uint32_t threads) override;

  void ExtractFrame(const std::filesystem::path& input, const std::filesystem::path& output, double timestamp_s,
                    Dimensions size) override;

  void ExtractAudio(const std::filesystem::path& input, const std::filesystem::path& output,
                    const std::string& bitrate) override;

  // command lines, exposed for tests
  std::vector<std::string> ProbeArgs(const std::filesystem::path& input) const;
  std::vector<std::string> TranscodeArgs(const std::filesystem::path& input, const std::filesystem::path& output,
                                         const QualityPreset& preset, Dimensions size, uint32_t threads) const;
  std::vector<std::string> FrameArgs(const std::filesystem::path& input, const std::filesystem::path& output,
                                     double timestamp_s, Dimensions size) const;
  std::vector<std::string> AudioArgs(const std::filesystem::path& input, const std::filesystem::path& output,
                                     const std::string& bitrate) const;

  // ffprobe -print_format json output
  static MediaProbe ParseProbeJson(const std::string& json);

  // Map a finished process to the error taxonomy; no-op on success.
  static void ThrowOnFailure(const ProcessResult& result, const std::string& what);

 private:
  std::string ffmpeg_path_;
  std::string ffprobe_path_;
  std::chrono::milliseconds run_timeout_;
};

} // namespace vidpipe::pipeline
