#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "quality.hpp"

namespace vidpipe::pipeline {

struct MediaProbe {
  double      duration_s = 0.0;
  uint32_t    width      = 0;
  uint32_t    height     = 0;
  std::string video_codec;
  std::string audio_codec; // empty when the source has no audio stream
};

/*
  External media tool seam.

  Implementations report failures with the util:: taxonomy:
    DataIntegrity      unreadable or corrupt input
    ResourceExhausted  out of memory / disk while encoding
    TransientIo        anything else worth retrying
*/
class MediaTranscoder {
 public:
  virtual ~MediaTranscoder() = default;

  virtual MediaProbe Probe(const std::filesystem::path& input) = 0;

  // threads == 0 lets the encoder decide
  virtual void Transcode(const std::filesystem::path& input, const std::filesystem::path& output,
                         const QualityPreset& preset, Dimensions size, uint32_t threads) = 0;

  virtual void ExtractFrame(const std::filesystem::path& input, const std::filesystem::path& output, double timestamp_s,
                            Dimensions size) = 0;

  virtual void ExtractAudio(const std::filesystem::path& input, const std::filesystem::path& output,
                            const std::string& bitrate) = 0;
};

} // namespace vidpipe::pipeline
