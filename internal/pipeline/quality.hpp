#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace vidpipe::pipeline {

struct QualityPreset {
  std::string name;
  uint32_t    width  = 0;
  uint32_t    height = 0;
  std::string video_bitrate; // ffmpeg notation, "1500k"
  std::string audio_bitrate;
  std::string preset;
  uint32_t    crf = 23;

  static QualityPreset FromConfig(const vidpipe::runtime::config::QualityTier& tier);
};

struct Dimensions {
  uint32_t width  = 0;
  uint32_t height = 0;
};

/*
  Scale (src_width x src_height) to fit the target box keeping the
  aspect ratio. Both results are rounded down to even values, as
  libx264 with yuv420p requires.
*/
Dimensions FitWithin(uint32_t src_width, uint32_t src_height, uint32_t target_width, uint32_t target_height);

// "500k" -> 500000, "3M" -> 3000000, "128000" -> 128000
uint64_t ParseBitrate(const std::string& bitrate);

// duration/(count+1) * (i+1) for i in [0, count)
std::vector<double> ThumbnailTimestamps(double duration_s, uint32_t count);

} // namespace vidpipe::pipeline
