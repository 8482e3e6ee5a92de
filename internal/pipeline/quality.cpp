#include "quality.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace vidpipe::pipeline {

QualityPreset QualityPreset::FromConfig(const vidpipe::runtime::config::QualityTier& tier) {
  QualityPreset preset;
  preset.name          = tier.name();
  preset.width         = tier.width();
  preset.height        = tier.height();
  preset.video_bitrate = tier.video_bitrate();
  preset.audio_bitrate = tier.audio_bitrate();
  preset.preset        = tier.preset();
  preset.crf           = tier.crf();
  return preset;
}

Dimensions FitWithin(uint32_t src_width, uint32_t src_height, uint32_t target_width, uint32_t target_height) {
  if (src_width == 0 || src_height == 0) {
    throw util::InvalidState("source dimensions must be non-zero");
  }

  const double aspect        = static_cast<double>(src_width) / static_cast<double>(src_height);
  const double target_aspect = static_cast<double>(target_width) / static_cast<double>(target_height);

  Dimensions out;
  if (aspect > target_aspect) {
    out.width  = target_width;
    out.height = static_cast<uint32_t>(static_cast<double>(target_width) / aspect);
  } else {
    out.width  = static_cast<uint32_t>(static_cast<double>(target_height) * aspect);
    out.height = target_height;
  }

  out.width -= out.width % 2;
  out.height -= out.height % 2;
  if (out.width == 0) out.width = 2;
  if (out.height == 0) out.height = 2;
  return out;
}

uint64_t ParseBitrate(const std::string& bitrate) {
  if (bitrate.empty()) {
    throw util::InvalidState("empty bitrate");
  }

  size_t   pos   = 0;
  uint64_t value = 0;
  while (pos < bitrate.size() && std::isdigit(static_cast<unsigned char>(bitrate[pos]))) {
    value = value * 10 + static_cast<uint64_t>(bitrate[pos] - '0');
    ++pos;
  }
  if (pos == 0) {
    throw util::InvalidState("invalid bitrate: " + bitrate);
  }
  if (pos == bitrate.size()) return value;

  if (pos + 1 != bitrate.size()) {
    throw util::InvalidState("invalid bitrate: " + bitrate);
  }
  switch (bitrate[pos]) {
    case 'k':
    case 'K':
      return value * 1000;
    case 'm':
    case 'M':
      return value * 1000 * 1000;
    default:
      throw util::InvalidState("invalid bitrate suffix: " + bitrate);
  }
}

std::vector<double> ThumbnailTimestamps(double duration_s, uint32_t count) {
  std::vector<double> out;
  out.reserve(count);
  const double interval = duration_s / static_cast<double>(count + 1);
  for (uint32_t i = 0; i < count; ++i) {
    out.push_back(interval * static_cast<double>(i + 1));
  }
  return out;
}

} // namespace vidpipe::pipeline
