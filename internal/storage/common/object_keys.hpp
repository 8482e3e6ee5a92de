#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace vidpipe::storage::keys {

/*
  Object key layout. Downstream players read these paths directly, so
  the format is fixed:

      videos/original/<video_id>_<filename>
      videos/transcoded/<quality>/<video_id>.mp4
      videos/thumbnails/<video_id>/thumb_<n>.jpg
      videos/audio/<video_id>.mp3
*/

inline void ValidateSegment(const std::string& segment, const char* what) {
  if (segment.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : segment) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (segment == "." || segment == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

inline std::string OriginalKey(const std::string& video_id, const std::string& filename) {
  ValidateSegment(video_id, "video id");
  ValidateSegment(filename, "filename");
  return "videos/original/" + video_id + "_" + filename;
}

inline std::string RenditionKey(const std::string& quality, const std::string& video_id) {
  ValidateSegment(quality, "quality");
  ValidateSegment(video_id, "video id");
  return "videos/transcoded/" + quality + "/" + video_id + ".mp4";
}

// n is 0-based
inline std::string ThumbnailKey(const std::string& video_id, uint32_t n) {
  ValidateSegment(video_id, "video id");
  return "videos/thumbnails/" + video_id + "/thumb_" + std::to_string(n) + ".jpg";
}

inline std::string AudioKey(const std::string& video_id) {
  ValidateSegment(video_id, "video id");
  return "videos/audio/" + video_id + ".mp3";
}

} // namespace vidpipe::storage::keys
