#include "internal/model/video_status.hpp"

#include <stdexcept>
#include <string>

namespace vidpipe::model {

namespace {

struct StatusName {
  VideoStatus      status;
  std::string_view name;
};

constexpr StatusName kNames[] = {
    {VideoStatus::kPending, "pending"},
    {VideoStatus::kDownloading, "downloading"},
    {VideoStatus::kTranscoding, "transcoding"},
    {VideoStatus::kThumbnailing, "thumbnailing"},
    {VideoStatus::kExtractingAudio, "extracting_audio"},
    {VideoStatus::kCompleted, "completed"},
    {VideoStatus::kFailed, "failed"},
};

} // namespace

std::string_view ToString(VideoStatus status) {
  for (const auto& entry : kNames) {
    if (entry.status == status) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<VideoStatus> ParseVideoStatus(std::string_view name) {
  for (const auto& entry : kNames) {
    if (entry.name == name) {
      return entry.status;
    }
  }
  return std::nullopt;
}

vidpipe::v1::VideoStatus ToProto(VideoStatus status) {
  // proto enum reserves 0 for UNSPECIFIED
  return static_cast<vidpipe::v1::VideoStatus>(static_cast<int>(status) + 1);
}

VideoStatus FromProto(vidpipe::v1::VideoStatus status) {
  if (status == vidpipe::v1::VIDEO_STATUS_UNSPECIFIED || !vidpipe::v1::VideoStatus_IsValid(status)) {
    throw std::invalid_argument("unspecified video status: " + std::to_string(static_cast<int>(status)));
  }
  return static_cast<VideoStatus>(static_cast<int>(status) - 1);
}

} // namespace vidpipe::model
