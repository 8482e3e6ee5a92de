#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "vidpipe/v1/types.pb.h"

namespace vidpipe::model {

/*
  Per-video processing state machine.

  Ordinals are persisted and exposed externally; the order is
  significant and must not change without a data migration.
*/
enum class VideoStatus : std::uint8_t {
  kPending         = 0,
  kDownloading     = 1,
  kTranscoding     = 2,
  kThumbnailing    = 3,
  kExtractingAudio = 4,
  kCompleted       = 5,
  kFailed          = 6,
};

constexpr bool IsTerminal(VideoStatus status) {
  return status == VideoStatus::kCompleted || status == VideoStatus::kFailed;
}

/*
  Forward-only: a status may advance to the next stage, stay where it
  is (a re-entered stage), or fail from any non-terminal state.
*/
constexpr bool CanTransition(VideoStatus from, VideoStatus to) {
  if (from == to) {
    return !IsTerminal(from);
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == VideoStatus::kFailed) {
    return true;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::optional<VideoStatus> NextStage(VideoStatus status) {
  switch (status) {
    case VideoStatus::kPending:
      return VideoStatus::kDownloading;
    case VideoStatus::kDownloading:
      return VideoStatus::kTranscoding;
    case VideoStatus::kTranscoding:
      return VideoStatus::kThumbnailing;
    case VideoStatus::kThumbnailing:
      return VideoStatus::kExtractingAudio;
    case VideoStatus::kExtractingAudio:
      return VideoStatus::kCompleted;
    case VideoStatus::kCompleted:
    case VideoStatus::kFailed:
      return std::nullopt;
  }
  return std::nullopt;
}

/*
  Progress reached once a stage has fully completed. Progress inside a
  stage lies between the previous stage's value and its own.
*/
constexpr double StageCompletedProgress(VideoStatus status) {
  switch (status) {
    case VideoStatus::kPending:
      return 0.0;
    case VideoStatus::kDownloading:
      return 0.10;
    case VideoStatus::kTranscoding:
      return 0.70;
    case VideoStatus::kThumbnailing:
      return 0.85;
    case VideoStatus::kExtractingAudio:
      return 0.95;
    case VideoStatus::kCompleted:
      return 1.0;
    case VideoStatus::kFailed:
      return 0.0;
  }
  return 0.0;
}

// "pending", "downloading", ..., "extracting_audio", "completed", "failed"
std::string_view ToString(VideoStatus status);
std::optional<VideoStatus> ParseVideoStatus(std::string_view name);

vidpipe::v1::VideoStatus ToProto(VideoStatus status);
VideoStatus              FromProto(vidpipe::v1::VideoStatus status);

} // namespace vidpipe::model
