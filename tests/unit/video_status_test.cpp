#include "internal/model/video_status.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

using vidpipe::model::CanTransition;
using vidpipe::model::IsTerminal;
using vidpipe::model::VideoStatus;

constexpr VideoStatus kAll[] = {VideoStatus::kPending,         VideoStatus::kDownloading, VideoStatus::kTranscoding,
                                VideoStatus::kThumbnailing,    VideoStatus::kExtractingAudio,
                                VideoStatus::kCompleted,       VideoStatus::kFailed};

void TestForwardTransitionsOnly() {
  assert(CanTransition(VideoStatus::kPending, VideoStatus::kDownloading));
  assert(CanTransition(VideoStatus::kExtractingAudio, VideoStatus::kCompleted));
  assert(CanTransition(VideoStatus::kTranscoding, VideoStatus::kTranscoding));

  assert(!CanTransition(VideoStatus::kPending, VideoStatus::kTranscoding));
  assert(!CanTransition(VideoStatus::kThumbnailing, VideoStatus::kTranscoding));
  assert(!CanTransition(VideoStatus::kDownloading, VideoStatus::kPending));
}

void TestAnyActiveStateMayFail() {
  for (auto status : kAll) {
    assert(CanTransition(status, VideoStatus::kFailed) == !IsTerminal(status));
  }
}

void TestTerminalStatesAreFinal() {
  for (auto to : kAll) {
    assert(!CanTransition(VideoStatus::kCompleted, to));
    assert(!CanTransition(VideoStatus::kFailed, to));
  }
  assert(!vidpipe::model::NextStage(VideoStatus::kCompleted).has_value());
  assert(vidpipe::model::NextStage(VideoStatus::kThumbnailing) == VideoStatus::kExtractingAudio);
}

void TestProgressMarksAreMonotonic() {
  double last = -1.0;
  for (auto status = VideoStatus::kPending; status != VideoStatus::kFailed;
       status      = *vidpipe::model::NextStage(status)) {
    const double progress = vidpipe::model::StageCompletedProgress(status);
    assert(progress > last);
    last = progress;
    if (status == VideoStatus::kCompleted) break;
  }
  assert(last == 1.0);
}

void TestNamesRoundTrip() {
  assert(vidpipe::model::ToString(VideoStatus::kExtractingAudio) == "extracting_audio");
  for (auto status : kAll) {
    assert(vidpipe::model::ParseVideoStatus(vidpipe::model::ToString(status)) == status);
    assert(vidpipe::model::FromProto(vidpipe::model::ToProto(status)) == status);
  }
  assert(!vidpipe::model::ParseVideoStatus("uploading").has_value());
  assert(vidpipe::model::ToProto(VideoStatus::kPending) == vidpipe::v1::VIDEO_STATUS_PENDING);
  assert(vidpipe::model::ToProto(VideoStatus::kFailed) == vidpipe::v1::VIDEO_STATUS_FAILED);
}

void TestUnspecifiedProtoStatusIsRejected() {
  bool threw = false;
  try {
    (void)vidpipe::model::FromProto(vidpipe::v1::VIDEO_STATUS_UNSPECIFIED);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestForwardTransitionsOnly();
  TestAnyActiveStateMayFail();
  TestTerminalStatesAreFinal();
  TestProgressMarksAreMonotonic();
  TestNamesRoundTrip();
  TestUnspecifiedProtoStatusIsRejected();

  std::cout << "vidpipe_unit_video_status: pass\n";
  return 0;
}
