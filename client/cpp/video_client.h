#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "vidpipe/v1/video_service.grpc.pb.h"

namespace vidpipe::client {

class VideoClient {
 public:
  explicit VideoClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<vidpipe::v1::VideoStatusReport> GetStatus(const std::string& video_id) const;

  arrow::Result<vidpipe::v1::CancelProcessingResponse> CancelProcessing(const std::string& video_id) const;

  arrow::Result<vidpipe::v1::ResubmitResponse> Resubmit(const std::string& video_id) const;

  // Polls until the video is completed or failed, or the timeout passes.
  arrow::Result<vidpipe::v1::VideoStatusReport> WaitForTerminal(const std::string& video_id, std::chrono::milliseconds timeout,
                                                                std::chrono::milliseconds interval = std::chrono::seconds(2)) const;

 private:
  std::unique_ptr<vidpipe::v1::VideoService::Stub> stub_;
};

} // namespace vidpipe::client
