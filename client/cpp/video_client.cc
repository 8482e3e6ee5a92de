#include "client/cpp/video_client.h"

#include <grpcpp/client_context.h>

#include <thread>

#include "client/cpp/grpc_endpoint.h"

namespace vidpipe::client {

VideoClient::VideoClient(std::shared_ptr<grpc::Channel> channel) : stub_(vidpipe::v1::VideoService::NewStub(channel)) {}

arrow::Result<vidpipe::v1::VideoStatusReport> VideoClient::GetStatus(const std::string& video_id) const {
  vidpipe::v1::GetVideoStatusRequest req;
  req.set_video_id(video_id);

  vidpipe::v1::VideoStatusReport resp;
  grpc::ClientContext            ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetVideoStatus(&ctx, req, &resp), "GetVideoStatus"));
  return resp;
}

arrow::Result<vidpipe::v1::CancelProcessingResponse> VideoClient::CancelProcessing(const std::string& video_id) const {
  vidpipe::v1::CancelProcessingRequest req;
  req.set_video_id(video_id);

  vidpipe::v1::CancelProcessingResponse resp;
  grpc::ClientContext                   ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CancelProcessing(&ctx, req, &resp), "CancelProcessing"));
  return resp;
}

arrow::Result<vidpipe::v1::ResubmitResponse> VideoClient::Resubmit(const std::string& video_id) const {
  vidpipe::v1::ResubmitRequest req;
  req.set_video_id(video_id);

  vidpipe::v1::ResubmitResponse resp;
  grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Resubmit(&ctx, req, &resp), "Resubmit"));
  return resp;
}

arrow::Result<vidpipe::v1::VideoStatusReport> VideoClient::WaitForTerminal(const std::string& video_id,
                                                                           std::chrono::milliseconds timeout,
                                                                           std::chrono::milliseconds interval) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto report, GetStatus(video_id));
    if (report.status() == vidpipe::v1::VIDEO_STATUS_COMPLETED || report.status() == vidpipe::v1::VIDEO_STATUS_FAILED) {
      return report;
    }
    if (std::chrono::steady_clock::now() + interval > deadline) {
      return arrow::Status::IOError("video ", video_id, " still ", report.status_name(), " after timeout");
    }
    std::this_thread::sleep_for(interval);
  }
}

} // namespace vidpipe::client
