#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/video_service.hpp"
#include "vidpipe/v1/video_service.grpc.pb.h"

namespace vidpipe::grpc {

class VideoServer final : public vidpipe::v1::VideoService::Service {
 public:
  explicit VideoServer(std::shared_ptr<vidpipe::service::VideoService> svc);

  ::grpc::Status GetVideoStatus(::grpc::ServerContext* ctx, const vidpipe::v1::GetVideoStatusRequest* req,
                                vidpipe::v1::VideoStatusReport* resp) override;

  ::grpc::Status CancelProcessing(::grpc::ServerContext* ctx, const vidpipe::v1::CancelProcessingRequest* req,
                                  vidpipe::v1::CancelProcessingResponse* resp) override;

  ::grpc::Status Resubmit(::grpc::ServerContext* ctx, const vidpipe::v1::ResubmitRequest* req,
                          vidpipe::v1::ResubmitResponse* resp) override;

 private:
  std::shared_ptr<vidpipe::service::VideoService> service_;
};

} // namespace vidpipe::grpc
