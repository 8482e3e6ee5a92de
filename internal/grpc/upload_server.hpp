#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/upload_service.hpp"
#include "vidpipe/v1/upload_service.grpc.pb.h"

namespace vidpipe::grpc {

class UploadServer final : public vidpipe::v1::UploadService::Service {
 public:
  explicit UploadServer(std::shared_ptr<vidpipe::service::UploadService> svc);

  ::grpc::Status CreateUpload(::grpc::ServerContext* ctx, const vidpipe::v1::CreateUploadRequest* req,
                              vidpipe::v1::CreateUploadResponse* resp) override;

  ::grpc::Status QueryOffset(::grpc::ServerContext* ctx, const vidpipe::v1::QueryOffsetRequest* req,
                             vidpipe::v1::QueryOffsetResponse* resp) override;

  ::grpc::Status AppendChunk(::grpc::ServerContext* ctx, const vidpipe::v1::AppendChunkRequest* req,
                             vidpipe::v1::AppendChunkResponse* resp) override;

  ::grpc::Status CancelUpload(::grpc::ServerContext* ctx, const vidpipe::v1::CancelUploadRequest* req,
                              google::protobuf::Empty* resp) override;

  ::grpc::Status UploadVideo(::grpc::ServerContext* ctx, const vidpipe::v1::UploadVideoRequest* req,
                             vidpipe::v1::UploadVideoResponse* resp) override;

 private:
  std::shared_ptr<vidpipe::service::UploadService> service_;
};

} // namespace vidpipe::grpc
