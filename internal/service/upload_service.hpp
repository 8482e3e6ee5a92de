#pragma once

#include "service_context.hpp"
#include "vidpipe/v1/upload_service.pb.h"

namespace vidpipe::service {

class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  vidpipe::v1::CreateUploadResponse CreateUpload(const vidpipe::v1::CreateUploadRequest& req);

  vidpipe::v1::QueryOffsetResponse QueryOffset(const vidpipe::v1::QueryOffsetRequest& req);

  vidpipe::v1::AppendChunkResponse AppendChunk(const vidpipe::v1::AppendChunkRequest& req);

  void CancelUpload(const vidpipe::v1::CancelUploadRequest& req);

  vidpipe::v1::UploadVideoResponse UploadVideo(const vidpipe::v1::UploadVideoRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vidpipe::service
