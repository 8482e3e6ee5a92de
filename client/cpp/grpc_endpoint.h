#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "client/cpp/resumable_endpoint.h"
#include "vidpipe/v1/upload_service.grpc.pb.h"

namespace vidpipe::client {

// Translates a gRPC status into the arrow status classes ResumableEndpoint documents.
arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action);

class GrpcResumableEndpoint final : public ResumableEndpoint {
 public:
  explicit GrpcResumableEndpoint(std::shared_ptr<grpc::Channel> channel,
                                 std::chrono::milliseconds       deadline = std::chrono::seconds(60));

  arrow::Result<RemoteOffset> CreateUpload(const std::string& upload_id, const std::string& owner_id,
                                           const std::string& filename, uint64_t declared_size) override;

  arrow::Result<RemoteOffset> QueryOffset(const std::string& upload_id) override;

  arrow::Result<ChunkAck> AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data) override;

  arrow::Status CancelUpload(const std::string& upload_id) override;

 private:
  std::unique_ptr<vidpipe::v1::UploadService::Stub> stub_;
  std::chrono::milliseconds                         deadline_;
};

} // namespace vidpipe::client
