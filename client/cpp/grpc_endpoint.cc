#include "client/cpp/grpc_endpoint.h"

#include <grpcpp/client_context.h>

#include <string>

namespace vidpipe::client {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::ALREADY_EXISTS:
    case grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(std::string(action), " rejected: ", status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

GrpcResumableEndpoint::GrpcResumableEndpoint(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(vidpipe::v1::UploadService::NewStub(channel)), deadline_(deadline) {}

namespace {

void SetDeadline(grpc::ClientContext* ctx, std::chrono::milliseconds deadline) {
  if (deadline.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + deadline);
  }
}

} // namespace

arrow::Result<RemoteOffset> GrpcResumableEndpoint::CreateUpload(const std::string& upload_id, const std::string& owner_id,
                                                                const std::string& filename, uint64_t declared_size) {
  vidpipe::v1::CreateUploadRequest req;
  req.set_upload_id(upload_id);
  req.set_owner_id(owner_id);
  req.set_filename(filename);
  req.set_declared_size(declared_size);

  vidpipe::v1::CreateUploadResponse resp;
  grpc::ClientContext               ctx;
  SetDeadline(&ctx, deadline_);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CreateUpload(&ctx, req, &resp), "CreateUpload"));

  RemoteOffset out;
  out.confirmed_offset = resp.confirmed_offset();
  out.declared_size    = declared_size;
  return out;
}

arrow::Result<RemoteOffset> GrpcResumableEndpoint::QueryOffset(const std::string& upload_id) {
  vidpipe::v1::QueryOffsetRequest req;
  req.set_upload_id(upload_id);

  vidpipe::v1::QueryOffsetResponse resp;
  grpc::ClientContext              ctx;
  SetDeadline(&ctx, deadline_);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->QueryOffset(&ctx, req, &resp), "QueryOffset"));

  RemoteOffset out;
  out.confirmed_offset = resp.confirmed_offset();
  out.declared_size    = resp.declared_size();
  out.video_id         = resp.video_id();
  return out;
}

arrow::Result<ChunkAck> GrpcResumableEndpoint::AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data) {
  vidpipe::v1::AppendChunkRequest req;
  req.set_upload_id(upload_id);
  req.set_offset(offset);
  req.set_data(std::string(data));

  vidpipe::v1::AppendChunkResponse resp;
  grpc::ClientContext              ctx;
  SetDeadline(&ctx, deadline_);
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->AppendChunk(&ctx, req, &resp), "AppendChunk"));

  ChunkAck ack;
  ack.confirmed_offset = resp.confirmed_offset();
  ack.completed        = resp.completed();
  ack.video_id         = resp.video_id();
  return ack;
}

arrow::Status GrpcResumableEndpoint::CancelUpload(const std::string& upload_id) {
  vidpipe::v1::CancelUploadRequest req;
  req.set_upload_id(upload_id);

  google::protobuf::Empty resp;
  grpc::ClientContext     ctx;
  SetDeadline(&ctx, deadline_);
  return GrpcToArrow(stub_->CancelUpload(&ctx, req, &resp), "CancelUpload");
}

} // namespace vidpipe::client
