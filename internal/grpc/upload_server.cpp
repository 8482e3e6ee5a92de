#include "upload_server.hpp"
#include "grpc_error.hpp"

namespace vidpipe::grpc {

UploadServer::UploadServer(std::shared_ptr<vidpipe::service::UploadService> svc) : service_(std::move(svc)) {
}

::grpc::Status UploadServer::CreateUpload(::grpc::ServerContext*, const vidpipe::v1::CreateUploadRequest* req,
                                          vidpipe::v1::CreateUploadResponse* resp) {
  try {
    *resp = service_->CreateUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::QueryOffset(::grpc::ServerContext*, const vidpipe::v1::QueryOffsetRequest* req,
                                         vidpipe::v1::QueryOffsetResponse* resp) {
  try {
    *resp = service_->QueryOffset(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::AppendChunk(::grpc::ServerContext*, const vidpipe::v1::AppendChunkRequest* req,
                                         vidpipe::v1::AppendChunkResponse* resp) {
  try {
    *resp = service_->AppendChunk(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::CancelUpload(::grpc::ServerContext*, const vidpipe::v1::CancelUploadRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->CancelUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::UploadVideo(::grpc::ServerContext*, const vidpipe::v1::UploadVideoRequest* req,
                                         vidpipe::v1::UploadVideoResponse* resp) {
  try {
    *resp = service_->UploadVideo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vidpipe::grpc
