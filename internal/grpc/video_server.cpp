#include "video_server.hpp"
#include "grpc_error.hpp"

namespace vidpipe::grpc {

VideoServer::VideoServer(std::shared_ptr<vidpipe::service::VideoService> svc) : service_(std::move(svc)) {
}

::grpc::Status VideoServer::GetVideoStatus(::grpc::ServerContext*, const vidpipe::v1::GetVideoStatusRequest* req,
                                           vidpipe::v1::VideoStatusReport* resp) {
  try {
    *resp = service_->GetVideoStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VideoServer::CancelProcessing(::grpc::ServerContext*, const vidpipe::v1::CancelProcessingRequest* req,
                                             vidpipe::v1::CancelProcessingResponse* resp) {
  try {
    *resp = service_->CancelProcessing(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VideoServer::Resubmit(::grpc::ServerContext*, const vidpipe::v1::ResubmitRequest* req,
                                     vidpipe::v1::ResubmitResponse* resp) {
  try {
    *resp = service_->Resubmit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vidpipe::grpc
