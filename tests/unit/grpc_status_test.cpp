#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/grpc/video_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/service/video_service.hpp"
#include "tests/support/test_support.hpp"

namespace {

using vidpipe::testing::Harness;

vidpipe::service::ServiceContext BuildServiceContext(Harness& h) {
  vidpipe::service::ServiceContext ctx;
  ctx.repository = h.repository;
  ctx.queue      = h.queue;
  ctx.ingestion  = h.ingestion;
  ctx.clock      = h.clock;
  return ctx;
}

void TestUploadVideoReturnsPendingVideo() {
  Harness                     h("grpc_upload_ok");
  vidpipe::grpc::UploadServer server(std::make_shared<vidpipe::service::UploadService>(BuildServiceContext(h)));

  const auto bytes = vidpipe::testing::Mp4Bytes(1024);

  vidpipe::v1::UploadVideoRequest req;
  req.set_owner_id("owner-1");
  req.set_filename("clip.mp4");
  req.set_declared_size(bytes.size());
  req.set_data(bytes);
  vidpipe::v1::UploadVideoResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = server.UploadVideo(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.video_id().empty());
  assert(resp.status() == vidpipe::v1::VIDEO_STATUS_PENDING);
  assert(resp.status_name() == "pending");

  // the stored source outlives the request buffer
  req.Clear();
  auto video = h.Video(resp.video_id());
  assert(vidpipe::testing::ToString(h.objects->Get(video->source_object_key)) == bytes);
}

void TestEmptyUploadReturnsInvalidArgument() {
  Harness                     h("grpc_upload_empty");
  vidpipe::grpc::UploadServer server(std::make_shared<vidpipe::service::UploadService>(BuildServiceContext(h)));

  vidpipe::v1::UploadVideoRequest req;
  req.set_owner_id("owner-1");
  req.set_filename("clip.mp4");
  vidpipe::v1::UploadVideoResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = server.UploadVideo(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestChunkAtWrongOffsetReturnsAborted() {
  Harness                     h("grpc_offset");
  vidpipe::grpc::UploadServer server(std::make_shared<vidpipe::service::UploadService>(BuildServiceContext(h)));

  vidpipe::v1::CreateUploadRequest create;
  create.set_upload_id("u-1");
  create.set_owner_id("owner-1");
  create.set_filename("clip.mp4");
  create.set_declared_size(100);
  vidpipe::v1::CreateUploadResponse created;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateUpload(&grpc_ctx, &create, &created).ok());
  }
  assert(created.confirmed_offset() == 0);
  assert(created.has_expires_at());

  vidpipe::v1::AppendChunkRequest append;
  append.set_upload_id("u-1");
  append.set_offset(10);
  append.set_data("0123456789");
  vidpipe::v1::AppendChunkResponse appended;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = server.AppendChunk(&grpc_ctx, &append, &appended);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
  assert(status.error_message().find("confirmed offset 0") != std::string::npos);
}

void TestUploadIdReuseReturnsAlreadyExists() {
  Harness                     h("grpc_reuse");
  vidpipe::grpc::UploadServer server(std::make_shared<vidpipe::service::UploadService>(BuildServiceContext(h)));

  vidpipe::v1::CreateUploadRequest create;
  create.set_upload_id("u-1");
  create.set_owner_id("owner-1");
  create.set_filename("clip.mp4");
  create.set_declared_size(100);
  vidpipe::v1::CreateUploadResponse created;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.CreateUpload(&grpc_ctx, &create, &created).ok());
  }

  create.set_declared_size(200);
  ::grpc::ServerContext grpc_ctx;
  assert(server.CreateUpload(&grpc_ctx, &create, &created).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestUnknownUploadReturnsNotFound() {
  Harness                     h("grpc_unknown_upload");
  vidpipe::grpc::UploadServer server(std::make_shared<vidpipe::service::UploadService>(BuildServiceContext(h)));

  vidpipe::v1::QueryOffsetRequest  req;
  req.set_upload_id("missing");
  vidpipe::v1::QueryOffsetResponse resp;
  ::grpc::ServerContext            grpc_ctx;
  assert(server.QueryOffset(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStatusOfMissingVideoReturnsNotFound() {
  Harness                    h("grpc_status_missing");
  vidpipe::grpc::VideoServer server(std::make_shared<vidpipe::service::VideoService>(BuildServiceContext(h)));

  vidpipe::v1::GetVideoStatusRequest req;
  req.set_video_id("missing-video");
  vidpipe::v1::VideoStatusReport resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.GetVideoStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  req.clear_video_id();
  ::grpc::ServerContext grpc_ctx;
  assert(server.GetVideoStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCancelWhileLeasedReturnsFailedPrecondition() {
  Harness                    h("grpc_cancel_leased");
  vidpipe::grpc::VideoServer server(std::make_shared<vidpipe::service::VideoService>(BuildServiceContext(h)));

  const auto video_id = h.IngestVideo();
  auto       lease    = h.queue->Dequeue();
  assert(lease.has_value());

  vidpipe::v1::CancelProcessingRequest req;
  req.set_video_id(video_id);
  vidpipe::v1::CancelProcessingResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = server.CancelProcessing(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(h.Video(video_id)->status == vidpipe::model::VideoStatus::kPending);
}

void TestExceptionMapping() {
  using vidpipe::grpc::ToStatus;
  assert(ToStatus(vidpipe::util::TransientIo("db down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(vidpipe::util::ResourceExhausted("disk")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(vidpipe::util::LeaseConflict("lease")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::invalid_argument("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestUploadVideoReturnsPendingVideo();
  TestEmptyUploadReturnsInvalidArgument();
  TestChunkAtWrongOffsetReturnsAborted();
  TestUploadIdReuseReturnsAlreadyExists();
  TestUnknownUploadReturnsNotFound();
  TestStatusOfMissingVideoReturnsNotFound();
  TestCancelWhileLeasedReturnsFailedPrecondition();
  TestExceptionMapping();

  std::cout << "vidpipe_unit_grpc_status: pass\n";
  return 0;
}
