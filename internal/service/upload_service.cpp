#include "upload_service.hpp"

#include <arrow/buffer.h>

#include "internal/ingest/ingestion_service.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace vidpipe::service {

using namespace vidpipe::v1;

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateUploadResponse UploadService::CreateUpload(const CreateUploadRequest& req) {
  return ObserveRpc("UploadService.CreateUpload", "upload_id", req.upload_id(), [&] {
    const auto state = ctx_.ingestion->CreateUpload(req.upload_id(), req.owner_id(), req.filename(), req.declared_size());

    CreateUploadResponse resp;
    resp.set_upload_id(state.upload_id);
    resp.set_confirmed_offset(state.confirmed_offset);
    *resp.mutable_expires_at() = util::ToProto(util::FromUnixMillis(state.expires_at_ms));
    return resp;
  });
}

QueryOffsetResponse UploadService::QueryOffset(const QueryOffsetRequest& req) {
  return ObserveRpc("UploadService.QueryOffset", "upload_id", req.upload_id(), [&] {
    const auto state = ctx_.ingestion->QueryOffset(req.upload_id());

    QueryOffsetResponse resp;
    resp.set_upload_id(state.upload_id);
    resp.set_confirmed_offset(state.confirmed_offset);
    resp.set_declared_size(state.declared_size);
    resp.set_video_id(state.video_id);
    return resp;
  });
}

AppendChunkResponse UploadService::AppendChunk(const AppendChunkRequest& req) {
  return ObserveRpc("UploadService.AppendChunk", "upload_id", req.upload_id(), [&] {
    const auto result = ctx_.ingestion->AppendChunk(req.upload_id(), req.offset(), req.data());

    AppendChunkResponse resp;
    resp.set_confirmed_offset(result.confirmed_offset);
    resp.set_completed(result.completed);
    if (result.completed) {
      resp.set_video_id(result.video_id);
      resp.set_status(model::ToProto(result.status));
      resp.set_status_name(std::string(model::ToString(result.status)));
    }
    return resp;
  });
}

void UploadService::CancelUpload(const CancelUploadRequest& req) {
  ObserveRpc("UploadService.CancelUpload", "upload_id", req.upload_id(),
             [&] { ctx_.ingestion->CancelUpload(req.upload_id()); });
}

UploadVideoResponse UploadService::UploadVideo(const UploadVideoRequest& req) {
  return ObserveRpc("UploadService.UploadVideo", "filename", req.filename(), [&] {
    // owned copy, the object store may keep the buffer past this request
    auto       data   = arrow::Buffer::FromString(req.data());
    const auto result = ctx_.ingestion->UploadVideo(req.owner_id(), req.filename(), req.declared_size(), data);

    UploadVideoResponse resp;
    resp.set_video_id(result.video_id);
    resp.set_status(model::ToProto(result.status));
    resp.set_status_name(std::string(model::ToString(result.status)));
    return resp;
  });
}

} // namespace vidpipe::service
