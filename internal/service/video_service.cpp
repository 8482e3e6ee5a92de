#include "video_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction_runner.hpp"
#include "internal/model/video_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace vidpipe::service {

using namespace vidpipe::v1;
using vidpipe::db::model::VideoRecord;
using vidpipe::model::VideoStatus;
using vidpipe::observability::StringField;

namespace {

constexpr const char* kCancelledMessage = "cancelled by owner";

void RequireVideoId(const std::string& video_id) {
  if (video_id.empty()) {
    throw std::invalid_argument("video_id is required");
  }
}

} // namespace

VideoStatusReport ToStatusReport(const VideoRecord& video) {
  VideoStatusReport report;
  report.set_video_id(video.video_id);
  report.set_status(model::ToProto(video.status));
  report.set_status_name(std::string(model::ToString(video.status)));
  report.set_progress(video.progress);

  if (video.created_at_ms != 0) {
    *report.mutable_created_at() = util::ToProto(util::FromUnixMillis(video.created_at_ms));
  }
  if (video.processing_started_at_ms != 0) {
    *report.mutable_started_at() = util::ToProto(util::FromUnixMillis(video.processing_started_at_ms));
  }
  if (video.processing_completed_at_ms != 0) {
    *report.mutable_completed_at() = util::ToProto(util::FromUnixMillis(video.processing_completed_at_ms));
  }
  if (!video.error_message.empty()) {
    report.set_error_message(video.error_message);
  }
  if (video.status == VideoStatus::kCompleted) {
    *report.mutable_result_manifest() = video.manifest;
  }
  return report;
}

VideoService::VideoService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

VideoStatusReport VideoService::GetVideoStatus(const GetVideoStatusRequest& req) {
  return ObserveRpc("VideoService.GetVideoStatus", "video_id", req.video_id(), [&] {
    RequireVideoId(req.video_id());

    auto video = db::ReadInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      return ctx_.repository->GetVideo(tx, req.video_id());
    });
    if (!video) {
      throw util::NotFound("video not found: " + req.video_id());
    }
    return ToStatusReport(*video);
  });
}

CancelProcessingResponse VideoService::CancelProcessing(const CancelProcessingRequest& req) {
  return ObserveRpc("VideoService.CancelProcessing", "video_id", req.video_id(), [&] {
    RequireVideoId(req.video_id());

    auto video = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto current = ctx_.repository->GetVideo(tx, req.video_id());
      if (!current) {
        throw util::NotFound("video not found: " + req.video_id());
      }
      if (model::IsTerminal(current->status)) {
        throw util::InvalidState("video " + req.video_id() + " already " + std::string(model::ToString(current->status)));
      }

      // throws LeaseConflict while a worker owns the job
      ctx_.queue->CancelQueued(tx, req.video_id());

      current->status        = VideoStatus::kFailed;
      current->error_message = kCancelledMessage;
      current->version += 1;
      db::ThrowIfError(ctx_.repository->UpdateVideo(tx, *current), "cancel video");
      return *current;
    });

    VIDPIPE_LOG_INFO("processing cancelled", {StringField("video_id", video.video_id)});

    CancelProcessingResponse resp;
    resp.set_video_id(video.video_id);
    resp.set_status(model::ToProto(video.status));
    resp.set_status_name(std::string(model::ToString(video.status)));
    return resp;
  });
}

ResubmitResponse VideoService::Resubmit(const ResubmitRequest& req) {
  return ObserveRpc("VideoService.Resubmit", "video_id", req.video_id(), [&] {
    RequireVideoId(req.video_id());

    std::string job_id;
    auto        video = db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto current = ctx_.repository->GetVideo(tx, req.video_id());
      if (!current) {
        throw util::NotFound("video not found: " + req.video_id());
      }
      if (!model::IsTerminal(current->status)) {
        throw util::InvalidState("video " + req.video_id() + " is still " + std::string(model::ToString(current->status)));
      }
      if (ctx_.repository->GetJobByVideo(tx, req.video_id())) {
        throw util::InvalidState("video " + req.video_id() + " already has a queued job");
      }

      // renditions survive, everything derived after them is rebuilt
      current->manifest.clear_thumbnails();
      current->manifest.clear_audio();
      current->status                     = VideoStatus::kPending;
      current->progress                   = 0.0;
      current->error_message.clear();
      current->processing_started_at_ms   = 0;
      current->processing_completed_at_ms = 0;
      current->version += 1;
      db::ThrowIfError(ctx_.repository->UpdateVideo(tx, *current), "resubmit video");

      job_id = ctx_.queue->Enqueue(tx, current->video_id).job_id;
      return *current;
    });

    VIDPIPE_LOG_INFO("video resubmitted", {StringField("video_id", video.video_id), StringField("job_id", job_id),
                                           observability::IntField("kept_renditions", video.manifest.renditions_size())});

    ResubmitResponse resp;
    resp.set_video_id(video.video_id);
    resp.set_status(model::ToProto(video.status));
    resp.set_status_name(std::string(model::ToString(video.status)));
    resp.set_job_id(job_id);
    return resp;
  });
}

} // namespace vidpipe::service
