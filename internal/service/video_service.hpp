#pragma once

#include "internal/db/model/video_record.hpp"
#include "service_context.hpp"
#include "vidpipe/v1/video_service.pb.h"

namespace vidpipe::service {

/*
  Status reads plus the two owner actions on an existing video.

  CancelProcessing only succeeds while the job waits in the queue;
  once a worker holds the lease it is refused with LeaseConflict.
  Resubmit re-runs a terminal video and keeps finished renditions so
  they are not transcoded again.
*/
class VideoService {
 public:
  explicit VideoService(ServiceContext ctx);

  vidpipe::v1::VideoStatusReport GetVideoStatus(const vidpipe::v1::GetVideoStatusRequest& req);

  vidpipe::v1::CancelProcessingResponse CancelProcessing(const vidpipe::v1::CancelProcessingRequest& req);

  vidpipe::v1::ResubmitResponse Resubmit(const vidpipe::v1::ResubmitRequest& req);

 private:
  ServiceContext ctx_;
};

// Snapshot of the row as clients see it.
vidpipe::v1::VideoStatusReport ToStatusReport(const vidpipe::db::model::VideoRecord& video);

} // namespace vidpipe::service
