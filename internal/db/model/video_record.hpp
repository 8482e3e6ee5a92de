#pragma once

#include <cstdint>
#include <string>

#include "internal/model/video_status.hpp"
#include "vidpipe/v1/types.pb.h"

namespace vidpipe::db::model {

/*
  Persistent video row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - Only the ingestion endpoint (initial insert) and the worker holding
    the job lease write it.
  - Version increments on every update.
*/

struct VideoRecord {
  std::string video_id;
  std::string owner_id;
  std::string source_object_key;
  std::string filename;

  uint64_t size_bytes = 0;

  vidpipe::model::VideoStatus status = vidpipe::model::VideoStatus::kPending;

  double progress = 0.0;

  vidpipe::v1::ResultManifest manifest;

  std::string error_message;

  uint64_t created_at_ms              = 0;
  uint64_t processing_started_at_ms   = 0; // 0 = not started
  uint64_t processing_completed_at_ms  = 0; // 0 = not completed

  uint64_t version = 0;
};

} // namespace vidpipe::db::model
