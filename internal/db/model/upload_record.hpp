#pragma once

#include <cstdint>
#include <string>

namespace vidpipe::db::model {

/*
  Server side of a resumable upload, keyed by the client-chosen id.
  confirmed_offset is the byte count durably written to staging.
*/
struct UploadRecord {
  std::string upload_id;
  std::string owner_id;
  std::string filename;

  uint64_t declared_size    = 0;
  uint64_t confirmed_offset = 0;

  std::string staging_path;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;

  // non-empty once the upload became a video
  std::string video_id;
};

} // namespace vidpipe::db::model
