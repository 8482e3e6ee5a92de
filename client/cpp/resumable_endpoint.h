#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace vidpipe::client {

struct RemoteOffset {
  uint64_t    confirmed_offset = 0;
  uint64_t    declared_size    = 0;
  std::string video_id; // set once the server registered the video
};

struct ChunkAck {
  uint64_t    confirmed_offset = 0;
  bool        completed        = false;
  std::string video_id;
};

/*
  Server side of a resumable upload as seen by the client.

  Status codes returned by implementations carry the meaning the
  transfer adapter acts on:

    Invalid   the server rejected the content, resending cannot help
    KeyError  the session is unknown or expired
    anything else  transient, resume after re-reading the offset
*/
class ResumableEndpoint {
 public:
  virtual ~ResumableEndpoint() = default;

  // Idempotent for identical parameters.
  virtual arrow::Result<RemoteOffset> CreateUpload(const std::string& upload_id, const std::string& owner_id,
                                                   const std::string& filename, uint64_t declared_size) = 0;

  virtual arrow::Result<RemoteOffset> QueryOffset(const std::string& upload_id) = 0;

  virtual arrow::Result<ChunkAck> AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data) = 0;

  virtual arrow::Status CancelUpload(const std::string& upload_id) = 0;
};

} // namespace vidpipe::client
