#pragma once

#include <arrow/io/file.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "client/cpp/resumable_endpoint.h"

namespace vidpipe::client {

constexpr uint64_t kDefaultChunkSize = 5ull * 1024 * 1024;

enum class TransferCode {
  kCompleted,
  // I/O failure, confirmed_offset is the resume point
  kInterrupted,
  kPaused,
  kCancelled,
  // server refused the content, do not retry
  kRejected,
};

const char* ToString(TransferCode code);

struct TransferResult {
  TransferCode code             = TransferCode::kInterrupted;
  uint64_t     confirmed_offset = 0;
  uint64_t     bytes_sent       = 0; // by this call
  uint64_t     resumed_from     = 0; // server offset this call continued from
  std::string  video_id;
  std::string  message;

  bool completed() const {
    return code == TransferCode::kCompleted;
  }
};

/*
  Pause and cancel requests from other threads. The transfer checks
  them between chunks; a chunk already in flight finishes first.
*/
class TransferControl {
 public:
  void RequestPause() {
    pause_ = true;
  }
  void RequestCancel() {
    cancel_ = true;
  }
  void Reset() {
    pause_  = false;
    cancel_ = false;
  }
  bool PauseRequested() const {
    return pause_;
  }
  bool CancelRequested() const {
    return cancel_;
  }

 private:
  std::atomic<bool> pause_{false};
  std::atomic<bool> cancel_{false};
};

using ProgressCallback = std::function<void(uint64_t bytes_confirmed, uint64_t bytes_total)>;

struct TransferSpec {
  std::string upload_id;
  std::string owner_id;
  std::string source_path;
  std::string filename;
  uint64_t    total_bytes = 0;
};

// One resumable file transfer. SendFrom() continues from the server's confirmed offset.
class ChunkTransferAdapter {
 public:
  ChunkTransferAdapter(std::shared_ptr<ResumableEndpoint> endpoint, uint64_t chunk_size = kDefaultChunkSize);
  ~ChunkTransferAdapter();

  arrow::Status Open(const TransferSpec& spec);

  TransferResult SendFrom(uint64_t offset, TransferControl& control, const ProgressCallback& progress = {});

  // Closes the file and discards the server-side partial upload.
  arrow::Status Abort();

  uint64_t CurrentOffset() const {
    return confirmed_offset_;
  }

  const TransferSpec& Spec() const {
    return spec_;
  }

 private:
  arrow::Result<RemoteOffset> Sync();
  TransferResult              Finish(TransferCode code, uint64_t bytes_sent, std::string message = {}) const;

  std::shared_ptr<ResumableEndpoint>       endpoint_;
  uint64_t                                 chunk_size_;
  TransferSpec                             spec_;
  std::shared_ptr<arrow::io::ReadableFile> file_;
  uint64_t                                 confirmed_offset_ = 0;
  uint64_t                                 resumed_from_     = 0;
  std::string                              video_id_;
};

} // namespace vidpipe::client
