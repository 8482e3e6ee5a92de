#include "client/cpp/chunk_transfer.h"

#include <algorithm>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace vidpipe::client {

const char* ToString(TransferCode code) {
  switch (code) {
    case TransferCode::kCompleted:
      return "completed";
    case TransferCode::kInterrupted:
      return "interrupted";
    case TransferCode::kPaused:
      return "paused";
    case TransferCode::kCancelled:
      return "cancelled";
    case TransferCode::kRejected:
      return "rejected";
  }
  return "unknown";
}

ChunkTransferAdapter::ChunkTransferAdapter(std::shared_ptr<ResumableEndpoint> endpoint, uint64_t chunk_size)
    : endpoint_(std::move(endpoint)), chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {}

ChunkTransferAdapter::~ChunkTransferAdapter() {
  if (file_ && !file_->closed()) {
    file_->Close().Warn();
  }
}

arrow::Status ChunkTransferAdapter::Open(const TransferSpec& spec) {
  if (spec.upload_id.empty()) {
    return arrow::Status::Invalid("upload id must not be empty");
  }
  spec_ = spec;

  ARROW_ASSIGN_OR_RAISE(file_, arrow::io::ReadableFile::Open(spec.source_path));
  ARROW_ASSIGN_OR_RAISE(auto size, file_->GetSize());
  if (spec_.total_bytes == 0) {
    spec_.total_bytes = static_cast<uint64_t>(size);
  }
  if (static_cast<uint64_t>(size) != spec_.total_bytes) {
    return arrow::Status::Invalid("source ", spec.source_path, " is ", size, " bytes, expected ", spec_.total_bytes);
  }

  ARROW_ASSIGN_OR_RAISE(auto remote,
                        endpoint_->CreateUpload(spec_.upload_id, spec_.owner_id, spec_.filename, spec_.total_bytes));
  confirmed_offset_ = remote.confirmed_offset;
  return arrow::Status::OK();
}

arrow::Result<RemoteOffset> ChunkTransferAdapter::Sync() {
  auto remote = endpoint_->QueryOffset(spec_.upload_id);
  if (remote.ok() || !remote.status().IsKeyError()) {
    return remote;
  }
  // session expired server side, start a fresh one under the same id
  return endpoint_->CreateUpload(spec_.upload_id, spec_.owner_id, spec_.filename, spec_.total_bytes);
}

TransferResult ChunkTransferAdapter::Finish(TransferCode code, uint64_t bytes_sent, std::string message) const {
  TransferResult result;
  result.code             = code;
  result.confirmed_offset = confirmed_offset_;
  result.bytes_sent       = bytes_sent;
  result.resumed_from     = resumed_from_;
  result.video_id         = video_id_;
  result.message          = std::move(message);
  return result;
}

TransferResult ChunkTransferAdapter::SendFrom(uint64_t offset, TransferControl& control, const ProgressCallback& progress) {
  resumed_from_ = confirmed_offset_;
  if (!file_) {
    return Finish(TransferCode::kRejected, 0, "transfer not opened");
  }
  if (control.CancelRequested()) return Finish(TransferCode::kCancelled, 0);
  if (control.PauseRequested()) return Finish(TransferCode::kPaused, 0);

  auto remote = Sync();
  if (!remote.ok()) {
    const auto code = remote.status().IsInvalid() ? TransferCode::kRejected : TransferCode::kInterrupted;
    return Finish(code, 0, remote.status().ToString());
  }
  if (!remote->video_id.empty()) {
    confirmed_offset_ = spec_.total_bytes;
    video_id_         = remote->video_id;
    return Finish(TransferCode::kCompleted, 0);
  }

  // the server's offset wins over the caller's
  if (offset != remote->confirmed_offset) {
    VIDPIPE_LOG_INFO("caller offset differs from server, continuing from server offset",
                     {observability::StringField("upload_id", spec_.upload_id),
                      observability::IntField("caller_offset", static_cast<int64_t>(offset)),
                      observability::IntField("server_offset", static_cast<int64_t>(remote->confirmed_offset))});
  }
  confirmed_offset_ = remote->confirmed_offset;
  resumed_from_     = confirmed_offset_;

  uint64_t sent = 0;
  for (;;) {
    if (control.CancelRequested()) return Finish(TransferCode::kCancelled, sent);
    if (control.PauseRequested()) return Finish(TransferCode::kPaused, sent);

    const uint64_t length = std::min(chunk_size_, spec_.total_bytes - confirmed_offset_);

    std::string_view data;
    std::shared_ptr<arrow::Buffer> buffer;
    if (length > 0) {
      auto read = file_->ReadAt(static_cast<int64_t>(confirmed_offset_), static_cast<int64_t>(length));
      if (!read.ok()) {
        return Finish(TransferCode::kInterrupted, sent, read.status().ToString());
      }
      buffer = *read;
      if (static_cast<uint64_t>(buffer->size()) != length) {
        return Finish(TransferCode::kRejected, sent, "source file shrank during upload");
      }
      data = std::string_view(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
    }

    // length 0 only happens when every byte is confirmed but the server has
    // not registered the video yet; the empty final chunk completes it
    auto ack = endpoint_->AppendChunk(spec_.upload_id, confirmed_offset_, data);
    if (!ack.ok()) {
      const auto code = ack.status().IsInvalid() ? TransferCode::kRejected : TransferCode::kInterrupted;
      return Finish(code, sent, ack.status().ToString());
    }

    sent += length;
    confirmed_offset_ = ack->confirmed_offset;
    if (progress) progress(confirmed_offset_, spec_.total_bytes);

    if (ack->completed) {
      video_id_ = ack->video_id;
      return Finish(TransferCode::kCompleted, sent);
    }
    if (length == 0) {
      return Finish(TransferCode::kInterrupted, sent, "server did not complete the upload at full length");
    }
  }
}

arrow::Status ChunkTransferAdapter::Abort() {
  if (file_ && !file_->closed()) {
    ARROW_RETURN_NOT_OK(file_->Close());
  }
  if (spec_.upload_id.empty()) {
    return arrow::Status::OK();
  }
  auto status = endpoint_->CancelUpload(spec_.upload_id);
  if (status.IsKeyError()) {
    return arrow::Status::OK();
  }
  return status;
}

} // namespace vidpipe::client
