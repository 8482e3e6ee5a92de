#pragma once

#include <arrow/buffer.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "client/cpp/resumable_endpoint.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/ingest/ingestion_service.hpp"
#include "internal/pipeline/media_transcoder.hpp"
#include "internal/pipeline/stages.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/storage/memory/memory_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace vidpipe::testing {

inline std::filesystem::path TempDir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("vidpipe_" + name + "_" + util::NewId());
  std::filesystem::create_directories(dir);
  return dir;
}

// ISO BMFF prefix followed by a deterministic byte pattern.
inline std::string Mp4Bytes(size_t size) {
  static const char kHeader[] = {0, 0, 0, 0x18, 'f', 't', 'y', 'p', 'i', 's', 'o', 'm'};
  std::string       out(size, '\0');
  for (size_t i = 0; i < size; ++i) {
    out[i] = i < sizeof(kHeader) ? kHeader[i] : static_cast<char>((i * 31 + 7) % 251);
  }
  return out;
}

inline std::shared_ptr<arrow::Buffer> ToBuffer(const std::string& bytes) {
  return arrow::Buffer::FromString(bytes);
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

inline std::string ToString(const std::shared_ptr<arrow::Buffer>& buffer) {
  return std::string(reinterpret_cast<const char*>(buffer->data()), static_cast<size_t>(buffer->size()));
}

// ---------------------------------------------------------------------
// Transcoder double: writes marker files, counts calls, optional faults
// ---------------------------------------------------------------------

class FakeTranscoder final : public pipeline::MediaTranscoder {
 public:
  pipeline::MediaProbe probe{12.0, 1920, 1080, "h264", "aac"};

  // called first by every operation with ("probe"|"transcode"|"frame"|"audio", detail); may throw
  std::function<void(const std::string& op, const std::string& detail)> before;

  pipeline::MediaProbe Probe(const std::filesystem::path& input) override {
    Hook("probe", input.filename().string());
    Require(input);
    std::lock_guard lock(mutex_);
    probe_calls_++;
    return probe;
  }

  void Transcode(const std::filesystem::path& input, const std::filesystem::path& output,
                 const pipeline::QualityPreset& preset, pipeline::Dimensions size, uint32_t threads) override {
    Hook("transcode", preset.name);
    Require(input);
    WriteFile(output, "rendition:" + preset.name + ":" + std::to_string(size.width) + "x" + std::to_string(size.height));
    std::lock_guard lock(mutex_);
    transcodes_[preset.name]++;
    threads_.push_back(threads);
  }

  void ExtractFrame(const std::filesystem::path& input, const std::filesystem::path& output, double timestamp_s,
                    pipeline::Dimensions) override {
    Hook("frame", std::to_string(timestamp_s));
    Require(input);
    WriteFile(output, "jpeg@" + std::to_string(timestamp_s));
    std::lock_guard lock(mutex_);
    frame_calls_++;
  }

  void ExtractAudio(const std::filesystem::path& input, const std::filesystem::path& output,
                    const std::string& bitrate) override {
    Hook("audio", bitrate);
    Require(input);
    WriteFile(output, "mp3:" + bitrate);
    std::lock_guard lock(mutex_);
    audio_calls_++;
  }

  int Transcodes(const std::string& quality) const {
    std::lock_guard lock(mutex_);
    auto            it = transcodes_.find(quality);
    return it == transcodes_.end() ? 0 : it->second;
  }

  int TotalTranscodes() const {
    std::lock_guard lock(mutex_);
    int             total = 0;
    for (const auto& [_, n] : transcodes_) total += n;
    return total;
  }

  int ProbeCalls() const {
    std::lock_guard lock(mutex_);
    return probe_calls_;
  }

  int FrameCalls() const {
    std::lock_guard lock(mutex_);
    return frame_calls_;
  }

  int AudioCalls() const {
    std::lock_guard lock(mutex_);
    return audio_calls_;
  }

  std::vector<uint32_t> ThreadArgs() const {
    std::lock_guard lock(mutex_);
    return threads_;
  }

 private:
  void Hook(const std::string& op, const std::string& detail) {
    if (before) before(op, detail);
  }

  static void Require(const std::filesystem::path& input) {
    if (!std::filesystem::exists(input)) {
      throw util::DataIntegrity("fake transcoder input missing: " + input.string());
    }
  }

  mutable std::mutex         mutex_;
  std::map<std::string, int> transcodes_;
  std::vector<uint32_t>      threads_;
  int                        probe_calls_ = 0;
  int                        frame_calls_ = 0;
  int                        audio_calls_ = 0;
};

// ---------------------------------------------------------------------
// Server-side harness on the in-memory backends
// ---------------------------------------------------------------------

struct Harness {
  std::filesystem::path                          root;
  std::shared_ptr<util::ManualClockSource>       clock;
  std::shared_ptr<db::memory::MemoryRepository>  repository;
  std::shared_ptr<storage::MemoryObjectStore>    objects;
  std::shared_ptr<queue::JobQueue>               queue;
  std::shared_ptr<ingest::IngestionService>      ingestion;

  explicit Harness(const std::string& name, std::chrono::milliseconds lease = std::chrono::seconds(30),
                   uint64_t max_upload_bytes = 16ull * 1024 * 1024)
      : root(TempDir(name)),
        clock(std::make_shared<util::ManualClockSource>()),
        repository(std::make_shared<db::memory::MemoryRepository>()),
        objects(std::make_shared<storage::MemoryObjectStore>()) {
    queue = std::make_shared<queue::JobQueue>(repository, clock, lease);

    ingest::IngestOptions options;
    options.max_upload_bytes   = max_upload_bytes;
    options.upload_ttl         = std::chrono::hours(24);
    options.allowed_extensions = {".mp4", ".mov", ".avi", ".webm", ".mkv"};
    options.staging_dir        = root / "staging";
    ingestion = std::make_shared<ingest::IngestionService>(repository, objects, queue, clock, options);
  }

  ~Harness() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  Harness(const Harness&)            = delete;
  Harness& operator=(const Harness&) = delete;

  std::string IngestVideo(const std::string& filename = "clip.mp4", size_t size = 4096) {
    return ingestion->UploadVideo("owner-1", filename, size, ToBuffer(Mp4Bytes(size))).video_id;
  }

  std::optional<db::model::VideoRecord> Video(const std::string& video_id) {
    auto tx = repository->Begin();
    return repository->GetVideo(*tx, video_id);
  }

  std::optional<db::model::JobRecord> JobFor(const std::string& video_id) {
    auto tx = repository->Begin();
    return repository->GetJobByVideo(*tx, video_id);
  }

  // two small renditions, three thumbnails, the default processing retry table
  pipeline::PipelineOptions PipelineOptions() const {
    pipeline::PipelineOptions options;
    options.qualities = {
        pipeline::QualityPreset{"360p", 640, 360, "500k", "96k", "fast", 28},
        pipeline::QualityPreset{"720p", 1280, 720, "1500k", "128k", "medium", 23},
    };
    options.thumbnail_count = 3;
    options.thumbnail_size  = {320, 180};
    options.audio_bitrate   = "192k";
    options.max_duration_s  = 300.0;
    options.scratch_dir     = root / "scratch";
    options.retry           = util::RetryPolicy::ProcessingDefault();
    return options;
  }
};

// ---------------------------------------------------------------------
// Client endpoint that calls the ingestion service directly
// ---------------------------------------------------------------------

class InProcessEndpoint final : public client::ResumableEndpoint {
 public:
  explicit InProcessEndpoint(std::shared_ptr<ingest::IngestionService> ingestion) : ingestion_(std::move(ingestion)) {}

  std::atomic<bool>     network_up{true};
  std::atomic<int>      transient_failures{0}; // next N appends fail with an I/O error
  std::atomic<int>      append_calls{0};
  std::atomic<uint64_t> bytes_received{0};
  std::atomic<int64_t>  append_delay_ms{0};

  // runs before every append with the chunk offset
  std::function<void(uint64_t offset)> on_append;

  arrow::Result<client::RemoteOffset> CreateUpload(const std::string& upload_id, const std::string& owner_id,
                                                   const std::string& filename, uint64_t declared_size) override {
    if (!network_up) return arrow::Status::IOError("network unreachable");
    return Call<client::RemoteOffset>([&] {
      auto state = ingestion_->CreateUpload(upload_id, owner_id, filename, declared_size);
      return client::RemoteOffset{state.confirmed_offset, state.declared_size, state.video_id};
    });
  }

  arrow::Result<client::RemoteOffset> QueryOffset(const std::string& upload_id) override {
    if (!network_up) return arrow::Status::IOError("network unreachable");
    return Call<client::RemoteOffset>([&] {
      auto state = ingestion_->QueryOffset(upload_id);
      return client::RemoteOffset{state.confirmed_offset, state.declared_size, state.video_id};
    });
  }

  arrow::Result<client::ChunkAck> AppendChunk(const std::string& upload_id, uint64_t offset, std::string_view data) override {
    append_calls++;
    if (on_append) on_append(offset);
    if (append_delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(append_delay_ms.load()));
    if (!network_up) return arrow::Status::IOError("network unreachable");
    if (transient_failures > 0) {
      transient_failures--;
      return arrow::Status::IOError("connection reset");
    }
    return Call<client::ChunkAck>([&] {
      auto result = ingestion_->AppendChunk(upload_id, offset, data);
      bytes_received += data.size();
      return client::ChunkAck{result.confirmed_offset, result.completed, result.video_id};
    });
  }

  arrow::Status CancelUpload(const std::string& upload_id) override {
    if (!network_up) return arrow::Status::IOError("network unreachable");
    auto result = Call<bool>([&] {
      ingestion_->CancelUpload(upload_id);
      return true;
    });
    return result.status();
  }

 private:
  template <typename T, typename Fn>
  arrow::Result<T> Call(Fn&& fn) {
    try {
      return fn();
    } catch (const util::DataIntegrity& e) {
      return arrow::Status::Invalid(e.what());
    } catch (const std::invalid_argument& e) {
      return arrow::Status::Invalid(e.what());
    } catch (const util::AlreadyExists& e) {
      return arrow::Status::Invalid(e.what());
    } catch (const util::InvalidState& e) {
      return arrow::Status::Invalid(e.what());
    } catch (const util::NotFound& e) {
      return arrow::Status::KeyError(e.what());
    } catch (const std::exception& e) {
      return arrow::Status::IOError(e.what());
    }
  }

  std::shared_ptr<ingest::IngestionService> ingestion_;
};

// Poll until pred() or timeout.
template <typename Pred>
bool Eventually(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace vidpipe::testing
