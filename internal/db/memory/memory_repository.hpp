#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vidpipe::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertVideo(Transaction&, const model::VideoRecord&) override;
  std::optional<model::VideoRecord> GetVideo(Transaction&, const std::string&) override;
  Result UpdateVideo(Transaction&, const model::VideoRecord&) override;
  Result DeleteVideo(Transaction&, const std::string&) override;
  std::vector<model::VideoRecord> ListVideosCreatedBefore(Transaction&, uint64_t cutoff_ms) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> GetJobByVideo(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  Result DeleteJob(Transaction&, const std::string&) override;
  std::optional<model::JobRecord> NextVisibleJob(Transaction&, uint64_t now_ms) override;
  uint64_t CountJobs(Transaction&) override;

  Result InsertUpload(Transaction&, const model::UploadRecord&) override;
  std::optional<model::UploadRecord> GetUpload(Transaction&, const std::string&) override;
  Result UpdateUpload(Transaction&, const model::UploadRecord&) override;
  Result DeleteUpload(Transaction&, const std::string&) override;
  std::vector<model::UploadRecord> ListUploadsExpiredBefore(Transaction&, uint64_t now_ms) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::VideoRecord> videos;
    std::unordered_map<std::string, model::JobRecord> jobs;
    std::unordered_map<std::string, std::string> job_by_video;
    std::unordered_map<std::string, model::UploadRecord> uploads;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

} // namespace vidpipe::db::memory
