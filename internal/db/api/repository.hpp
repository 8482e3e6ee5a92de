#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/upload_record.hpp"
#include "internal/db/model/video_record.hpp"

namespace vidpipe::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A video row and its job row created in one transaction become
    visible together or not at all
  - NextVisibleJob + UpdateJob inside one transaction is an atomic
    claim: two concurrent transactions never both commit a claim on
    the same job

  The DB is the source of truth for:
    video status / progress / manifest
    job queue and leases
    resumable upload sessions
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Videos
  // ---------------------------------------------------------------------

  virtual Result InsertVideo(Transaction&, const model::VideoRecord&) = 0;

  virtual std::optional<model::VideoRecord> GetVideo(Transaction&, const std::string& video_id) = 0;

  virtual Result UpdateVideo(Transaction&, const model::VideoRecord&) = 0;

  virtual Result DeleteVideo(Transaction&, const std::string& video_id) = 0;

  // Oldest first.
  virtual std::vector<model::VideoRecord> ListVideosCreatedBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Processing jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) = 0;

  virtual std::optional<model::JobRecord> GetJobByVideo(Transaction&, const std::string& video_id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result DeleteJob(Transaction&, const std::string& job_id) = 0;

  // Earliest-enqueued job whose visibility deadline is <= now_ms.
  virtual std::optional<model::JobRecord> NextVisibleJob(Transaction&, uint64_t now_ms) = 0;

  virtual uint64_t CountJobs(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Resumable uploads
  // ---------------------------------------------------------------------

  virtual Result InsertUpload(Transaction&, const model::UploadRecord&) = 0;

  virtual std::optional<model::UploadRecord> GetUpload(Transaction&, const std::string& upload_id) = 0;

  virtual Result UpdateUpload(Transaction&, const model::UploadRecord&) = 0;

  virtual Result DeleteUpload(Transaction&, const std::string& upload_id) = 0;

  virtual std::vector<model::UploadRecord> ListUploadsExpiredBefore(Transaction&, uint64_t now_ms) = 0;
};

} // namespace vidpipe::db
