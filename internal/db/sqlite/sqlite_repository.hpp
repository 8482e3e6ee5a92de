#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vidpipe::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;
  std::mutex                connection_mutex_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace vidpipe::db::sqlite
