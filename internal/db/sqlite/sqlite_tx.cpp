#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace vidpipe::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::unique_lock<std::mutex> lock)
    : db_(std::move(db)), lock_(std::move(lock)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // destructor must not throw; sqlite3_exec reports instead
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    VIDPIPE_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace vidpipe::db::sqlite
