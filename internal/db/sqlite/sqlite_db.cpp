#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace vidpipe::db::sqlite {

namespace {
constexpr int kBusyTimeoutMs = 5000;
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = "open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
      throw TransactionConflict(msg);
    }
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

/*
  WAL lets status readers proceed while a worker holds the write lock.
  Foreign keys must be switched on per connection.
*/
void SqliteDB::Configure() {
  static constexpr const char* kPragmas[] = {
      "PRAGMA journal_mode=WAL;",
      "PRAGMA synchronous=NORMAL;",
      "PRAGMA foreign_keys=ON;",
      "PRAGMA temp_store=MEMORY;",
      "PRAGMA cache_size=-20000;", // KiB
  };
  for (const char* pragma : kPragmas) Exec(pragma);

  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
}

void SqliteDB::Bootstrap() {
  Exec(sql::CREATE_VIDEOS);
  Exec(sql::CREATE_JOBS);
  Exec(sql::CREATE_JOBS_VISIBILITY_INDEX);
  Exec(sql::CREATE_UPLOADS);
}

} // namespace vidpipe::db::sqlite
