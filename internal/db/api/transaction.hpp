#pragma once

#include <stdexcept>
#include <string>

namespace vidpipe::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() raises TransactionConflict when a concurrent writer won

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

class TransactionConflict : public std::runtime_error {
public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace vidpipe::db
