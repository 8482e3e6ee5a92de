#include "pg_tx.hpp"

namespace vidpipe::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

// pqxx::work aborts in its own destructor when neither commit nor abort ran
PgTransaction::~PgTransaction() {
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw TransactionConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
}

} // namespace vidpipe::db::postgres
