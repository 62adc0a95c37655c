#include "pg_tx.hpp"

namespace satp::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts on destruction when neither committed nor aborted
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw db::TransactionConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
}

} // namespace satp::db::postgres
