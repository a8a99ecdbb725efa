#include "pg_tx.hpp"

#include "pg_errors.hpp"

namespace snapmig::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres begin");
  }
}

PgTransaction::~PgTransaction() {
  // pqxx::work aborts on destruction when neither committed nor aborted
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    ThrowReadError(e, "postgres commit");
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
}

}
