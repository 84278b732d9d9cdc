#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace modstore::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!IsActive()) {
    return;
  }
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    MODSTORE_LOG_ERROR("postgres rollback failed", {observability::ErrorField(e.what())});
  }
}

void PgTransaction::Commit() {
  if (!IsActive()) {
    throw util::NotInTransaction("commit on finished postgres transaction");
  }
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    rolled_back_ = true;
    throw util::TransientStoreFailure(e.what());
  } catch (const pqxx::broken_connection& e) {
    rolled_back_ = true;
    throw util::TransientStoreFailure(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (!IsActive()) {
    return;
  }
  rolled_back_ = true;
  tx_->abort();
}

} // namespace modstore::db::postgres
