#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace modstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!IsActive()) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    MODSTORE_LOG_ERROR("sqlite rollback failed", {observability::ErrorField(e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!IsActive()) {
    throw util::NotInTransaction("commit on finished sqlite transaction");
  }
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (!IsActive()) {
    return;
  }
  rolled_back_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace modstore::db::sqlite
