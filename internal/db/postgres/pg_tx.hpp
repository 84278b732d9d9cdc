#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace modstore::db::postgres {

/*
  One pqxx::work on a pooled connection.

  Commit failures caused by serialization, deadlock or a lost connection
  throw util::TransientStoreFailure.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return !committed_ && !rolled_back_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              committed_   = false;
  bool                              rolled_back_ = false;
};

} // namespace modstore::db::postgres
