#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace modstore::db::memory {

/*
  Transaction = snapshot + write set.

  Commit fails with util::TransientStoreFailure when another transaction
  committed writes after this snapshot was taken. Read-only transactions
  never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsActive() const override {
    return !committed_ && !rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void HoldLock(int64_t key);

 private:
  void ReleaseLocks();

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    dirty_            = false;
  std::vector<int64_t>    held_locks_;
};

} // namespace modstore::db::memory
