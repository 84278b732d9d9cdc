#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace modstore::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (IsActive()) Rollback();
}

void MemoryTransaction::Commit() {
  if (!IsActive()) {
    throw util::NotInTransaction("commit: transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    if (dirty_) {
      if (repo_.committed_version_ != snapshot_version_) {
        rolled_back_ = true;
      } else {
        repo_.committed_ = std::move(working_);
        repo_.committed_version_++;
      }
    }
  }
  if (rolled_back_) {
    ReleaseLocks();
    throw util::TransientStoreFailure("transaction conflict: state was modified by a concurrent transaction");
  }
  committed_ = true;
  ReleaseLocks();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  ReleaseLocks();
}

void MemoryTransaction::HoldLock(int64_t key) {
  if (repo_.locks_.Acquire(key, this)) {
    held_locks_.push_back(key);
  }
}

void MemoryTransaction::ReleaseLocks() {
  repo_.locks_.Release(held_locks_, this);
  held_locks_.clear();
}

} // namespace modstore::db::memory
