#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace modstore::db::memory {

/*
  In-process stand-in for database advisory locks.

  A key is owned by at most one transaction. Acquire blocks until the key
  is free and is re-entrant for its current owner.
*/
class KeyLockTable {
 public:
  // Returns true when the key was newly acquired, false when owner already held it.
  bool Acquire(int64_t key, const void* owner);

  void Release(const std::vector<int64_t>& keys, const void* owner);

  bool IsHeld(int64_t key) const;

 private:
  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::unordered_map<int64_t, const void*> owners_;
};

} // namespace modstore::db::memory
