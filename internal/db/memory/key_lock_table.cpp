#include "key_lock_table.hpp"

namespace modstore::db::memory {

bool KeyLockTable::Acquire(int64_t key, const void* owner) {
  std::unique_lock lock(mutex_);
  auto             it = owners_.find(key);
  if (it != owners_.end() && it->second == owner) {
    return false;
  }
  cv_.wait(lock, [&] { return !owners_.contains(key); });
  owners_.emplace(key, owner);
  return true;
}

void KeyLockTable::Release(const std::vector<int64_t>& keys, const void* owner) {
  if (keys.empty()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    for (auto key : keys) {
      auto it = owners_.find(key);
      if (it != owners_.end() && it->second == owner) {
        owners_.erase(it);
      }
    }
  }
  cv_.notify_all();
}

bool KeyLockTable::IsHeld(int64_t key) const {
  std::lock_guard lock(mutex_);
  return owners_.contains(key);
}

} // namespace modstore::db::memory
