#include "latest_version_cache.hpp"

#include <mutex>

namespace modstore::core {

void LatestVersionCache::Put(const db::model::LatestModuleVersionsRecord& record) {
  std::unique_lock lock(mutex_);
  cache_[record.module_path] = record;
}

std::optional<db::model::LatestModuleVersionsRecord> LatestVersionCache::Get(const std::string& module_path) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(module_path);
  if (it == cache_.end()) return std::nullopt;

  return it->second;
}

void LatestVersionCache::Invalidate(const std::string& module_path) {
  std::unique_lock lock(mutex_);
  cache_.erase(module_path);
}

void LatestVersionCache::Clear() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

std::size_t LatestVersionCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace modstore::core
