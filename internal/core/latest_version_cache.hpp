#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/db/model/latest_versions_record.hpp"

namespace modstore::core {

/*
  Read-through cache of latest-version pointers, keyed by module path.

  Entries are dropped after every commit that touches the pointer; nothing
  here is authoritative.
*/
class LatestVersionCache {
 public:
  void Put(const db::model::LatestModuleVersionsRecord& record);

  std::optional<db::model::LatestModuleVersionsRecord> Get(const std::string& module_path) const;

  void Invalidate(const std::string& module_path);

  void Clear();

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                               mutex_;
  std::unordered_map<std::string, db::model::LatestModuleVersionsRecord> cache_;
};

} // namespace modstore::core
