#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace modstore::db::model {

// Processing state of one (module_path, version). Drives the work queue.
struct VersionStateRecord {
  std::string             module_path;
  std::string             version;
  std::string             sort_version;
  bool                    incompatible = false;
  std::string             app_version;
  int32_t                 status    = 0;
  std::string             error;
  int32_t                 try_count = 0;
  std::optional<uint64_t> last_processed_at_ms;
  uint64_t                next_processed_after_ms = 0;
  std::optional<int64_t>  num_packages;
  uint64_t                created_at_ms = 0;
};

} // namespace modstore::db::model
