#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modstore::db::model {

// Denormalized search row. Reflects only the latest good version.
struct SearchDocumentRecord {
  std::string              package_path;
  std::string              module_path;
  std::string              version;
  std::string              name;
  std::string              synopsis;
  std::vector<std::string> license_types;
  bool                     redistributable = false;
  uint64_t                 commit_time_ms  = 0;
};

struct ImportEdgeRecord {
  std::string from_path;
  std::string from_module_path;
  std::string to_path;
};

} // namespace modstore::db::model
