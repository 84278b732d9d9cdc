#pragma once

#include <cstdint>
#include <string>

namespace modstore::db::model {

// Result of resolving a requested version (a branch name, a query) to a concrete one.
struct VersionMapRecord {
  std::string module_path;
  std::string requested_version;
  std::string resolved_version;
  int32_t     status = 0;
  std::string manifest_path;
  std::string error;
  std::string sort_version;
  uint64_t    updated_at_ms = 0;
};

struct AlternativeModulePathRecord {
  std::string alternative;
  std::string canonical;
};

} // namespace modstore::db::model
