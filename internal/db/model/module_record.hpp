#pragma once

#include <cstdint>
#include <string>

namespace modstore::db::model {

/*
  Persistent module version row, keyed by (module_path, version).

  Only redistributable, source_info and updated_at_ms change on re-ingestion.
*/

struct ModuleRecord {
  int64_t     id = 0;
  std::string module_path;
  std::string version;
  std::string sort_version;
  std::string version_type; // "release" | "prerelease" | "pseudo"
  std::string series_path;
  uint64_t    commit_time_ms  = 0;
  bool        incompatible    = false;
  bool        has_manifest    = false;
  bool        redistributable = false;
  std::string source_info;
  uint64_t    updated_at_ms = 0;
};

} // namespace modstore::db::model
