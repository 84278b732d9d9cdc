#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modstore::db::model {

// A path inside one module version. path_id points at the shared paths table.
struct UnitRecord {
  int64_t                  id        = 0;
  int64_t                  module_id = 0;
  int64_t                  path_id   = 0;
  std::string              path;
  std::string              v1_path;
  std::string              name;
  bool                     redistributable = false;
  std::vector<std::string> license_types;
  std::vector<std::string> license_paths;
};

struct LicenseRecord {
  int64_t                  module_id = 0;
  std::string              file_path;
  std::vector<std::string> types;
  std::string              contents;
  bool                     redistributable = false;
};

struct ReadmeRecord {
  int64_t     unit_id = 0;
  std::string file_path;
  std::string contents;
};

struct DocumentationRecord {
  int64_t     unit_id = 0;
  std::string os;
  std::string arch;
  std::string synopsis;
  std::string html;
};

struct PackageImportRecord {
  int64_t     unit_id = 0;
  std::string to_path;
};

} // namespace modstore::db::model
