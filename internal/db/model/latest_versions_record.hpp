#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/version/version_order.hpp"

namespace modstore::db::model {

/*
  Latest-version pointer for one module path.

  raw_version and cooked_version come from upstream tooling (cooked has
  retractions applied). good_version is what ingestion resolved; it is empty
  when every known version is retracted.
*/

struct LatestModuleVersionsRecord {
  std::string                           module_path;
  std::string                           raw_version;
  std::string                           cooked_version;
  std::string                           good_version;
  std::vector<version::RetractionRange> retractions;
  bool                                  deprecated = false;
  std::string                           deprecation_comment;
  int32_t                               status        = 200;
  uint64_t                              updated_at_ms = 0;
};

} // namespace modstore::db::model
