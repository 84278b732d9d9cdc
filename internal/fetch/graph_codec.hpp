#pragma once

#include <string>

#include "internal/db/model/latest_versions_record.hpp"
#include "internal/model/module.hpp"
#include "modstore/v1/module.pb.h"

namespace modstore::fetch {

// Both parsers throw util::InvalidModule on malformed JSON or unknown fields.
model::ModuleGraph                    ParseModuleGraphJson(const std::string& json);
db::model::LatestModuleVersionsRecord ParseLatestVersionsJson(const std::string& json);

model::ModuleGraph                    ToModel(const modstore::v1::ModuleGraph& wire);
db::model::LatestModuleVersionsRecord ToModel(const modstore::v1::LatestVersions& wire);

} // namespace modstore::fetch
