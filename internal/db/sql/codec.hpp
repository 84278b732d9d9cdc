#pragma once

#include <string>
#include <vector>

#include "internal/version/version_order.hpp"

namespace modstore::db::sql {

// Lists are stored as one element per line.
std::string              JoinLines(const std::vector<std::string>& items);
std::vector<std::string> SplitLines(const std::string& text);

// One "low\thigh\trationale" line per range.
std::string                           EncodeRetractions(const std::vector<version::RetractionRange>& ranges);
std::vector<version::RetractionRange> DecodeRetractions(const std::string& text);

} // namespace modstore::db::sql
