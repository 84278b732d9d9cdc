#pragma once

#include <string>

namespace modstore::db::model {

// Earliest release a symbol is known to exist in, per build context.
struct SymbolHistoryRecord {
  std::string package_path;
  std::string symbol_name;
  std::string parent_name;
  std::string os;
  std::string arch;
  std::string module_path;
  std::string since_version;
  std::string sort_version;
  std::string kind;
  std::string synopsis;
};

} // namespace modstore::db::model
