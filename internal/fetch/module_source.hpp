#pragma once

#include <string>

#include "internal/model/module.hpp"

namespace modstore::fetch {

/*
  Produces the entity graph of one module version.

  Throws util::NotFound for unknown versions, util::AlternativeModule when
  the module declares another canonical path, and util::InvalidModule for
  unreadable content.
*/
class ModuleSource {
 public:
  virtual ~ModuleSource() = default;

  virtual model::ModuleGraph Fetch(const std::string& module_path, const std::string& version) = 0;
};

} // namespace modstore::fetch
