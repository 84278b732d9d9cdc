#pragma once

#include <filesystem>
#include <string>

#include "module_source.hpp"

namespace modstore::fetch {

/*
  Reads module graphs laid out like a module proxy cache:

    <root>/<escaped module path>/@v/<version>.json
    <root>/<escaped module path>/@v/<version>.alternative

  Upper-case letters in the module path are escaped as '!' plus the lower-case
  letter. An .alternative file holds the canonical module path.
*/
class DirectoryModuleSource final : public ModuleSource {
 public:
  explicit DirectoryModuleSource(std::filesystem::path root);

  model::ModuleGraph Fetch(const std::string& module_path, const std::string& version) override;

  static std::string EscapePath(const std::string& module_path);

 private:
  std::filesystem::path root_;
};

} // namespace modstore::fetch
