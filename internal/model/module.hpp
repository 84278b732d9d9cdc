#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace modstore::model {

/*
  In-memory entity graph of one module version, as produced by a module
  source. Ingestion consumes it; nothing here touches the store.
*/

struct BuildContext {
  std::string os;
  std::string arch;

  bool operator==(const BuildContext&) const = default;
};

struct Symbol {
  std::string name;
  std::string parent_name; // empty for top-level symbols
  std::string kind;        // "Type", "Func", "Method", "Const", "Var", "Field"
  std::string synopsis;
  std::string section;
};

struct Documentation {
  BuildContext        build_context;
  std::string         synopsis;
  std::string         html;
  std::vector<Symbol> symbols;
};

struct License {
  std::string              file_path;
  std::vector<std::string> types;
  std::string              contents;
  bool                     redistributable = false;
};

struct Readme {
  std::string file_path;
  std::string contents;
};

struct Unit {
  std::string                path;
  std::string                name; // package name; empty for plain directories
  bool                       redistributable = false;
  std::vector<License>       licenses;       // metadata only; contents live on the module
  std::optional<Readme>      readme;
  std::vector<Documentation> documentation;
  std::vector<std::string>   imports;

  bool IsPackage() const {
    return !name.empty();
  }
};

struct ModuleGraph {
  std::string          module_path;
  std::string          version;
  util::TimePoint      commit_time{};
  bool                 has_manifest    = false;
  bool                 redistributable = false;
  std::string          source_info;
  std::vector<License> licenses;
  std::vector<Unit>    units;

  std::size_t PackageCount() const {
    std::size_t n = 0;
    for (const auto& u : units) {
      if (u.IsPackage()) ++n;
    }
    return n;
  }
};

} // namespace modstore::model
