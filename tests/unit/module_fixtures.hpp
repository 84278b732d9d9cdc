#pragma once

#include <string>
#include <vector>

#include "internal/model/module.hpp"
#include "internal/util/time.hpp"

namespace modstore::testing {

inline model::Symbol Sym(std::string name, std::string parent = "", std::string kind = "Func") {
  model::Symbol s;
  s.name        = std::move(name);
  s.parent_name = std::move(parent);
  s.kind        = std::move(kind);
  s.synopsis    = "func " + s.name + "()";
  return s;
}

inline model::Unit Package(std::string path, std::string name, std::vector<model::Symbol> symbols = {},
                           std::vector<std::string> imports = {}) {
  model::Unit u;
  u.path            = std::move(path);
  u.name            = std::move(name);
  u.redistributable = true;
  u.licenses.push_back({"LICENSE", {"MIT"}, "", true});
  u.readme = model::Readme{"README.md", "# " + u.name};

  model::Documentation doc;
  doc.build_context = {"linux", "amd64"};
  doc.synopsis      = "Package " + u.name + " does things.";
  doc.html          = "<p>" + u.name + "</p>";
  doc.symbols       = std::move(symbols);
  u.documentation.push_back(std::move(doc));

  u.imports = std::move(imports);
  return u;
}

inline model::Unit Directory(std::string path) {
  model::Unit u;
  u.path            = std::move(path);
  u.redistributable = true;
  return u;
}

// A redistributable module with one root package when units is empty.
inline model::ModuleGraph Graph(const std::string& module_path, const std::string& version,
                                std::vector<model::Unit> units = {}) {
  model::ModuleGraph g;
  g.module_path     = module_path;
  g.version         = version;
  g.commit_time     = util::FromUnixMillis(1'600'000'000'000ULL);
  g.has_manifest    = true;
  g.redistributable = true;
  g.source_info     = "{\"repo\":\"https://" + module_path + "\"}";
  g.licenses.push_back({"LICENSE", {"MIT"}, "MIT License", true});

  if (units.empty()) {
    const auto slash = module_path.rfind('/');
    units.push_back(Package(module_path, slash == std::string::npos ? module_path : module_path.substr(slash + 1),
                            {Sym("New")}, {"fmt"}));
  }
  g.units = std::move(units);
  return g;
}

} // namespace modstore::testing
