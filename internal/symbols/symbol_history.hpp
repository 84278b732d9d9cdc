#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/module.hpp"

namespace modstore::symbols {

struct BuildContextSymbols {
  model::BuildContext        build_context;
  std::vector<model::Symbol> symbols;
};

struct UnitSymbols {
  std::string                      package_path;
  std::vector<BuildContextSymbols> contexts;
};

// Symbols exposed by each package of the graph, one entry per build context.
std::vector<UnitSymbols> CollectUnitSymbols(const model::ModuleGraph& graph);

/*
  SymbolHistoryLedger

  Tracks, per (package, symbol, parent, build context), the earliest release
  the symbol is known to exist in. Only compatible release versions count.

  A since-version only ever moves to a strictly earlier release, so merging
  versions in any order converges and re-merging is a no-op.
*/
class SymbolHistoryLedger {
 public:
  explicit SymbolHistoryLedger(std::shared_ptr<db::Repository> repository);

  static bool AffectsHistory(const std::string& version);

  // Runs in its own transaction. Returns the number of records written.
  std::size_t Merge(const std::string& module_path, const std::string& version, const std::vector<UnitSymbols>& units);

  // Runs inside the caller's transaction.
  std::size_t Merge(db::Transaction& tx, const std::string& module_path, const std::string& version,
                    const std::vector<UnitSymbols>& units);

  std::vector<db::model::SymbolHistoryRecord> History(const std::string& module_path, const std::string& package_path);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace modstore::symbols
