#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/core/latest_version_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/module.hpp"
#include "internal/symbols/symbol_history.hpp"
#include "internal/util/time.hpp"

namespace modstore::core {

struct IngestOptions {
  bool bypass_license_check = false;
};

/*
  IngestionCoordinator

  Writes one module version and everything derived from it in a single
  transaction. For a given module path, the symbol ledger merge, resolving
  the good version and rewriting the derived rows run under the module lock.

  Validation and consistency failures throw util::InvalidModule (or its
  subclass util::IncompleteResubmission) before anything is written. Store
  failures roll back everything and surface as util::TransientStoreFailure
  when a retry can succeed.
*/
class IngestionCoordinator {
 public:
  IngestionCoordinator(std::shared_ptr<db::Repository> repository, IngestOptions options,
                       std::shared_ptr<LatestVersionCache> cache = nullptr, util::NowFn now = util::Now);

  // Returns true when graph.version is now the good version of its module.
  bool Ingest(model::ModuleGraph graph);

  std::optional<db::model::LatestModuleVersionsRecord> ResolveLatest(const std::string& module_path);

  // Stores upstream raw/cooked versions and retractions when newer than what
  // is held, then recomputes the good version. Returns the stored record.
  db::model::LatestModuleVersionsRecord UpdateLatestModuleVersions(const db::model::LatestModuleVersionsRecord& info);

  // Throws util::NotFound when the version is not stored.
  void DeleteModuleVersion(const std::string& module_path, const std::string& version);

  // Runs inside the caller's transaction. The caller invalidates the cache
  // entry after commit.
  void DeleteModuleVersion(db::Transaction& tx, const std::string& module_path, const std::string& version);

  // Deletes every pseudo-version of module_path other than keep_version, in
  // one transaction. Returns the number deleted.
  std::size_t DeletePseudoVersionsExcept(const std::string& module_path, const std::string& keep_version);

  void InvalidateCached(const std::string& module_path);

  // Throws util::InvalidModule listing every problem found.
  static void Validate(const model::ModuleGraph& graph);

 private:
  void CheckConsistency(db::Transaction& tx, const model::ModuleGraph& graph);
  void StripNonRedistributable(model::ModuleGraph& graph) const;
  void WriteGraph(db::Transaction& tx, const model::ModuleGraph& graph, uint64_t now_ms);

  // Expects the module lock to be held.
  std::optional<std::string> RecomputeGoodVersion(db::Transaction& tx, const std::string& module_path,
                                                  uint64_t now_ms);
  void WriteLatestDerived(db::Transaction& tx, const model::ModuleGraph& graph);
  bool IsAlternative(db::Transaction& tx, const std::string& module_path, const std::string& sort_version);

  std::shared_ptr<db::Repository>     repository_;
  IngestOptions                       options_;
  std::shared_ptr<LatestVersionCache> cache_;
  util::NowFn                         now_;
  symbols::SymbolHistoryLedger        ledger_;
};

} // namespace modstore::core
