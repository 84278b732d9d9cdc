#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/latest_versions_record.hpp"
#include "internal/db/model/module_record.hpp"
#include "internal/db/model/search_document_record.hpp"
#include "internal/db/model/symbol_history_record.hpp"
#include "internal/db/model/unit_record.hpp"
#include "internal/db/model/version_map_record.hpp"
#include "internal/db/model/version_state_record.hpp"

namespace modstore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Writes return Result; reads return values and throw only on
    backend failure (util::TransientStoreFailure or std::runtime_error)
  - List operations return rows in a deterministic order

  The DB is the source of truth for:
    module versions and their units
    the latest-version pointer
    derived search/import/symbol tables
    work queue state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions & locking
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Blocks until the exclusive lock on key is held by this transaction.
  // Released when the transaction ends.
  virtual Result AcquireAdvisoryLock(Transaction&, int64_t key) = 0;

  // ---------------------------------------------------------------------
  // Module versions
  // ---------------------------------------------------------------------

  // Inserts or refreshes (redistributable, source_info, updated_at_ms).
  // Sets record.id.
  virtual Result UpsertModule(Transaction&, model::ModuleRecord& record) = 0;

  virtual std::optional<model::ModuleRecord> GetModule(Transaction&, const std::string& module_path,
                                                       const std::string& version) = 0;

  // Ordered by sort_version descending.
  virtual std::vector<model::ModuleRecord> ListModuleVersions(Transaction&, const std::string& module_path) = 0;

  // Ordered by updated_at_ms ascending.
  virtual std::vector<model::ModuleRecord> ListPseudoVersionsUpdatedBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // Removes the version with its units, licenses, readmes, documentation,
  // package imports and the version_map rows resolving to it.
  virtual Result DeleteModule(Transaction&, const std::string& module_path, const std::string& version) = 0;

  // ---------------------------------------------------------------------
  // Paths, units and unit content
  // ---------------------------------------------------------------------

  // Fills ids with path -> surrogate id for every input path.
  virtual Result UpsertPaths(Transaction&, const std::vector<std::string>& paths,
                             std::unordered_map<std::string, int64_t>& ids) = 0;

  // Upsert keyed by (module_id, path_id). Sets each record's id.
  virtual Result UpsertUnits(Transaction&, std::vector<model::UnitRecord>& units) = 0;

  // Ordered by path.
  virtual std::vector<model::UnitRecord> ListUnits(Transaction&, int64_t module_id) = 0;

  virtual Result UpsertLicenses(Transaction&, const std::vector<model::LicenseRecord>&) = 0;

  // Ordered by file_path.
  virtual std::vector<model::LicenseRecord> ListLicenses(Transaction&, int64_t module_id) = 0;

  virtual Result UpsertReadmes(Transaction&, const std::vector<model::ReadmeRecord>&) = 0;

  virtual std::optional<model::ReadmeRecord> GetReadme(Transaction&, int64_t unit_id) = 0;

  // Upsert keyed by (unit_id, os, arch).
  virtual Result UpsertDocumentation(Transaction&, const std::vector<model::DocumentationRecord>&) = 0;

  virtual std::vector<model::DocumentationRecord> ListDocumentation(Transaction&, int64_t unit_id) = 0;

  // Insert-if-absent keyed by (unit_id, to_path).
  virtual Result UpsertPackageImports(Transaction&, const std::vector<model::PackageImportRecord>&) = 0;

  virtual std::vector<std::string> ListPackageImports(Transaction&, int64_t unit_id) = 0;

  // ---------------------------------------------------------------------
  // Latest-version pointer
  // ---------------------------------------------------------------------

  virtual std::optional<model::LatestModuleVersionsRecord> GetLatestModuleVersions(Transaction&,
                                                                                   const std::string& module_path) = 0;

  // Writes every column except good_version, which keeps its stored value.
  virtual Result UpsertLatestModuleVersions(Transaction&, const model::LatestModuleVersionsRecord&) = 0;

  // Sets good_version, creating the row when absent.
  virtual Result UpdateLatestGoodVersion(Transaction&, const std::string& module_path,
                                         const std::string& good_version, uint64_t updated_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Derived tables
  // ---------------------------------------------------------------------

  virtual Result ReplaceImportsUnique(Transaction&, const std::string& from_module_path,
                                      const std::vector<model::ImportEdgeRecord>& edges) = 0;

  virtual std::vector<model::ImportEdgeRecord> ListImportsUnique(Transaction&, const std::string& from_module_path) = 0;

  virtual Result ReplaceSearchDocuments(Transaction&, const std::string& module_path,
                                        const std::vector<model::SearchDocumentRecord>& docs) = 0;

  virtual Result DeleteSearchDocuments(Transaction&, const std::string& module_path) = 0;

  // Ordered by package_path.
  virtual std::vector<model::SearchDocumentRecord> ListSearchDocuments(Transaction&,
                                                                       const std::string& module_path) = 0;

  // Ordered by (symbol_name, parent_name, os, arch).
  virtual std::vector<model::SymbolHistoryRecord> ListSymbolHistory(Transaction&, const std::string& module_path,
                                                                    const std::string& package_path) = 0;

  // Upsert keyed by (package_path, symbol_name, parent_name, os, arch). An
  // existing row is replaced only by a strictly lower sort_version.
  virtual Result UpsertSymbolHistory(Transaction&, const std::vector<model::SymbolHistoryRecord>&) = 0;

  // ---------------------------------------------------------------------
  // Work queue state
  // ---------------------------------------------------------------------

  virtual std::optional<model::VersionStateRecord> GetVersionState(Transaction&, const std::string& module_path,
                                                                   const std::string& version) = 0;

  virtual Result UpsertVersionState(Transaction&, const model::VersionStateRecord&) = 0;

  // Ordered by sort_version descending.
  virtual std::vector<model::VersionStateRecord> ListVersionStates(Transaction&, const std::string& module_path) = 0;

  // Rows with status 0 or >= 500 and next_processed_after_ms <= now_ms.
  virtual std::vector<model::VersionStateRecord> ListEligibleVersionStates(Transaction&, uint64_t now_ms) = 0;

  // status := to_status, next_processed_after := now, last_processed_at := NULL
  // where status = from_status and app_version < app_version_cutoff.
  virtual Result ResetVersionStates(Transaction&, const std::string& app_version_cutoff, int32_t from_status,
                                    int32_t to_status, uint64_t now_ms, uint64_t& affected) = 0;

  // ---------------------------------------------------------------------
  // Alternative paths & version map
  // ---------------------------------------------------------------------

  virtual Result UpsertAlternativeModulePath(Transaction&, const model::AlternativeModulePathRecord&) = 0;

  virtual std::optional<model::AlternativeModulePathRecord> GetAlternativeModulePath(Transaction&,
                                                                                     const std::string& alternative) = 0;

  virtual Result UpsertVersionMap(Transaction&, const model::VersionMapRecord&) = 0;

  virtual std::optional<model::VersionMapRecord> GetVersionMap(Transaction&, const std::string& module_path,
                                                               const std::string& requested_version) = 0;
};

} // namespace modstore::db
