#pragma once

#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "key_lock_table.hpp"

namespace modstore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  Result                       AcquireAdvisoryLock(Transaction&, int64_t key) override;

  Result                              UpsertModule(Transaction&, model::ModuleRecord&) override;
  std::optional<model::ModuleRecord>  GetModule(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::ModuleRecord>    ListModuleVersions(Transaction&, const std::string&) override;
  std::vector<model::ModuleRecord>    ListPseudoVersionsUpdatedBefore(Transaction&, uint64_t cutoff_ms) override;
  Result                              DeleteModule(Transaction&, const std::string&, const std::string&) override;

  Result UpsertPaths(Transaction&, const std::vector<std::string>&, std::unordered_map<std::string, int64_t>&) override;
  Result UpsertUnits(Transaction&, std::vector<model::UnitRecord>&) override;
  std::vector<model::UnitRecord>          ListUnits(Transaction&, int64_t module_id) override;
  Result                                  UpsertLicenses(Transaction&, const std::vector<model::LicenseRecord>&) override;
  std::vector<model::LicenseRecord>       ListLicenses(Transaction&, int64_t module_id) override;
  Result                                  UpsertReadmes(Transaction&, const std::vector<model::ReadmeRecord>&) override;
  std::optional<model::ReadmeRecord>      GetReadme(Transaction&, int64_t unit_id) override;
  Result                                  UpsertDocumentation(Transaction&, const std::vector<model::DocumentationRecord>&) override;
  std::vector<model::DocumentationRecord> ListDocumentation(Transaction&, int64_t unit_id) override;
  Result                                  UpsertPackageImports(Transaction&, const std::vector<model::PackageImportRecord>&) override;
  std::vector<std::string>                ListPackageImports(Transaction&, int64_t unit_id) override;

  std::optional<model::LatestModuleVersionsRecord> GetLatestModuleVersions(Transaction&, const std::string&) override;
  Result UpsertLatestModuleVersions(Transaction&, const model::LatestModuleVersionsRecord&) override;
  Result UpdateLatestGoodVersion(Transaction&, const std::string&, const std::string&, uint64_t) override;

  Result ReplaceImportsUnique(Transaction&, const std::string&, const std::vector<model::ImportEdgeRecord>&) override;
  std::vector<model::ImportEdgeRecord> ListImportsUnique(Transaction&, const std::string&) override;
  Result ReplaceSearchDocuments(Transaction&, const std::string&, const std::vector<model::SearchDocumentRecord>&) override;
  Result DeleteSearchDocuments(Transaction&, const std::string&) override;
  std::vector<model::SearchDocumentRecord> ListSearchDocuments(Transaction&, const std::string&) override;
  std::vector<model::SymbolHistoryRecord>  ListSymbolHistory(Transaction&, const std::string&, const std::string&) override;
  Result UpsertSymbolHistory(Transaction&, const std::vector<model::SymbolHistoryRecord>&) override;

  std::optional<model::VersionStateRecord> GetVersionState(Transaction&, const std::string&, const std::string&) override;
  Result UpsertVersionState(Transaction&, const model::VersionStateRecord&) override;
  std::vector<model::VersionStateRecord> ListVersionStates(Transaction&, const std::string&) override;
  std::vector<model::VersionStateRecord> ListEligibleVersionStates(Transaction&, uint64_t now_ms) override;
  Result ResetVersionStates(Transaction&, const std::string&, int32_t, int32_t, uint64_t, uint64_t&) override;

  Result UpsertAlternativeModulePath(Transaction&, const model::AlternativeModulePathRecord&) override;
  std::optional<model::AlternativeModulePathRecord> GetAlternativeModulePath(Transaction&, const std::string&) override;
  Result UpsertVersionMap(Transaction&, const model::VersionMapRecord&) override;
  std::optional<model::VersionMapRecord> GetVersionMap(Transaction&, const std::string&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  using ModuleKey  = std::pair<std::string, std::string>;
  using DocKey     = std::tuple<int64_t, std::string, std::string>;
  using SymbolKey  = std::tuple<std::string, std::string, std::string, std::string, std::string>;

  struct State {
    std::map<std::string, int64_t> paths;
    int64_t                        next_path_id = 1;

    std::map<ModuleKey, model::ModuleRecord> modules;
    int64_t                                  next_module_id = 1;

    std::map<int64_t, model::UnitRecord>         units;
    std::map<std::pair<int64_t, int64_t>, int64_t> unit_ids; // (module_id, path_id) -> unit id
    int64_t                                      next_unit_id = 1;

    std::map<std::pair<int64_t, std::string>, model::LicenseRecord> licenses;
    std::map<int64_t, model::ReadmeRecord>                          readmes;
    std::map<DocKey, model::DocumentationRecord>                    documentation;
    std::set<std::pair<int64_t, std::string>>                       package_imports;

    std::map<std::string, model::LatestModuleVersionsRecord>      latest;
    std::map<std::string, std::vector<model::ImportEdgeRecord>>   imports_unique;
    std::map<std::string, model::SearchDocumentRecord>            search_documents; // by package path
    std::map<SymbolKey, model::SymbolHistoryRecord>               symbol_history;
    std::map<ModuleKey, model::VersionStateRecord>                version_states;
    std::map<std::string, model::AlternativeModulePathRecord>     alternatives;
    std::map<ModuleKey, model::VersionMapRecord>                  version_map;
  };

  std::mutex   mutex_;
  State        committed_;
  uint64_t     committed_version_ = 0;
  KeyLockTable locks_;
};

} // namespace modstore::db::memory
