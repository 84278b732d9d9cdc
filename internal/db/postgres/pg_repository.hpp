#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace modstore::db::postgres {

/*
  Postgres-backed repository over libpqxx.

  AcquireAdvisoryLock maps to pg_advisory_xact_lock, so module locks are
  shared by every process using the same database and released by the
  server at commit or rollback.

  Writes translate pqxx exceptions into Result codes. Reads let
  serialization, deadlock and connection failures escape as
  util::TransientStoreFailure.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  Result                       AcquireAdvisoryLock(Transaction&, int64_t key) override;

  Result                             UpsertModule(Transaction&, model::ModuleRecord&) override;
  std::optional<model::ModuleRecord> GetModule(Transaction&, const std::string&, const std::string&) override;
  std::vector<model::ModuleRecord>   ListModuleVersions(Transaction&, const std::string&) override;
  std::vector<model::ModuleRecord>   ListPseudoVersionsUpdatedBefore(Transaction&, uint64_t cutoff_ms) override;
  Result                             DeleteModule(Transaction&, const std::string&, const std::string&) override;

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
  static PgTransaction& TX(Transaction& t);

  std::shared_ptr<PgPool> pool_;
};

} // namespace modstore::db::postgres
