#include "pg_repository.hpp"

#include "internal/db/sql/codec.hpp"
#include "internal/util/errors.hpp"

namespace modstore::db::postgres {

namespace {

constexpr const char* kModuleColumns =
    "id,module_path,version,sort_version,version_type,series_path,commit_time_ms,incompatible,has_manifest,"
    "redistributable,source_info,updated_at_ms";

constexpr const char* kStateColumns =
    "module_path,version,sort_version,incompatible,app_version,status,error,try_count,last_processed_at_ms,"
    "next_processed_after_ms,num_packages,created_at_ms";

std::string Sql(const char* head, const char* columns, const char* tail) {
  return std::string(head) + columns + tail;
}

Result Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

template <typename... Args>
Result Exec(pqxx::work& w, const std::string& sql, const Args&... args) {
  try {
    w.exec_params(sql, args...);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

template <typename... Args>
pqxx::result Query(pqxx::work& w, const std::string& sql, const Args&... args) {
  try {
    return w.exec_params(sql, args...);
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransientStoreFailure(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::TransientStoreFailure(e.what());
  }
}

std::string Str(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

template <typename T>
std::optional<T> Opt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

model::ModuleRecord ReadModule(const pqxx::row& row) {
  model::ModuleRecord r;
  r.id              = row[0].as<int64_t>();
  r.module_path     = Str(row[1]);
  r.version         = Str(row[2]);
  r.sort_version    = Str(row[3]);
  r.version_type    = Str(row[4]);
  r.series_path     = Str(row[5]);
  r.commit_time_ms  = row[6].as<uint64_t>();
  r.incompatible    = row[7].as<bool>();
  r.has_manifest    = row[8].as<bool>();
  r.redistributable = row[9].as<bool>();
  r.source_info     = Str(row[10]);
  r.updated_at_ms   = row[11].as<uint64_t>();
  return r;
}

model::VersionStateRecord ReadState(const pqxx::row& row) {
  model::VersionStateRecord r;
  r.module_path             = Str(row[0]);
  r.version                 = Str(row[1]);
  r.sort_version            = Str(row[2]);
  r.incompatible            = row[3].as<bool>();
  r.app_version             = Str(row[4]);
  r.status                  = row[5].as<int32_t>();
  r.error                   = Str(row[6]);
  r.try_count               = row[7].as<int32_t>();
  r.last_processed_at_ms    = Opt<uint64_t>(row[8]);
  r.next_processed_after_ms = row[9].as<uint64_t>();
  r.num_packages            = Opt<int64_t>(row[10]);
  r.created_at_ms           = row[11].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  try {
    return std::make_unique<PgTransaction>(pool_);
  } catch (const pqxx::broken_connection& e) {
    throw util::TransientStoreFailure(e.what());
  }
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::AcquireAdvisoryLock(Transaction& t, int64_t key) {
  if (!t.IsActive()) {
    return Result::Err(ErrorCode::InternalError, "advisory lock requires an active transaction");
  }
  try {
    TX(t).Work().exec_prepared("advisory_xact_lock", key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Module versions
// ------------------------------------------------------------------

Result PgRepository::UpsertModule(Transaction& t, model::ModuleRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO modules(module_path,version,sort_version,version_type,series_path,commit_time_ms,incompatible,"
        "has_manifest,redistributable,source_info,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) "
        "ON CONFLICT(module_path,version) DO UPDATE SET redistributable=EXCLUDED.redistributable,"
        "source_info=EXCLUDED.source_info,updated_at_ms=EXCLUDED.updated_at_ms RETURNING id;",
        r.module_path, r.version, r.sort_version, r.version_type, r.series_path, r.commit_time_ms, r.incompatible,
        r.has_manifest, r.redistributable, r.source_info, r.updated_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ModuleRecord> PgRepository::GetModule(Transaction& t, const std::string& module_path,
                                                           const std::string& version) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("get_module", module_path, version);
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransientStoreFailure(e.what());
  }
  if (res.empty()) return std::nullopt;
  return ReadModule(res[0]);
}

std::vector<model::ModuleRecord> PgRepository::ListModuleVersions(Transaction& t, const std::string& module_path) {
  auto res = Query(TX(t).Work(),
                   Sql("SELECT ", kModuleColumns, " FROM modules WHERE module_path=$1 ORDER BY sort_version DESC;"),
                   module_path);

  std::vector<model::ModuleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadModule(row));
  return out;
}

std::vector<model::ModuleRecord> PgRepository::ListPseudoVersionsUpdatedBefore(Transaction& t, uint64_t cutoff_ms) {
  auto res = Query(TX(t).Work(),
                   Sql("SELECT ", kModuleColumns,
                       " FROM modules WHERE version_type='pseudo' AND updated_at_ms<$1 "
                       "ORDER BY updated_at_ms ASC, module_path, version;"),
                   cutoff_ms);

  std::vector<model::ModuleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadModule(row));
  return out;
}

Result PgRepository::DeleteModule(Transaction& t, const std::string& module_path, const std::string& version) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_params("DELETE FROM modules WHERE module_path=$1 AND version=$2 RETURNING id;", module_path,
                              version);
    if (res.empty()) {
      return Result::Err(ErrorCode::NotFound, module_path + "@" + version);
    }
    w.exec_params("DELETE FROM version_map WHERE module_path=$1 AND resolved_version=$2;", module_path, version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Paths, units and unit content
// ------------------------------------------------------------------

Result PgRepository::UpsertPaths(Transaction& t, const std::vector<std::string>& paths,
                                 std::unordered_map<std::string, int64_t>& ids) {
  try {
    auto& w = TX(t).Work();
    for (const auto& p : paths) {
      auto res = w.exec_params(
          "INSERT INTO paths(path) VALUES($1) ON CONFLICT(path) DO UPDATE SET path=EXCLUDED.path RETURNING id;", p);
      ids[p] = res[0][0].as<int64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertUnits(Transaction& t, std::vector<model::UnitRecord>& units) {
  try {
    auto& w = TX(t).Work();
    for (auto& u : units) {
      auto res = w.exec_params(
          "INSERT INTO units(module_id,path_id,path,v1_path,name,redistributable,license_types,license_paths) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(module_id,path_id) DO UPDATE SET path=EXCLUDED.path,"
          "v1_path=EXCLUDED.v1_path,name=EXCLUDED.name,redistributable=EXCLUDED.redistributable,"
          "license_types=EXCLUDED.license_types,license_paths=EXCLUDED.license_paths RETURNING id;",
          u.module_id, u.path_id, u.path, u.v1_path, u.name, u.redistributable, sql::JoinLines(u.license_types),
          sql::JoinLines(u.license_paths));
      u.id = res[0][0].as<int64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UnitRecord> PgRepository::ListUnits(Transaction& t, int64_t module_id) {
  auto res = Query(TX(t).Work(),
                   "SELECT id,module_id,path_id,path,v1_path,name,redistributable,license_types,license_paths "
                   "FROM units WHERE module_id=$1 ORDER BY path;",
                   module_id);

  std::vector<model::UnitRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::UnitRecord u;
    u.id              = row[0].as<int64_t>();
    u.module_id       = row[1].as<int64_t>();
    u.path_id         = row[2].as<int64_t>();
    u.path            = Str(row[3]);
    u.v1_path         = Str(row[4]);
    u.name            = Str(row[5]);
    u.redistributable = row[6].as<bool>();
    u.license_types   = sql::SplitLines(Str(row[7]));
    u.license_paths   = sql::SplitLines(Str(row[8]));
    out.push_back(std::move(u));
  }
  return out;
}

Result PgRepository::UpsertLicenses(Transaction& t, const std::vector<model::LicenseRecord>& licenses) {
  auto& w = TX(t).Work();
  for (const auto& l : licenses) {
    auto r = Exec(w,
                  "INSERT INTO licenses(module_id,file_path,types,contents,redistributable) VALUES($1,$2,$3,$4,$5) "
                  "ON CONFLICT(module_id,file_path) DO UPDATE SET types=EXCLUDED.types,contents=EXCLUDED.contents,"
                  "redistributable=EXCLUDED.redistributable;",
                  l.module_id, l.file_path, sql::JoinLines(l.types), l.contents, l.redistributable);
    if (!r) return r;
  }
  return Result::Ok();
}

std::vector<model::LicenseRecord> PgRepository::ListLicenses(Transaction& t, int64_t module_id) {
  auto res = Query(TX(t).Work(),
                   "SELECT module_id,file_path,types,contents,redistributable FROM licenses WHERE module_id=$1 "
                   "ORDER BY file_path;",
                   module_id);

  std::vector<model::LicenseRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].as<int64_t>(), Str(row[1]), sql::SplitLines(Str(row[2])), Str(row[3]), row[4].as<bool>()});
  }
  return out;
}

Result PgRepository::UpsertReadmes(Transaction& t, const std::vector<model::ReadmeRecord>& readmes) {
  auto& w = TX(t).Work();
  for (const auto& r : readmes) {
    auto res = Exec(w,
                    "INSERT INTO readmes(unit_id,file_path,contents) VALUES($1,$2,$3) "
                    "ON CONFLICT(unit_id) DO UPDATE SET file_path=EXCLUDED.file_path,contents=EXCLUDED.contents;",
                    r.unit_id, r.file_path, r.contents);
    if (!res) return res;
  }
  return Result::Ok();
}

std::optional<model::ReadmeRecord> PgRepository::GetReadme(Transaction& t, int64_t unit_id) {
  auto res = Query(TX(t).Work(), "SELECT unit_id,file_path,contents FROM readmes WHERE unit_id=$1;", unit_id);
  if (res.empty()) return std::nullopt;
  return model::ReadmeRecord{res[0][0].as<int64_t>(), Str(res[0][1]), Str(res[0][2])};
}

Result PgRepository::UpsertDocumentation(Transaction& t, const std::vector<model::DocumentationRecord>& docs) {
  auto& w = TX(t).Work();
  for (const auto& d : docs) {
    auto r = Exec(w,
                  "INSERT INTO documentation(unit_id,os,arch,synopsis,html) VALUES($1,$2,$3,$4,$5) "
                  "ON CONFLICT(unit_id,os,arch) DO UPDATE SET synopsis=EXCLUDED.synopsis,html=EXCLUDED.html;",
                  d.unit_id, d.os, d.arch, d.synopsis, d.html);
    if (!r) return r;
  }
  return Result::Ok();
}

std::vector<model::DocumentationRecord> PgRepository::ListDocumentation(Transaction& t, int64_t unit_id) {
  auto res = Query(TX(t).Work(),
                   "SELECT unit_id,os,arch,synopsis,html FROM documentation WHERE unit_id=$1 ORDER BY os,arch;",
                   unit_id);

  std::vector<model::DocumentationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].as<int64_t>(), Str(row[1]), Str(row[2]), Str(row[3]), Str(row[4])});
  }
  return out;
}

Result PgRepository::UpsertPackageImports(Transaction& t, const std::vector<model::PackageImportRecord>& imports) {
  auto& w = TX(t).Work();
  for (const auto& i : imports) {
    auto r = Exec(w, "INSERT INTO package_imports(unit_id,to_path) VALUES($1,$2) ON CONFLICT DO NOTHING;", i.unit_id,
                  i.to_path);
    if (!r) return r;
  }
  return Result::Ok();
}

std::vector<std::string> PgRepository::ListPackageImports(Transaction& t, int64_t unit_id) {
  auto res = Query(TX(t).Work(), "SELECT to_path FROM package_imports WHERE unit_id=$1 ORDER BY to_path;", unit_id);

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(Str(row[0]));
  return out;
}

// ------------------------------------------------------------------
// Latest-version pointer
// ------------------------------------------------------------------

std::optional<model::LatestModuleVersionsRecord> PgRepository::GetLatestModuleVersions(Transaction& t,
                                                                                       const std::string& module_path) {
  auto res = Query(TX(t).Work(),
                   "SELECT module_path,raw_version,cooked_version,good_version,retractions,deprecated,"
                   "deprecation_comment,status,updated_at_ms FROM latest_module_versions WHERE module_path=$1;",
                   module_path);
  if (res.empty()) return std::nullopt;

  const auto&                       row = res[0];
  model::LatestModuleVersionsRecord r;
  r.module_path         = Str(row[0]);
  r.raw_version         = Str(row[1]);
  r.cooked_version      = Str(row[2]);
  r.good_version        = Str(row[3]);
  r.retractions         = sql::DecodeRetractions(Str(row[4]));
  r.deprecated          = row[5].as<bool>();
  r.deprecation_comment = Str(row[6]);
  r.status              = row[7].as<int32_t>();
  r.updated_at_ms       = row[8].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertLatestModuleVersions(Transaction& t, const model::LatestModuleVersionsRecord& r) {
  return Exec(TX(t).Work(),
              "INSERT INTO latest_module_versions(module_path,raw_version,cooked_version,good_version,retractions,"
              "deprecated,deprecation_comment,status,updated_at_ms) VALUES($1,$2,$3,'',$4,$5,$6,$7,$8) "
              "ON CONFLICT(module_path) DO UPDATE SET raw_version=EXCLUDED.raw_version,cooked_version=EXCLUDED.cooked_version,"
              "retractions=EXCLUDED.retractions,deprecated=EXCLUDED.deprecated,"
              "deprecation_comment=EXCLUDED.deprecation_comment,status=EXCLUDED.status,updated_at_ms=EXCLUDED.updated_at_ms;",
              r.module_path, r.raw_version, r.cooked_version, sql::EncodeRetractions(r.retractions), r.deprecated,
              r.deprecation_comment, r.status, r.updated_at_ms);
}

Result PgRepository::UpdateLatestGoodVersion(Transaction& t, const std::string& module_path,
                                             const std::string& good_version, uint64_t updated_at_ms) {
  return Exec(TX(t).Work(),
              "INSERT INTO latest_module_versions(module_path,raw_version,cooked_version,good_version,retractions,"
              "deprecated,deprecation_comment,status,updated_at_ms) VALUES($1,'','',$2,'',false,'',200,$3) "
              "ON CONFLICT(module_path) DO UPDATE SET good_version=EXCLUDED.good_version,updated_at_ms=EXCLUDED.updated_at_ms;",
              module_path, good_version, updated_at_ms);
}

// ------------------------------------------------------------------
// Derived tables
// ------------------------------------------------------------------

Result PgRepository::ReplaceImportsUnique(Transaction& t, const std::string& from_module_path,
                                          const std::vector<model::ImportEdgeRecord>& edges) {
  auto& w = TX(t).Work();
  if (auto r = Exec(w, "DELETE FROM imports_unique WHERE from_module_path=$1;", from_module_path); !r) return r;

  for (const auto& e : edges) {
    auto r = Exec(w,
                  "INSERT INTO imports_unique(from_path,from_module_path,to_path) VALUES($1,$2,$3) ON CONFLICT DO NOTHING;",
                  e.from_path, from_module_path, e.to_path);
    if (!r) return r;
  }
  return Result::Ok();
}

std::vector<model::ImportEdgeRecord> PgRepository::ListImportsUnique(Transaction& t, const std::string& from_module_path) {
  auto res = Query(TX(t).Work(),
                   "SELECT from_path,from_module_path,to_path FROM imports_unique WHERE from_module_path=$1 "
                   "ORDER BY from_path,to_path;",
                   from_module_path);

  std::vector<model::ImportEdgeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({Str(row[0]), Str(row[1]), Str(row[2])});
  return out;
}

Result PgRepository::ReplaceSearchDocuments(Transaction& t, const std::string& module_path,
                                            const std::vector<model::SearchDocumentRecord>& docs) {
  if (auto r = DeleteSearchDocuments(t, module_path); !r) return r;

  auto& w = TX(t).Work();
  for (const auto& d : docs) {
    auto r = Exec(w,
                  "INSERT INTO search_documents(package_path,module_path,version,name,synopsis,license_types,"
                  "redistributable,commit_time_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(package_path) DO UPDATE SET "
                  "module_path=EXCLUDED.module_path,version=EXCLUDED.version,name=EXCLUDED.name,synopsis=EXCLUDED.synopsis,"
                  "license_types=EXCLUDED.license_types,redistributable=EXCLUDED.redistributable,"
                  "commit_time_ms=EXCLUDED.commit_time_ms;",
                  d.package_path, d.module_path, d.version, d.name, d.synopsis, sql::JoinLines(d.license_types),
                  d.redistributable, d.commit_time_ms);
    if (!r) return r;
  }
  return Result::Ok();
}

Result PgRepository::DeleteSearchDocuments(Transaction& t, const std::string& module_path) {
  return Exec(TX(t).Work(), "DELETE FROM search_documents WHERE module_path=$1;", module_path);
}

std::vector<model::SearchDocumentRecord> PgRepository::ListSearchDocuments(Transaction& t,
                                                                          const std::string& module_path) {
  auto res = Query(TX(t).Work(),
                   "SELECT package_path,module_path,version,name,synopsis,license_types,redistributable,commit_time_ms "
                   "FROM search_documents WHERE module_path=$1 ORDER BY package_path;",
                   module_path);

  std::vector<model::SearchDocumentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({Str(row[0]), Str(row[1]), Str(row[2]), Str(row[3]), Str(row[4]), sql::SplitLines(Str(row[5])),
                   row[6].as<bool>(), row[7].as<uint64_t>()});
  }
  return out;
}

std::vector<model::SymbolHistoryRecord> PgRepository::ListSymbolHistory(Transaction& t, const std::string& module_path,
                                                                       const std::string& package_path) {
  auto res = Query(TX(t).Work(),
                   "SELECT package_path,symbol_name,parent_name,os,arch,module_path,since_version,sort_version,kind,synopsis "
                   "FROM symbol_history WHERE module_path=$1 AND package_path=$2 "
                   "ORDER BY symbol_name COLLATE \"C\",parent_name COLLATE \"C\",os COLLATE \"C\",arch COLLATE \"C\";",
                   module_path, package_path);

  std::vector<model::SymbolHistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({Str(row[0]), Str(row[1]), Str(row[2]), Str(row[3]), Str(row[4]), Str(row[5]), Str(row[6]),
                   Str(row[7]), Str(row[8]), Str(row[9])});
  }
  return out;
}

Result PgRepository::UpsertSymbolHistory(Transaction& t, const std::vector<model::SymbolHistoryRecord>& records) {
  auto& w = TX(t).Work();
  for (const auto& r : records) {
    auto res = Exec(w,
                    "INSERT INTO symbol_history(package_path,symbol_name,parent_name,os,arch,module_path,since_version,"
                    "sort_version,kind,synopsis) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) "
                    "ON CONFLICT(package_path,symbol_name,parent_name,os,arch) DO UPDATE SET module_path=EXCLUDED.module_path,"
                    "since_version=EXCLUDED.since_version,sort_version=EXCLUDED.sort_version,kind=EXCLUDED.kind,"
                    "synopsis=EXCLUDED.synopsis WHERE EXCLUDED.sort_version < symbol_history.sort_version;",
                    r.package_path, r.symbol_name, r.parent_name, r.os, r.arch, r.module_path, r.since_version,
                    r.sort_version, r.kind, r.synopsis);
    if (!res) return res;
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Work queue state
// ------------------------------------------------------------------

std::optional<model::VersionStateRecord> PgRepository::GetVersionState(Transaction& t, const std::string& module_path,
                                                                       const std::string& version) {
  pqxx::result res;
  try {
    res = TX(t).Work().exec_prepared("get_version_state", module_path, version);
  } catch (const pqxx::transaction_rollback& e) {
    throw util::TransientStoreFailure(e.what());
  }
  if (res.empty()) return std::nullopt;
  return ReadState(res[0]);
}

Result PgRepository::UpsertVersionState(Transaction& t, const model::VersionStateRecord& r) {
  return Exec(TX(t).Work(),
              Sql("INSERT INTO module_version_states(", kStateColumns,
                  ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) ON CONFLICT(module_path,version) DO UPDATE SET "
                  "sort_version=EXCLUDED.sort_version,incompatible=EXCLUDED.incompatible,app_version=EXCLUDED.app_version,"
                  "status=EXCLUDED.status,error=EXCLUDED.error,try_count=EXCLUDED.try_count,"
                  "last_processed_at_ms=EXCLUDED.last_processed_at_ms,"
                  "next_processed_after_ms=EXCLUDED.next_processed_after_ms,num_packages=EXCLUDED.num_packages;"),
              r.module_path, r.version, r.sort_version, r.incompatible, r.app_version, r.status, r.error, r.try_count,
              r.last_processed_at_ms, r.next_processed_after_ms, r.num_packages, r.created_at_ms);
}

std::vector<model::VersionStateRecord> PgRepository::ListVersionStates(Transaction& t, const std::string& module_path) {
  auto res = Query(TX(t).Work(),
                   Sql("SELECT ", kStateColumns,
                       " FROM module_version_states WHERE module_path=$1 ORDER BY sort_version DESC;"),
                   module_path);

  std::vector<model::VersionStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadState(row));
  return out;
}

std::vector<model::VersionStateRecord> PgRepository::ListEligibleVersionStates(Transaction& t, uint64_t now_ms) {
  auto res = Query(TX(t).Work(),
                   Sql("SELECT ", kStateColumns,
                       " FROM module_version_states WHERE (status=0 OR status>=500) AND next_processed_after_ms<=$1 "
                       "ORDER BY module_path COLLATE \"C\",version COLLATE \"C\";"),
                   now_ms);

  std::vector<model::VersionStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadState(row));
  return out;
}

Result PgRepository::ResetVersionStates(Transaction& t, const std::string& app_version_cutoff, int32_t from_status,
                                        int32_t to_status, uint64_t now_ms, uint64_t& affected) {
  affected = 0;
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE module_version_states SET status=$1,next_processed_after_ms=$2,last_processed_at_ms=NULL "
        "WHERE status=$3 AND app_version COLLATE \"C\" < $4;",
        to_status, now_ms, from_status, app_version_cutoff);
    affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Alternative paths & version map
// ------------------------------------------------------------------

Result PgRepository::UpsertAlternativeModulePath(Transaction& t, const model::AlternativeModulePathRecord& r) {
  return Exec(TX(t).Work(),
              "INSERT INTO alternative_module_paths(alternative,canonical) VALUES($1,$2) "
              "ON CONFLICT(alternative) DO UPDATE SET canonical=EXCLUDED.canonical;",
              r.alternative, r.canonical);
}

std::optional<model::AlternativeModulePathRecord> PgRepository::GetAlternativeModulePath(Transaction& t,
                                                                                         const std::string& alternative) {
  auto res = Query(TX(t).Work(), "SELECT alternative,canonical FROM alternative_module_paths WHERE alternative=$1;",
                   alternative);
  if (res.empty()) return std::nullopt;
  return model::AlternativeModulePathRecord{Str(res[0][0]), Str(res[0][1])};
}

Result PgRepository::UpsertVersionMap(Transaction& t, const model::VersionMapRecord& r) {
  return Exec(TX(t).Work(),
              "INSERT INTO version_map(module_path,requested_version,resolved_version,status,manifest_path,error,"
              "sort_version,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8) ON CONFLICT(module_path,requested_version) "
              "DO UPDATE SET resolved_version=EXCLUDED.resolved_version,status=EXCLUDED.status,"
              "manifest_path=EXCLUDED.manifest_path,error=EXCLUDED.error,sort_version=EXCLUDED.sort_version,"
              "updated_at_ms=EXCLUDED.updated_at_ms;",
              r.module_path, r.requested_version, r.resolved_version, r.status, r.manifest_path, r.error,
              r.sort_version, r.updated_at_ms);
}

std::optional<model::VersionMapRecord> PgRepository::GetVersionMap(Transaction& t, const std::string& module_path,
                                                                   const std::string& requested_version) {
  auto res = Query(TX(t).Work(),
                   "SELECT module_path,requested_version,resolved_version,status,manifest_path,error,sort_version,"
                   "updated_at_ms FROM version_map WHERE module_path=$1 AND requested_version=$2;",
                   module_path, requested_version);
  if (res.empty()) return std::nullopt;

  const auto& row = res[0];
  return model::VersionMapRecord{Str(row[0]), Str(row[1]), Str(row[2]), row[3].as<int32_t>(),
                                 Str(row[4]), Str(row[5]), Str(row[6]), row[7].as<uint64_t>()};
}

} // namespace modstore::db::postgres
