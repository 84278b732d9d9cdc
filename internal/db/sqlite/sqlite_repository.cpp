#include "sqlite_repository.hpp"

#include "internal/db/sql/codec.hpp"

namespace modstore::db::sqlite {

using modstore::db::ErrorCode;
using modstore::db::Result;

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

model::ModuleRecord ReadModule(const Statement& st) {
  model::ModuleRecord r;
  r.id              = st.Int64(0);
  r.module_path     = st.Text(1);
  r.version         = st.Text(2);
  r.sort_version    = st.Text(3);
  r.version_type    = st.Text(4);
  r.series_path     = st.Text(5);
  r.commit_time_ms  = st.UInt64(6);
  r.incompatible    = st.Bool(7);
  r.has_manifest    = st.Bool(8);
  r.redistributable = st.Bool(9);
  r.source_info     = st.Text(10);
  r.updated_at_ms   = st.UInt64(11);
  return r;
}

model::VersionStateRecord ReadState(const Statement& st) {
  model::VersionStateRecord r;
  r.module_path             = st.Text(0);
  r.version                 = st.Text(1);
  r.sort_version            = st.Text(2);
  r.incompatible            = st.Bool(3);
  r.app_version             = st.Text(4);
  r.status                  = st.Int32(5);
  r.error                   = st.Text(6);
  r.try_count               = st.Int32(7);
  r.last_processed_at_ms    = st.OptUInt64(8);
  r.next_processed_after_ms = st.UInt64(9);
  r.num_packages            = st.OptInt64(10);
  r.created_at_ms           = st.UInt64(11);
  return r;
}

// Runs st once per item, binding with bind(st, item).
template <typename Items, typename BindFn>
Result RunEach(Statement& st, const Items& items, BindFn bind) {
  for (const auto& item : items) {
    bind(st, item);
    if (auto r = st.Run(); !r) return r;
    if (auto r = st.Reset(); !r) return r;
  }
  return Result::Ok();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::AcquireAdvisoryLock(Transaction& t, int64_t) {
  if (!t.IsActive()) {
    return Result::Err(ErrorCode::InternalError, "advisory lock requires an active transaction");
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Module versions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertModule(Transaction& t, model::ModuleRecord& r) {
  auto* db = TX(t).Handle();

  Statement up(db,
               "INSERT INTO modules(module_path,version,sort_version,version_type,series_path,commit_time_ms,incompatible,"
               "has_manifest,redistributable,source_info,updated_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(module_path,version) DO UPDATE SET redistributable=excluded.redistributable,"
               "source_info=excluded.source_info,updated_at_ms=excluded.updated_at_ms;");
  up.BindAll(r.module_path, r.version, r.sort_version, r.version_type, r.series_path, r.commit_time_ms, r.incompatible,
             r.has_manifest, r.redistributable, r.source_info, r.updated_at_ms);
  if (auto res = up.Run(); !res) return res;

  Statement id(db, "SELECT id FROM modules WHERE module_path=? AND version=?;");
  id.BindAll(r.module_path, r.version);
  if (!id.Next()) return Result::Err(ErrorCode::InternalError, "module id missing after upsert");
  r.id = id.Int64(0);
  return Result::Ok();
}

std::optional<model::ModuleRecord> SqliteRepository::GetModule(Transaction& t, const std::string& module_path,
                                                               const std::string& version) {
  Statement st(TX(t).Handle(), Sql("SELECT ", kModuleColumns, " FROM modules WHERE module_path=? AND version=?;").c_str());
  st.BindAll(module_path, version);
  if (!st.Next()) return std::nullopt;
  return ReadModule(st);
}

std::vector<model::ModuleRecord> SqliteRepository::ListModuleVersions(Transaction& t, const std::string& module_path) {
  Statement st(TX(t).Handle(),
               Sql("SELECT ", kModuleColumns, " FROM modules WHERE module_path=? ORDER BY sort_version DESC;").c_str());
  st.Bind(1, module_path);

  std::vector<model::ModuleRecord> out;
  while (st.Next()) out.push_back(ReadModule(st));
  return out;
}

std::vector<model::ModuleRecord> SqliteRepository::ListPseudoVersionsUpdatedBefore(Transaction& t, uint64_t cutoff_ms) {
  Statement st(TX(t).Handle(), Sql("SELECT ", kModuleColumns,
                                   " FROM modules WHERE version_type='pseudo' AND updated_at_ms<? "
                                   "ORDER BY updated_at_ms ASC, module_path, version;")
                                   .c_str());
  st.Bind(1, cutoff_ms);

  std::vector<model::ModuleRecord> out;
  while (st.Next()) out.push_back(ReadModule(st));
  return out;
}

Result SqliteRepository::DeleteModule(Transaction& t, const std::string& module_path, const std::string& version) {
  auto* db = TX(t).Handle();

  Statement find(db, "SELECT id FROM modules WHERE module_path=? AND version=?;");
  find.BindAll(module_path, version);
  if (!find.Next()) return Result::Err(ErrorCode::NotFound, module_path + "@" + version);
  const int64_t module_id = find.Int64(0);

  Statement vm(db, "DELETE FROM version_map WHERE module_path=? AND resolved_version=?;");
  vm.BindAll(module_path, version);
  if (auto r = vm.Run(); !r) return r;

  // units, licenses and unit content cascade
  Statement del(db, "DELETE FROM modules WHERE id=?;");
  del.Bind(1, module_id);
  return del.Run();
}

// ------------------------------------------------------------------
// Paths, units and unit content
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPaths(Transaction& t, const std::vector<std::string>& paths,
                                     std::unordered_map<std::string, int64_t>& ids) {
  auto* db = TX(t).Handle();

  Statement ins(db, "INSERT OR IGNORE INTO paths(path) VALUES(?);");
  Statement sel(db, "SELECT id FROM paths WHERE path=?;");
  for (const auto& p : paths) {
    ins.Bind(1, p);
    if (auto r = ins.Run(); !r) return r;
    if (auto r = ins.Reset(); !r) return r;

    sel.Bind(1, p);
    if (!sel.Next()) return Result::Err(ErrorCode::InternalError, "path id missing after upsert: " + p);
    ids[p] = sel.Int64(0);
    if (auto r = sel.Reset(); !r) return r;
  }
  return Result::Ok();
}

Result SqliteRepository::UpsertUnits(Transaction& t, std::vector<model::UnitRecord>& units) {
  auto* db = TX(t).Handle();

  Statement up(db,
               "INSERT INTO units(module_id,path_id,path,v1_path,name,redistributable,license_types,license_paths) "
               "VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(module_id,path_id) DO UPDATE SET path=excluded.path,"
               "v1_path=excluded.v1_path,name=excluded.name,redistributable=excluded.redistributable,"
               "license_types=excluded.license_types,license_paths=excluded.license_paths;");
  Statement sel(db, "SELECT id FROM units WHERE module_id=? AND path_id=?;");
  for (auto& u : units) {
    up.BindAll(u.module_id, u.path_id, u.path, u.v1_path, u.name, u.redistributable, sql::JoinLines(u.license_types),
               sql::JoinLines(u.license_paths));
    if (auto r = up.Run(); !r) return r;
    if (auto r = up.Reset(); !r) return r;

    sel.BindAll(u.module_id, u.path_id);
    if (!sel.Next()) return Result::Err(ErrorCode::InternalError, "unit id missing after upsert: " + u.path);
    u.id = sel.Int64(0);
    if (auto r = sel.Reset(); !r) return r;
  }
  return Result::Ok();
}

std::vector<model::UnitRecord> SqliteRepository::ListUnits(Transaction& t, int64_t module_id) {
  Statement st(TX(t).Handle(),
               "SELECT id,module_id,path_id,path,v1_path,name,redistributable,license_types,license_paths "
               "FROM units WHERE module_id=? ORDER BY path;");
  st.Bind(1, module_id);

  std::vector<model::UnitRecord> out;
  while (st.Next()) {
    model::UnitRecord u;
    u.id              = st.Int64(0);
    u.module_id       = st.Int64(1);
    u.path_id         = st.Int64(2);
    u.path            = st.Text(3);
    u.v1_path         = st.Text(4);
    u.name            = st.Text(5);
    u.redistributable = st.Bool(6);
    u.license_types   = sql::SplitLines(st.Text(7));
    u.license_paths   = sql::SplitLines(st.Text(8));
    out.push_back(std::move(u));
  }
  return out;
}

Result SqliteRepository::UpsertLicenses(Transaction& t, const std::vector<model::LicenseRecord>& licenses) {
  Statement st(TX(t).Handle(),
               "INSERT INTO licenses(module_id,file_path,types,contents,redistributable) VALUES(?,?,?,?,?) "
               "ON CONFLICT(module_id,file_path) DO UPDATE SET types=excluded.types,contents=excluded.contents,"
               "redistributable=excluded.redistributable;");
  return RunEach(st, licenses, [](Statement& s, const model::LicenseRecord& l) {
    s.BindAll(l.module_id, l.file_path, sql::JoinLines(l.types), l.contents, l.redistributable);
  });
}

std::vector<model::LicenseRecord> SqliteRepository::ListLicenses(Transaction& t, int64_t module_id) {
  Statement st(TX(t).Handle(),
               "SELECT module_id,file_path,types,contents,redistributable FROM licenses WHERE module_id=? ORDER BY file_path;");
  st.Bind(1, module_id);

  std::vector<model::LicenseRecord> out;
  while (st.Next()) {
    out.push_back({st.Int64(0), st.Text(1), sql::SplitLines(st.Text(2)), st.Text(3), st.Bool(4)});
  }
  return out;
}

Result SqliteRepository::UpsertReadmes(Transaction& t, const std::vector<model::ReadmeRecord>& readmes) {
  Statement st(TX(t).Handle(),
               "INSERT INTO readmes(unit_id,file_path,contents) VALUES(?,?,?) "
               "ON CONFLICT(unit_id) DO UPDATE SET file_path=excluded.file_path,contents=excluded.contents;");
  return RunEach(st, readmes,
                 [](Statement& s, const model::ReadmeRecord& r) { s.BindAll(r.unit_id, r.file_path, r.contents); });
}

std::optional<model::ReadmeRecord> SqliteRepository::GetReadme(Transaction& t, int64_t unit_id) {
  Statement st(TX(t).Handle(), "SELECT unit_id,file_path,contents FROM readmes WHERE unit_id=?;");
  st.Bind(1, unit_id);
  if (!st.Next()) return std::nullopt;
  return model::ReadmeRecord{st.Int64(0), st.Text(1), st.Text(2)};
}

Result SqliteRepository::UpsertDocumentation(Transaction& t, const std::vector<model::DocumentationRecord>& docs) {
  Statement st(TX(t).Handle(),
               "INSERT INTO documentation(unit_id,os,arch,synopsis,html) VALUES(?,?,?,?,?) "
               "ON CONFLICT(unit_id,os,arch) DO UPDATE SET synopsis=excluded.synopsis,html=excluded.html;");
  return RunEach(st, docs, [](Statement& s, const model::DocumentationRecord& d) {
    s.BindAll(d.unit_id, d.os, d.arch, d.synopsis, d.html);
  });
}

std::vector<model::DocumentationRecord> SqliteRepository::ListDocumentation(Transaction& t, int64_t unit_id) {
  Statement st(TX(t).Handle(),
               "SELECT unit_id,os,arch,synopsis,html FROM documentation WHERE unit_id=? ORDER BY os,arch;");
  st.Bind(1, unit_id);

  std::vector<model::DocumentationRecord> out;
  while (st.Next()) {
    out.push_back({st.Int64(0), st.Text(1), st.Text(2), st.Text(3), st.Text(4)});
  }
  return out;
}

Result SqliteRepository::UpsertPackageImports(Transaction& t, const std::vector<model::PackageImportRecord>& imports) {
  Statement st(TX(t).Handle(), "INSERT OR IGNORE INTO package_imports(unit_id,to_path) VALUES(?,?);");
  return RunEach(st, imports,
                 [](Statement& s, const model::PackageImportRecord& i) { s.BindAll(i.unit_id, i.to_path); });
}

std::vector<std::string> SqliteRepository::ListPackageImports(Transaction& t, int64_t unit_id) {
  Statement st(TX(t).Handle(), "SELECT to_path FROM package_imports WHERE unit_id=? ORDER BY to_path;");
  st.Bind(1, unit_id);

  std::vector<std::string> out;
  while (st.Next()) out.push_back(st.Text(0));
  return out;
}

// ------------------------------------------------------------------
// Latest-version pointer
// ------------------------------------------------------------------

std::optional<model::LatestModuleVersionsRecord> SqliteRepository::GetLatestModuleVersions(
    Transaction& t, const std::string& module_path) {
  Statement st(TX(t).Handle(),
               "SELECT module_path,raw_version,cooked_version,good_version,retractions,deprecated,deprecation_comment,"
               "status,updated_at_ms FROM latest_module_versions WHERE module_path=?;");
  st.Bind(1, module_path);
  if (!st.Next()) return std::nullopt;

  model::LatestModuleVersionsRecord r;
  r.module_path         = st.Text(0);
  r.raw_version         = st.Text(1);
  r.cooked_version      = st.Text(2);
  r.good_version        = st.Text(3);
  r.retractions         = sql::DecodeRetractions(st.Text(4));
  r.deprecated          = st.Bool(5);
  r.deprecation_comment = st.Text(6);
  r.status              = st.Int32(7);
  r.updated_at_ms       = st.UInt64(8);
  return r;
}

Result SqliteRepository::UpsertLatestModuleVersions(Transaction& t, const model::LatestModuleVersionsRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO latest_module_versions(module_path,raw_version,cooked_version,good_version,retractions,"
               "deprecated,deprecation_comment,status,updated_at_ms) VALUES(?,?,?,'',?,?,?,?,?) "
               "ON CONFLICT(module_path) DO UPDATE SET raw_version=excluded.raw_version,cooked_version=excluded.cooked_version,"
               "retractions=excluded.retractions,deprecated=excluded.deprecated,deprecation_comment=excluded.deprecation_comment,"
               "status=excluded.status,updated_at_ms=excluded.updated_at_ms;");
  st.BindAll(r.module_path, r.raw_version, r.cooked_version, sql::EncodeRetractions(r.retractions), r.deprecated,
             r.deprecation_comment, r.status, r.updated_at_ms);
  return st.Run();
}

Result SqliteRepository::UpdateLatestGoodVersion(Transaction& t, const std::string& module_path,
                                                 const std::string& good_version, uint64_t updated_at_ms) {
  Statement st(TX(t).Handle(),
               "INSERT INTO latest_module_versions(module_path,raw_version,cooked_version,good_version,retractions,"
               "deprecated,deprecation_comment,status,updated_at_ms) VALUES(?,'','',?,'',0,'',200,?) "
               "ON CONFLICT(module_path) DO UPDATE SET good_version=excluded.good_version,"
               "updated_at_ms=excluded.updated_at_ms;");
  st.BindAll(module_path, good_version, updated_at_ms);
  return st.Run();
}

// ------------------------------------------------------------------
// Derived tables
// ------------------------------------------------------------------

Result SqliteRepository::ReplaceImportsUnique(Transaction& t, const std::string& from_module_path,
                                              const std::vector<model::ImportEdgeRecord>& edges) {
  auto* db = TX(t).Handle();

  Statement del(db, "DELETE FROM imports_unique WHERE from_module_path=?;");
  del.Bind(1, from_module_path);
  if (auto r = del.Run(); !r) return r;

  Statement ins(db, "INSERT OR IGNORE INTO imports_unique(from_path,from_module_path,to_path) VALUES(?,?,?);");
  return RunEach(ins, edges, [&](Statement& s, const model::ImportEdgeRecord& e) {
    s.BindAll(e.from_path, from_module_path, e.to_path);
  });
}

std::vector<model::ImportEdgeRecord> SqliteRepository::ListImportsUnique(Transaction& t,
                                                                        const std::string& from_module_path) {
  Statement st(TX(t).Handle(),
               "SELECT from_path,from_module_path,to_path FROM imports_unique WHERE from_module_path=? "
               "ORDER BY from_path,to_path;");
  st.Bind(1, from_module_path);

  std::vector<model::ImportEdgeRecord> out;
  while (st.Next()) out.push_back({st.Text(0), st.Text(1), st.Text(2)});
  return out;
}

Result SqliteRepository::ReplaceSearchDocuments(Transaction& t, const std::string& module_path,
                                                const std::vector<model::SearchDocumentRecord>& docs) {
  if (auto r = DeleteSearchDocuments(t, module_path); !r) return r;

  Statement st(TX(t).Handle(),
               "INSERT INTO search_documents(package_path,module_path,version,name,synopsis,license_types,redistributable,"
               "commit_time_ms) VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(package_path) DO UPDATE SET module_path=excluded.module_path,"
               "version=excluded.version,name=excluded.name,synopsis=excluded.synopsis,license_types=excluded.license_types,"
               "redistributable=excluded.redistributable,commit_time_ms=excluded.commit_time_ms;");
  return RunEach(st, docs, [](Statement& s, const model::SearchDocumentRecord& d) {
    s.BindAll(d.package_path, d.module_path, d.version, d.name, d.synopsis, sql::JoinLines(d.license_types),
              d.redistributable, d.commit_time_ms);
  });
}

Result SqliteRepository::DeleteSearchDocuments(Transaction& t, const std::string& module_path) {
  Statement st(TX(t).Handle(), "DELETE FROM search_documents WHERE module_path=?;");
  st.Bind(1, module_path);
  return st.Run();
}

std::vector<model::SearchDocumentRecord> SqliteRepository::ListSearchDocuments(Transaction& t,
                                                                              const std::string& module_path) {
  Statement st(TX(t).Handle(),
               "SELECT package_path,module_path,version,name,synopsis,license_types,redistributable,commit_time_ms "
               "FROM search_documents WHERE module_path=? ORDER BY package_path;");
  st.Bind(1, module_path);

  std::vector<model::SearchDocumentRecord> out;
  while (st.Next()) {
    out.push_back({st.Text(0), st.Text(1), st.Text(2), st.Text(3), st.Text(4), sql::SplitLines(st.Text(5)), st.Bool(6),
                   st.UInt64(7)});
  }
  return out;
}

std::vector<model::SymbolHistoryRecord> SqliteRepository::ListSymbolHistory(Transaction& t,
                                                                           const std::string& module_path,
                                                                           const std::string& package_path) {
  Statement st(TX(t).Handle(),
               "SELECT package_path,symbol_name,parent_name,os,arch,module_path,since_version,sort_version,kind,synopsis "
               "FROM symbol_history WHERE module_path=? AND package_path=? ORDER BY symbol_name,parent_name,os,arch;");
  st.BindAll(module_path, package_path);

  std::vector<model::SymbolHistoryRecord> out;
  while (st.Next()) {
    out.push_back({st.Text(0), st.Text(1), st.Text(2), st.Text(3), st.Text(4), st.Text(5), st.Text(6), st.Text(7),
                   st.Text(8), st.Text(9)});
  }
  return out;
}

Result SqliteRepository::UpsertSymbolHistory(Transaction& t, const std::vector<model::SymbolHistoryRecord>& records) {
  Statement st(TX(t).Handle(),
               "INSERT INTO symbol_history(package_path,symbol_name,parent_name,os,arch,module_path,since_version,"
               "sort_version,kind,synopsis) VALUES(?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(package_path,symbol_name,parent_name,os,arch) DO UPDATE SET module_path=excluded.module_path,"
               "since_version=excluded.since_version,sort_version=excluded.sort_version,kind=excluded.kind,"
               "synopsis=excluded.synopsis WHERE excluded.sort_version < symbol_history.sort_version;");
  return RunEach(st, records, [](Statement& s, const model::SymbolHistoryRecord& r) {
    s.BindAll(r.package_path, r.symbol_name, r.parent_name, r.os, r.arch, r.module_path, r.since_version,
              r.sort_version, r.kind, r.synopsis);
  });
}

// ------------------------------------------------------------------
// Work queue state
// ------------------------------------------------------------------

std::optional<model::VersionStateRecord> SqliteRepository::GetVersionState(Transaction& t,
                                                                           const std::string& module_path,
                                                                           const std::string& version) {
  Statement st(TX(t).Handle(),
               Sql("SELECT ", kStateColumns, " FROM module_version_states WHERE module_path=? AND version=?;").c_str());
  st.BindAll(module_path, version);
  if (!st.Next()) return std::nullopt;
  return ReadState(st);
}

Result SqliteRepository::UpsertVersionState(Transaction& t, const model::VersionStateRecord& r) {
  Statement st(TX(t).Handle(),
               Sql("INSERT INTO module_version_states(", kStateColumns,
                   ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(module_path,version) DO UPDATE SET "
                   "sort_version=excluded.sort_version,incompatible=excluded.incompatible,app_version=excluded.app_version,"
                   "status=excluded.status,error=excluded.error,try_count=excluded.try_count,"
                   "last_processed_at_ms=excluded.last_processed_at_ms,next_processed_after_ms=excluded.next_processed_after_ms,"
                   "num_packages=excluded.num_packages;")
                   .c_str());
  st.BindAll(r.module_path, r.version, r.sort_version, r.incompatible, r.app_version, r.status, r.error, r.try_count,
             r.last_processed_at_ms, r.next_processed_after_ms, r.num_packages, r.created_at_ms);
  return st.Run();
}

std::vector<model::VersionStateRecord> SqliteRepository::ListVersionStates(Transaction& t,
                                                                          const std::string& module_path) {
  Statement st(TX(t).Handle(), Sql("SELECT ", kStateColumns,
                                   " FROM module_version_states WHERE module_path=? ORDER BY sort_version DESC;")
                                   .c_str());
  st.Bind(1, module_path);

  std::vector<model::VersionStateRecord> out;
  while (st.Next()) out.push_back(ReadState(st));
  return out;
}

std::vector<model::VersionStateRecord> SqliteRepository::ListEligibleVersionStates(Transaction& t, uint64_t now_ms) {
  Statement st(TX(t).Handle(), Sql("SELECT ", kStateColumns,
                                   " FROM module_version_states WHERE (status=0 OR status>=500) "
                                   "AND next_processed_after_ms<=? ORDER BY module_path,version;")
                                   .c_str());
  st.Bind(1, now_ms);

  std::vector<model::VersionStateRecord> out;
  while (st.Next()) out.push_back(ReadState(st));
  return out;
}

Result SqliteRepository::ResetVersionStates(Transaction& t, const std::string& app_version_cutoff, int32_t from_status,
                                            int32_t to_status, uint64_t now_ms, uint64_t& affected) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE module_version_states SET status=?,next_processed_after_ms=?,last_processed_at_ms=NULL "
               "WHERE status=? AND app_version<?;");
  st.BindAll(to_status, now_ms, from_status, app_version_cutoff);
  auto r = st.Run();
  affected = r ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return r;
}

// ------------------------------------------------------------------
// Alternative paths & version map
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAlternativeModulePath(Transaction& t, const model::AlternativeModulePathRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO alternative_module_paths(alternative,canonical) VALUES(?,?) "
               "ON CONFLICT(alternative) DO UPDATE SET canonical=excluded.canonical;");
  st.BindAll(r.alternative, r.canonical);
  return st.Run();
}

std::optional<model::AlternativeModulePathRecord> SqliteRepository::GetAlternativeModulePath(
    Transaction& t, const std::string& alternative) {
  Statement st(TX(t).Handle(), "SELECT alternative,canonical FROM alternative_module_paths WHERE alternative=?;");
  st.Bind(1, alternative);
  if (!st.Next()) return std::nullopt;
  return model::AlternativeModulePathRecord{st.Text(0), st.Text(1)};
}

Result SqliteRepository::UpsertVersionMap(Transaction& t, const model::VersionMapRecord& r) {
  Statement st(TX(t).Handle(),
               "INSERT INTO version_map(module_path,requested_version,resolved_version,status,manifest_path,error,"
               "sort_version,updated_at_ms) VALUES(?,?,?,?,?,?,?,?) ON CONFLICT(module_path,requested_version) DO UPDATE SET "
               "resolved_version=excluded.resolved_version,status=excluded.status,manifest_path=excluded.manifest_path,"
               "error=excluded.error,sort_version=excluded.sort_version,updated_at_ms=excluded.updated_at_ms;");
  st.BindAll(r.module_path, r.requested_version, r.resolved_version, r.status, r.manifest_path, r.error, r.sort_version,
             r.updated_at_ms);
  return st.Run();
}

std::optional<model::VersionMapRecord> SqliteRepository::GetVersionMap(Transaction& t, const std::string& module_path,
                                                                       const std::string& requested_version) {
  Statement st(TX(t).Handle(),
               "SELECT module_path,requested_version,resolved_version,status,manifest_path,error,sort_version,updated_at_ms "
               "FROM version_map WHERE module_path=? AND requested_version=?;");
  st.BindAll(module_path, requested_version);
  if (!st.Next()) return std::nullopt;
  return model::VersionMapRecord{st.Text(0), st.Text(1), st.Text(2), st.Int32(3),
                                 st.Text(4), st.Text(5), st.Text(6), st.UInt64(7)};
}

} // namespace modstore::db::sqlite
