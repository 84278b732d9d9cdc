#include "internal/core/ingestion_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

#include "internal/lock/module_lock.hpp"
#include "internal/model/status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/version/module_path.hpp"
#include "internal/version/semver.hpp"
#include "internal/version/stdlib.hpp"
#include "internal/version/version.hpp"
#include "internal/version/version_order.hpp"

namespace modstore::core {
namespace {

std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out.append(sep);
    out.append(p);
  }
  return out;
}

std::string Key(const std::string& module_path, const std::string& version) {
  return module_path + "@" + version;
}

std::vector<std::string> LicenseTypes(const model::Unit& unit) {
  std::set<std::string> types;
  for (const auto& l : unit.licenses) {
    types.insert(l.types.begin(), l.types.end());
  }
  return {types.begin(), types.end()};
}

} // namespace

IngestionCoordinator::IngestionCoordinator(std::shared_ptr<db::Repository> repository, IngestOptions options,
                                           std::shared_ptr<LatestVersionCache> cache, util::NowFn now)
    : repository_(std::move(repository)),
      options_(options),
      cache_(cache ? std::move(cache) : std::make_shared<LatestVersionCache>()),
      now_(std::move(now)),
      ledger_(repository_) {
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void IngestionCoordinator::Validate(const model::ModuleGraph& graph) {
  std::vector<std::string> problems;
  const bool               stdlib = graph.module_path == version::kStdlibModulePath;

  if (graph.module_path.empty()) {
    problems.push_back("missing module path");
  } else if (!stdlib) {
    if (auto err = version::CheckModulePath(graph.module_path)) {
      problems.push_back(*err);
    }
  }

  if (graph.version.empty()) {
    problems.push_back("missing version");
  } else if (stdlib) {
    if (version::StdlibSemanticVersion(graph.version).empty()) {
      problems.push_back("unknown standard library version " + graph.version);
    }
  } else if (!version::semver::IsValid(graph.version)) {
    problems.push_back("invalid version " + graph.version);
  }

  if (graph.commit_time == util::TimePoint{}) {
    problems.push_back("missing commit time");
  }

  if (graph.units.empty()) {
    problems.push_back("module has no units");
  }

  if (!stdlib && !graph.module_path.empty()) {
    for (const auto& unit : graph.units) {
      if (!version::IsWithinModule(unit.path, graph.module_path)) {
        problems.push_back("unit " + unit.path + " is outside module " + graph.module_path);
      }
    }
  }

  if (!problems.empty()) {
    throw util::InvalidModule(Key(graph.module_path, graph.version) + ": " + Join(problems, "; "));
  }
}

void IngestionCoordinator::CheckConsistency(db::Transaction& tx, const model::ModuleGraph& graph) {
  auto stored = repository_->GetModule(tx, graph.module_path, graph.version);
  if (!stored) {
    return;
  }

  std::unordered_set<std::string> unit_paths;
  for (const auto& u : graph.units) unit_paths.insert(u.path);
  std::unordered_set<std::string> license_paths;
  for (const auto& l : graph.licenses) license_paths.insert(l.file_path);

  std::vector<std::string> missing;
  for (const auto& u : repository_->ListUnits(tx, stored->id)) {
    if (!unit_paths.count(u.path)) missing.push_back("unit " + u.path);
  }
  for (const auto& l : repository_->ListLicenses(tx, stored->id)) {
    if (!license_paths.count(l.file_path)) missing.push_back("license " + l.file_path);
  }

  if (!missing.empty()) {
    throw util::IncompleteResubmission(Key(graph.module_path, graph.version) +
                                       ": stored paths missing from resubmission: " + Join(missing, ", "));
  }
}

void IngestionCoordinator::StripNonRedistributable(model::ModuleGraph& graph) const {
  if (options_.bypass_license_check) {
    return;
  }
  for (auto& unit : graph.units) {
    if (unit.redistributable) continue;
    if (unit.readme) unit.readme->contents.clear();
    for (auto& doc : unit.documentation) {
      doc.synopsis.clear();
      doc.html.clear();
    }
  }
  for (auto& l : graph.licenses) {
    if (!l.redistributable) l.contents.clear();
  }
}

// ------------------------------------------------------------
// Entity graph
// ------------------------------------------------------------

void IngestionCoordinator::WriteGraph(db::Transaction& tx, const model::ModuleGraph& graph, uint64_t now_ms) {
  const auto ctx = Key(graph.module_path, graph.version);

  db::model::ModuleRecord module;
  module.module_path     = graph.module_path;
  module.version         = graph.version;
  module.sort_version    = version::ForSorting(graph.version);
  module.version_type    = version::TypeName(version::ParseType(graph.version));
  module.series_path     = version::SeriesPath(graph.module_path);
  module.commit_time_ms  = util::ToUnixMillis(graph.commit_time);
  module.incompatible    = version::IsIncompatible(graph.version);
  module.has_manifest    = graph.has_manifest;
  module.redistributable = graph.redistributable;
  module.source_info     = graph.source_info;
  module.updated_at_ms   = now_ms;
  db::ThrowIfError(repository_->UpsertModule(tx, module), "upsert module " + ctx);

  std::vector<db::model::LicenseRecord> licenses;
  for (const auto& l : graph.licenses) {
    licenses.push_back({module.id, l.file_path, l.types, l.contents, l.redistributable});
  }
  std::sort(licenses.begin(), licenses.end(), [](const auto& a, const auto& b) { return a.file_path < b.file_path; });
  db::ThrowIfError(repository_->UpsertLicenses(tx, licenses), "upsert licenses " + ctx);

  std::vector<const model::Unit*> units;
  for (const auto& u : graph.units) units.push_back(&u);
  std::sort(units.begin(), units.end(), [](const auto* a, const auto* b) { return a->path < b->path; });

  std::vector<std::string> paths;
  for (const auto* u : units) paths.push_back(u->path);
  std::unordered_map<std::string, int64_t> path_ids;
  db::ThrowIfError(repository_->UpsertPaths(tx, paths, path_ids), "upsert paths " + ctx);

  std::vector<db::model::UnitRecord> unit_records;
  for (const auto* u : units) {
    db::model::UnitRecord r;
    r.module_id       = module.id;
    r.path_id         = path_ids.at(u->path);
    r.path            = u->path;
    r.v1_path         = version::V1Path(u->path, graph.module_path);
    r.name            = u->name;
    r.redistributable = u->redistributable;
    r.license_types   = LicenseTypes(*u);
    for (const auto& l : u->licenses) r.license_paths.push_back(l.file_path);
    unit_records.push_back(std::move(r));
  }
  db::ThrowIfError(repository_->UpsertUnits(tx, unit_records), "upsert units " + ctx);

  std::vector<db::model::ReadmeRecord>        readmes;
  std::vector<db::model::DocumentationRecord> docs;
  std::vector<db::model::PackageImportRecord> imports;
  for (std::size_t i = 0; i < units.size(); ++i) {
    const auto& unit    = *units[i];
    const auto  unit_id = unit_records[i].id;

    if (unit.readme && !unit.readme->file_path.empty()) {
      readmes.push_back({unit_id, unit.readme->file_path, unit.readme->contents});
    }

    auto unit_docs = unit.documentation;
    std::sort(unit_docs.begin(), unit_docs.end(), [](const auto& a, const auto& b) {
      return std::tie(a.build_context.os, a.build_context.arch) < std::tie(b.build_context.os, b.build_context.arch);
    });
    for (const auto& d : unit_docs) {
      docs.push_back({unit_id, d.build_context.os, d.build_context.arch, d.synopsis, d.html});
    }

    std::set<std::string> to_paths(unit.imports.begin(), unit.imports.end());
    for (const auto& to : to_paths) {
      imports.push_back({unit_id, to});
    }
  }
  db::ThrowIfError(repository_->UpsertReadmes(tx, readmes), "upsert readmes " + ctx);
  db::ThrowIfError(repository_->UpsertDocumentation(tx, docs), "upsert documentation " + ctx);
  db::ThrowIfError(repository_->UpsertPackageImports(tx, imports), "upsert package imports " + ctx);
}

// ------------------------------------------------------------
// Latest version
// ------------------------------------------------------------

std::optional<std::string> IngestionCoordinator::RecomputeGoodVersion(db::Transaction& tx,
                                                                       const std::string& module_path,
                                                                       uint64_t now_ms) {
  std::vector<version::VersionMeta> candidates;
  for (const auto& m : repository_->ListModuleVersions(tx, module_path)) {
    candidates.push_back(version::MakeVersionMeta(m.module_path, m.version));
  }

  version::RetractionSet retractions;
  std::string            cooked;
  if (auto latest = repository_->GetLatestModuleVersions(tx, module_path)) {
    retractions = version::RetractionSet(latest->retractions);
    cooked      = latest->cooked_version;
  }

  auto good = version::ResolveLatest(candidates, retractions.Predicate(), cooked);
  db::ThrowIfError(repository_->UpdateLatestGoodVersion(tx, module_path, good.value_or(""), now_ms),
                   "update good version " + module_path);
  return good;
}

bool IngestionCoordinator::IsAlternative(db::Transaction& tx, const std::string& module_path,
                                         const std::string& sort_version) {
  for (const auto& s : repository_->ListVersionStates(tx, module_path)) {
    if (s.sort_version >= sort_version && s.status == model::ToCode(model::VersionStatus::kAlternativePath)) {
      return true;
    }
  }
  return repository_->GetAlternativeModulePath(tx, module_path).has_value();
}

void IngestionCoordinator::WriteLatestDerived(db::Transaction& tx, const model::ModuleGraph& graph) {
  std::vector<db::model::ImportEdgeRecord> edges;
  for (const auto& unit : graph.units) {
    if (!unit.IsPackage()) continue;
    std::set<std::string> to_paths(unit.imports.begin(), unit.imports.end());
    for (const auto& to : to_paths) {
      edges.push_back({unit.path, graph.module_path, to});
    }
  }
  db::ThrowIfError(repository_->ReplaceImportsUnique(tx, graph.module_path, edges),
                   "replace imports " + graph.module_path);

  if (IsAlternative(tx, graph.module_path, version::ForSorting(graph.version))) {
    MODSTORE_LOG_INFO("alternative module path, search rows suppressed",
                      {observability::ModuleField(graph.module_path)});
    db::ThrowIfError(repository_->DeleteSearchDocuments(tx, graph.module_path),
                     "delete search documents " + graph.module_path);
    return;
  }

  std::vector<db::model::SearchDocumentRecord> docs;
  for (const auto& unit : graph.units) {
    if (!unit.IsPackage()) continue;
    db::model::SearchDocumentRecord d;
    d.package_path    = unit.path;
    d.module_path     = graph.module_path;
    d.version         = graph.version;
    d.name            = unit.name;
    d.synopsis        = unit.documentation.empty() ? std::string() : unit.documentation.front().synopsis;
    d.license_types   = LicenseTypes(unit);
    d.redistributable = unit.redistributable;
    d.commit_time_ms  = util::ToUnixMillis(graph.commit_time);
    docs.push_back(std::move(d));
  }
  std::sort(docs.begin(), docs.end(), [](const auto& a, const auto& b) { return a.package_path < b.package_path; });
  db::ThrowIfError(repository_->ReplaceSearchDocuments(tx, graph.module_path, docs),
                   "replace search documents " + graph.module_path);
}

// ------------------------------------------------------------
// Ingest
// ------------------------------------------------------------

bool IngestionCoordinator::Ingest(model::ModuleGraph graph) {
  observability::SpanScope span("modstore.ingest");
  span.SetAttribute("module_path", graph.module_path);
  span.SetAttribute("version", graph.version);

  const auto started = std::chrono::steady_clock::now();

  try {
    Validate(graph);
  } catch (const util::InvalidModule& e) {
    MODSTORE_LOG_WARN("module rejected", {observability::ModuleField(graph.module_path, graph.version),
                                          observability::ErrorField(e.what())});
    throw;
  }

  // standard library tags are stored under their semantic version
  if (graph.module_path == version::kStdlibModulePath) {
    graph.version = version::StdlibSemanticVersion(graph.version);
  }

  {
    auto tx = repository_->Begin();
    CheckConsistency(*tx, graph);
    tx->Commit();
  }

  StripNonRedistributable(graph);

  MODSTORE_LOG_INFO("ingest started", {observability::ModuleField(graph.module_path, graph.version),
                                       observability::IntField("units", static_cast<int64_t>(graph.units.size()))});

  const auto now_ms = util::ToUnixMillis(now_());
  bool       latest = false;

  auto tx = repository_->Begin();
  WriteGraph(*tx, graph, now_ms);

  lock::WithModuleLock(*repository_, tx.get(), graph.module_path, [&] {
    CheckConsistency(*tx, graph);
    ledger_.Merge(*tx, graph.module_path, graph.version, symbols::CollectUnitSymbols(graph));
    auto good = RecomputeGoodVersion(*tx, graph.module_path, now_ms);
    latest    = good && *good == graph.version;
    if (latest) {
      WriteLatestDerived(*tx, graph);
    }
  });

  tx->Commit();
  cache_->Invalidate(graph.module_path);

  const double elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveIngestLatencyMs(elapsed_ms);
  span.SetAttribute("is_latest", static_cast<int64_t>(latest));

  MODSTORE_LOG_INFO("ingest finished", {observability::ModuleField(graph.module_path, graph.version),
                                        observability::BoolField("is_latest", latest),
                                        observability::DurationMsField("duration", elapsed_ms)});
  return latest;
}

// ------------------------------------------------------------
// Latest pointer
// ------------------------------------------------------------

std::optional<db::model::LatestModuleVersionsRecord> IngestionCoordinator::ResolveLatest(const std::string& module_path) {
  if (auto cached = cache_->Get(module_path)) {
    return cached;
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetLatestModuleVersions(*tx, module_path);
  tx->Commit();

  if (record) {
    cache_->Put(*record);
  }
  return record;
}

db::model::LatestModuleVersionsRecord
IngestionCoordinator::UpdateLatestModuleVersions(const db::model::LatestModuleVersionsRecord& info) {
  const auto now_ms = util::ToUnixMillis(now_());
  db::model::LatestModuleVersionsRecord stored;

  auto tx = repository_->Begin();
  lock::WithModuleLock(*repository_, tx.get(), info.module_path, [&] {
    auto current = repository_->GetLatestModuleVersions(*tx, info.module_path);

    const bool newer = !current || current->raw_version.empty() ||
                       version::Later(info.raw_version, current->raw_version) ||
                       (version::IsIncompatible(current->raw_version) && !version::IsIncompatible(info.raw_version));
    if (newer) {
      auto record          = info;
      record.updated_at_ms = now_ms;
      db::ThrowIfError(repository_->UpsertLatestModuleVersions(*tx, record),
                       "upsert latest versions " + info.module_path);
    } else {
      MODSTORE_LOG_DEBUG("latest versions not updated", {observability::ModuleField(info.module_path),
                                                         observability::StringField("raw", info.raw_version),
                                                         observability::StringField("held", current->raw_version)});
    }

    RecomputeGoodVersion(*tx, info.module_path, now_ms);
    stored = *repository_->GetLatestModuleVersions(*tx, info.module_path);
  });
  tx->Commit();
  cache_->Invalidate(info.module_path);
  return stored;
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void IngestionCoordinator::DeleteModuleVersion(const std::string& module_path, const std::string& version) {
  auto tx = repository_->Begin();
  DeleteModuleVersion(*tx, module_path, version);
  tx->Commit();
  cache_->Invalidate(module_path);
}

void IngestionCoordinator::DeleteModuleVersion(db::Transaction& tx, const std::string& module_path,
                                               const std::string& version) {
  const auto ctx = Key(module_path, version);
  db::ThrowIfError(repository_->DeleteModule(tx, module_path, version), "delete module " + ctx);

  lock::WithModuleLock(*repository_, &tx, module_path, [&] {
    RecomputeGoodVersion(tx, module_path, util::ToUnixMillis(now_()));

    if (repository_->ListModuleVersions(tx, module_path).empty()) {
      db::ThrowIfError(repository_->ReplaceImportsUnique(tx, module_path, {}), "clear imports " + module_path);
      db::ThrowIfError(repository_->DeleteSearchDocuments(tx, module_path), "clear search documents " + module_path);
      return;
    }

    auto docs = repository_->ListSearchDocuments(tx, module_path);
    if (std::any_of(docs.begin(), docs.end(), [&](const auto& d) { return d.version == version; })) {
      db::ThrowIfError(repository_->DeleteSearchDocuments(tx, module_path), "clear search documents " + module_path);
    }
  });

  MODSTORE_LOG_INFO("module version deleted", {observability::ModuleField(module_path, version)});
}

std::size_t IngestionCoordinator::DeletePseudoVersionsExcept(const std::string& module_path,
                                                             const std::string& keep_version) {
  std::size_t deleted = 0;

  auto tx = repository_->Begin();
  for (const auto& m : repository_->ListModuleVersions(*tx, module_path)) {
    if (m.version_type != version::TypeName(version::Type::kPseudo) || m.version == keep_version) continue;
    DeleteModuleVersion(*tx, module_path, m.version);
    ++deleted;
  }
  tx->Commit();
  cache_->Invalidate(module_path);

  MODSTORE_LOG_INFO("pseudo-versions deleted", {observability::ModuleField(module_path),
                                                observability::StringField("kept", keep_version),
                                                observability::IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

void IngestionCoordinator::InvalidateCached(const std::string& module_path) {
  cache_->Invalidate(module_path);
}

} // namespace modstore::core
