#include "memory_repository.hpp"

#include <algorithm>

#include "internal/model/status.hpp"
#include "memory_tx.hpp"

namespace modstore::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::AcquireAdvisoryLock(Transaction& t, int64_t key) {
  if (!t.IsActive()) {
    return Result::Err(ErrorCode::InternalError, "advisory lock requires an active transaction");
  }
  TX(t).HoldLock(key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Module versions
// ------------------------------------------------------------------

Result MemoryRepository::UpsertModule(Transaction& t, model::ModuleRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.modules.find({r.module_path, r.version});
  if (it != s.modules.end()) {
    it->second.redistributable = r.redistributable;
    it->second.source_info     = r.source_info;
    it->second.updated_at_ms   = r.updated_at_ms;
    r.id                       = it->second.id;
    return Result::Ok();
  }
  r.id                                   = s.next_module_id++;
  s.modules[{r.module_path, r.version}] = r;
  return Result::Ok();
}

std::optional<model::ModuleRecord> MemoryRepository::GetModule(Transaction& t, const std::string& module_path,
                                                               const std::string& version) {
  const auto& s  = TX(t).View();
  auto        it = s.modules.find({module_path, version});
  if (it == s.modules.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ModuleRecord> MemoryRepository::ListModuleVersions(Transaction& t, const std::string& module_path) {
  const auto&                      s = TX(t).View();
  std::vector<model::ModuleRecord> out;
  for (auto it = s.modules.lower_bound({module_path, ""}); it != s.modules.end() && it->first.first == module_path;
       ++it) {
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.sort_version > b.sort_version; });
  return out;
}

std::vector<model::ModuleRecord> MemoryRepository::ListPseudoVersionsUpdatedBefore(Transaction& t,
                                                                                  uint64_t     cutoff_ms) {
  std::vector<model::ModuleRecord> out;
  for (const auto& [_, m] : TX(t).View().modules) {
    if (m.version_type == "pseudo" && m.updated_at_ms < cutoff_ms) {
      out.push_back(m);
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return out;
}

Result MemoryRepository::DeleteModule(Transaction& t, const std::string& module_path, const std::string& version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.modules.find({module_path, version});
  if (it == s.modules.end()) {
    return Result::Err(ErrorCode::NotFound, module_path + "@" + version);
  }
  const int64_t module_id = it->second.id;

  for (auto u = s.units.begin(); u != s.units.end();) {
    if (u->second.module_id != module_id) {
      ++u;
      continue;
    }
    const int64_t unit_id = u->first;
    s.readmes.erase(unit_id);
    std::erase_if(s.documentation, [&](const auto& e) { return std::get<0>(e.first) == unit_id; });
    std::erase_if(s.package_imports, [&](const auto& e) { return e.first == unit_id; });
    s.unit_ids.erase({module_id, u->second.path_id});
    u = s.units.erase(u);
  }
  std::erase_if(s.licenses, [&](const auto& e) { return e.first.first == module_id; });
  std::erase_if(s.version_map, [&](const auto& e) {
    return e.second.module_path == module_path && e.second.resolved_version == version;
  });
  s.modules.erase(it);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Paths, units and unit content
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPaths(Transaction& t, const std::vector<std::string>& paths,
                                     std::unordered_map<std::string, int64_t>& ids) {
  auto& s = TX(t).Mutable();
  for (const auto& p : paths) {
    auto [it, inserted] = s.paths.try_emplace(p, s.next_path_id);
    if (inserted) s.next_path_id++;
    ids[p] = it->second;
  }
  return Result::Ok();
}

Result MemoryRepository::UpsertUnits(Transaction& t, std::vector<model::UnitRecord>& units) {
  auto& s = TX(t).Mutable();
  for (auto& u : units) {
    if (u.module_id == 0 || u.path_id == 0) {
      return Result::Err(ErrorCode::ConstraintViolation, "unit requires module_id and path_id: " + u.path);
    }
    auto [it, inserted] = s.unit_ids.try_emplace({u.module_id, u.path_id}, s.next_unit_id);
    if (inserted) s.next_unit_id++;
    u.id           = it->second;
    s.units[u.id]  = u;
  }
  return Result::Ok();
}

std::vector<model::UnitRecord> MemoryRepository::ListUnits(Transaction& t, int64_t module_id) {
  std::vector<model::UnitRecord> out;
  for (const auto& [_, u] : TX(t).View().units) {
    if (u.module_id == module_id) out.push_back(u);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.path < b.path; });
  return out;
}

Result MemoryRepository::UpsertLicenses(Transaction& t, const std::vector<model::LicenseRecord>& licenses) {
  auto& s = TX(t).Mutable();
  for (const auto& l : licenses) {
    s.licenses[{l.module_id, l.file_path}] = l;
  }
  return Result::Ok();
}

std::vector<model::LicenseRecord> MemoryRepository::ListLicenses(Transaction& t, int64_t module_id) {
  const auto&                       s = TX(t).View();
  std::vector<model::LicenseRecord> out;
  for (auto it = s.licenses.lower_bound({module_id, ""}); it != s.licenses.end() && it->first.first == module_id;
       ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertReadmes(Transaction& t, const std::vector<model::ReadmeRecord>& readmes) {
  auto& s = TX(t).Mutable();
  for (const auto& r : readmes) {
    s.readmes[r.unit_id] = r;
  }
  return Result::Ok();
}

std::optional<model::ReadmeRecord> MemoryRepository::GetReadme(Transaction& t, int64_t unit_id) {
  const auto& s  = TX(t).View();
  auto        it = s.readmes.find(unit_id);
  if (it == s.readmes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertDocumentation(Transaction& t, const std::vector<model::DocumentationRecord>& docs) {
  auto& s = TX(t).Mutable();
  for (const auto& d : docs) {
    s.documentation[{d.unit_id, d.os, d.arch}] = d;
  }
  return Result::Ok();
}

std::vector<model::DocumentationRecord> MemoryRepository::ListDocumentation(Transaction& t, int64_t unit_id) {
  const auto&                             s = TX(t).View();
  std::vector<model::DocumentationRecord> out;
  for (auto it = s.documentation.lower_bound({unit_id, "", ""});
       it != s.documentation.end() && std::get<0>(it->first) == unit_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertPackageImports(Transaction& t, const std::vector<model::PackageImportRecord>& imports) {
  auto& s = TX(t).Mutable();
  for (const auto& i : imports) {
    s.package_imports.emplace(i.unit_id, i.to_path);
  }
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListPackageImports(Transaction& t, int64_t unit_id) {
  const auto&              s = TX(t).View();
  std::vector<std::string> out;
  for (auto it = s.package_imports.lower_bound({unit_id, ""}); it != s.package_imports.end() && it->first == unit_id;
       ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Latest-version pointer
// ------------------------------------------------------------------

std::optional<model::LatestModuleVersionsRecord> MemoryRepository::GetLatestModuleVersions(
    Transaction& t, const std::string& module_path) {
  const auto& s  = TX(t).View();
  auto        it = s.latest.find(module_path);
  if (it == s.latest.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertLatestModuleVersions(Transaction& t, const model::LatestModuleVersionsRecord& r) {
  auto& s    = TX(t).Mutable();
  auto  good = s.latest.contains(r.module_path) ? s.latest[r.module_path].good_version : std::string{};
  s.latest[r.module_path]              = r;
  s.latest[r.module_path].good_version = good;
  return Result::Ok();
}

Result MemoryRepository::UpdateLatestGoodVersion(Transaction& t, const std::string& module_path,
                                                 const std::string& good_version, uint64_t updated_at_ms) {
  auto& row         = TX(t).Mutable().latest[module_path];
  row.module_path   = module_path;
  row.good_version  = good_version;
  row.updated_at_ms = updated_at_ms;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Derived tables
// ------------------------------------------------------------------

Result MemoryRepository::ReplaceImportsUnique(Transaction& t, const std::string& from_module_path,
                                              const std::vector<model::ImportEdgeRecord>& edges) {
  auto& s = TX(t).Mutable();
  if (edges.empty()) {
    s.imports_unique.erase(from_module_path);
    return Result::Ok();
  }
  auto sorted = edges;
  std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
    return std::tie(a.from_path, a.to_path) < std::tie(b.from_path, b.to_path);
  });
  sorted.erase(std::unique(sorted.begin(), sorted.end(),
                           [](const auto& a, const auto& b) {
                             return a.from_path == b.from_path && a.to_path == b.to_path;
                           }),
               sorted.end());
  s.imports_unique[from_module_path] = std::move(sorted);
  return Result::Ok();
}

std::vector<model::ImportEdgeRecord> MemoryRepository::ListImportsUnique(Transaction& t,
                                                                        const std::string& from_module_path) {
  const auto& s  = TX(t).View();
  auto        it = s.imports_unique.find(from_module_path);
  if (it == s.imports_unique.end()) return {};
  return it->second;
}

Result MemoryRepository::ReplaceSearchDocuments(Transaction& t, const std::string& module_path,
                                                const std::vector<model::SearchDocumentRecord>& docs) {
  auto& s = TX(t).Mutable();
  std::erase_if(s.search_documents, [&](const auto& e) { return e.second.module_path == module_path; });
  for (const auto& d : docs) {
    s.search_documents[d.package_path] = d;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteSearchDocuments(Transaction& t, const std::string& module_path) {
  std::erase_if(TX(t).Mutable().search_documents, [&](const auto& e) { return e.second.module_path == module_path; });
  return Result::Ok();
}

std::vector<model::SearchDocumentRecord> MemoryRepository::ListSearchDocuments(Transaction& t,
                                                                              const std::string& module_path) {
  std::vector<model::SearchDocumentRecord> out;
  for (const auto& [_, d] : TX(t).View().search_documents) {
    if (d.module_path == module_path) out.push_back(d);
  }
  return out;
}

std::vector<model::SymbolHistoryRecord> MemoryRepository::ListSymbolHistory(Transaction& t,
                                                                           const std::string& module_path,
                                                                           const std::string& package_path) {
  std::vector<model::SymbolHistoryRecord> out;
  for (const auto& [key, r] : TX(t).View().symbol_history) {
    if (std::get<0>(key) == package_path && r.module_path == module_path) out.push_back(r);
  }
  return out;
}

Result MemoryRepository::UpsertSymbolHistory(Transaction& t, const std::vector<model::SymbolHistoryRecord>& records) {
  auto& s = TX(t).Mutable();
  for (const auto& r : records) {
    auto [it, inserted] = s.symbol_history.try_emplace({r.package_path, r.symbol_name, r.parent_name, r.os, r.arch}, r);
    if (!inserted && r.sort_version < it->second.sort_version) {
      it->second = r;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Work queue state
// ------------------------------------------------------------------

std::optional<model::VersionStateRecord> MemoryRepository::GetVersionState(Transaction& t,
                                                                           const std::string& module_path,
                                                                           const std::string& version) {
  const auto& s  = TX(t).View();
  auto        it = s.version_states.find({module_path, version});
  if (it == s.version_states.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertVersionState(Transaction& t, const model::VersionStateRecord& r) {
  TX(t).Mutable().version_states[{r.module_path, r.version}] = r;
  return Result::Ok();
}

std::vector<model::VersionStateRecord> MemoryRepository::ListVersionStates(Transaction& t,
                                                                          const std::string& module_path) {
  const auto&                            s = TX(t).View();
  std::vector<model::VersionStateRecord> out;
  for (auto it = s.version_states.lower_bound({module_path, ""});
       it != s.version_states.end() && it->first.first == module_path; ++it) {
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.sort_version > b.sort_version; });
  return out;
}

std::vector<model::VersionStateRecord> MemoryRepository::ListEligibleVersionStates(Transaction& t, uint64_t now_ms) {
  std::vector<model::VersionStateRecord> out;
  for (const auto& [_, r] : TX(t).View().version_states) {
    if (modstore::model::IsEligibleForProcessing(r.status) && r.next_processed_after_ms <= now_ms) {
      out.push_back(r);
    }
  }
  return out;
}

Result MemoryRepository::ResetVersionStates(Transaction& t, const std::string& app_version_cutoff,
                                            int32_t from_status, int32_t to_status, uint64_t now_ms,
                                            uint64_t& affected) {
  affected = 0;
  for (auto& [_, r] : TX(t).Mutable().version_states) {
    if (r.status == from_status && r.app_version < app_version_cutoff) {
      r.status                  = to_status;
      r.next_processed_after_ms = now_ms;
      r.last_processed_at_ms.reset();
      ++affected;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Alternative paths & version map
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAlternativeModulePath(Transaction& t, const model::AlternativeModulePathRecord& r) {
  TX(t).Mutable().alternatives[r.alternative] = r;
  return Result::Ok();
}

std::optional<model::AlternativeModulePathRecord> MemoryRepository::GetAlternativeModulePath(
    Transaction& t, const std::string& alternative) {
  const auto& s  = TX(t).View();
  auto        it = s.alternatives.find(alternative);
  if (it == s.alternatives.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertVersionMap(Transaction& t, const model::VersionMapRecord& r) {
  TX(t).Mutable().version_map[{r.module_path, r.requested_version}] = r;
  return Result::Ok();
}

std::optional<model::VersionMapRecord> MemoryRepository::GetVersionMap(Transaction& t, const std::string& module_path,
                                                                       const std::string& requested_version) {
  const auto& s  = TX(t).View();
  auto        it = s.version_map.find({module_path, requested_version});
  if (it == s.version_map.end()) return std::nullopt;
  return it->second;
}

} // namespace modstore::db::memory
