#include "internal/symbols/symbol_history.hpp"

#include <map>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/version/semver.hpp"
#include "internal/version/version.hpp"

namespace modstore::symbols {
namespace {

using SymbolKey = std::tuple<std::string, std::string, std::string, std::string>; // name, parent, os, arch

SymbolKey KeyOf(const db::model::SymbolHistoryRecord& r) {
  return {r.symbol_name, r.parent_name, r.os, r.arch};
}

} // namespace

std::vector<UnitSymbols> CollectUnitSymbols(const model::ModuleGraph& graph) {
  std::vector<UnitSymbols> out;
  for (const auto& unit : graph.units) {
    if (!unit.IsPackage() || unit.documentation.empty()) {
      continue;
    }
    UnitSymbols us;
    us.package_path = unit.path;
    for (const auto& doc : unit.documentation) {
      us.contexts.push_back({doc.build_context, doc.symbols});
    }
    out.push_back(std::move(us));
  }
  return out;
}

SymbolHistoryLedger::SymbolHistoryLedger(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

bool SymbolHistoryLedger::AffectsHistory(const std::string& version) {
  if (!version::semver::IsValid(version) || version::IsIncompatible(version)) {
    return false;
  }
  return version::ParseType(version) == version::Type::kRelease;
}

std::size_t SymbolHistoryLedger::Merge(const std::string& module_path, const std::string& version,
                                       const std::vector<UnitSymbols>& units) {
  auto tx      = repository_->Begin();
  auto written = Merge(*tx, module_path, version, units);
  tx->Commit();
  return written;
}

std::size_t SymbolHistoryLedger::Merge(db::Transaction& tx, const std::string& module_path,
                                       const std::string& version, const std::vector<UnitSymbols>& units) {
  if (!AffectsHistory(version)) {
    return 0;
  }

  const auto                                  sort_version = version::ForSorting(version);
  std::vector<db::model::SymbolHistoryRecord> writes;

  for (const auto& unit : units) {
    std::map<SymbolKey, db::model::SymbolHistoryRecord> known;
    for (auto& r : repository_->ListSymbolHistory(tx, module_path, unit.package_path)) {
      known.emplace(KeyOf(r), std::move(r));
    }

    for (const auto& ctx : unit.contexts) {
      for (const auto& sym : ctx.symbols) {
        SymbolKey key{sym.name, sym.parent_name, ctx.build_context.os, ctx.build_context.arch};
        auto      it = known.find(key);
        if (it != known.end() && version::semver::Compare(version, it->second.since_version) >= 0) {
          continue;
        }

        db::model::SymbolHistoryRecord r;
        r.package_path  = unit.package_path;
        r.symbol_name   = sym.name;
        r.parent_name   = sym.parent_name;
        r.os            = ctx.build_context.os;
        r.arch          = ctx.build_context.arch;
        r.module_path   = module_path;
        r.since_version = version;
        r.sort_version  = sort_version;
        r.kind          = sym.kind;
        r.synopsis      = sym.synopsis;
        known[key]      = r;
        writes.push_back(std::move(r));
      }
    }
  }

  if (writes.empty()) {
    return 0;
  }
  db::ThrowIfError(repository_->UpsertSymbolHistory(tx, writes), "upsert symbol history " + module_path);
  MODSTORE_LOG_DEBUG("symbol history merged", {observability::ModuleField(module_path, version),
                                                observability::IntField("records", static_cast<int64_t>(writes.size()))});
  return writes.size();
}

std::vector<db::model::SymbolHistoryRecord> SymbolHistoryLedger::History(const std::string& module_path,
                                                                         const std::string& package_path) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListSymbolHistory(*tx, module_path, package_path);
  tx->Commit();
  return out;
}

} // namespace modstore::symbols
