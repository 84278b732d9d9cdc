#include "internal/symbols/symbol_history.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "tests/unit/module_fixtures.hpp"

namespace {

using modstore::db::memory::MemoryRepository;
using modstore::symbols::BuildContextSymbols;
using modstore::symbols::SymbolHistoryLedger;
using modstore::symbols::UnitSymbols;
using modstore::testing::Sym;

constexpr const char* kModule  = "example.com/lib";
constexpr const char* kPackage = "example.com/lib/pkg";

std::vector<UnitSymbols> Linux(std::vector<modstore::model::Symbol> symbols) {
  return {UnitSymbols{kPackage, {BuildContextSymbols{{"linux", "amd64"}, std::move(symbols)}}}};
}

std::string SinceOf(SymbolHistoryLedger& ledger, const std::string& name) {
  for (const auto& r : ledger.History(kModule, kPackage)) {
    if (r.symbol_name == name && r.parent_name.empty()) return r.since_version;
  }
  return {};
}

void TestAffectsHistory() {
  assert(SymbolHistoryLedger::AffectsHistory("v1.0.0"));
  assert(!SymbolHistoryLedger::AffectsHistory("v1.0.0-rc.1"));
  assert(!SymbolHistoryLedger::AffectsHistory("v0.0.0-20200101000000-abcdef123456"));
  assert(!SymbolHistoryLedger::AffectsHistory("v2.0.0+incompatible"));
  assert(!SymbolHistoryLedger::AffectsHistory("master"));
}

void TestSinceOnlyMovesEarlier() {
  auto                repo = std::make_shared<MemoryRepository>();
  SymbolHistoryLedger ledger(repo);

  assert(ledger.Merge(kModule, "v1.2.0", Linux({Sym("New")})) == 1);
  assert(SinceOf(ledger, "New") == "v1.2.0");

  assert(ledger.Merge(kModule, "v1.3.0", Linux({Sym("New")})) == 0);
  assert(SinceOf(ledger, "New") == "v1.2.0");

  assert(ledger.Merge(kModule, "v1.1.0", Linux({Sym("New")})) == 1);
  assert(SinceOf(ledger, "New") == "v1.1.0");

  // re-merging the same version changes nothing
  assert(ledger.Merge(kModule, "v1.1.0", Linux({Sym("New")})) == 0);

  auto history = ledger.History(kModule, kPackage);
  assert(history.size() == 1);
  assert(history[0].sort_version == "1,1,0~");
  assert(history[0].module_path == kModule);
}

void TestNonReleasesAreIgnored() {
  auto                repo = std::make_shared<MemoryRepository>();
  SymbolHistoryLedger ledger(repo);

  assert(ledger.Merge(kModule, "v1.0.0-rc.1", Linux({Sym("New")})) == 0);
  assert(ledger.Merge(kModule, "v0.0.0-20200101000000-abcdef123456", Linux({Sym("New")})) == 0);
  assert(ledger.Merge(kModule, "v3.0.0+incompatible", Linux({Sym("New")})) == 0);
  assert(ledger.History(kModule, kPackage).empty());
}

void TestMergeOrderConverges() {
  const std::vector<std::string> forward{"v1.0.0", "v1.1.0", "v2.0.0"};
  const std::vector<std::string> backward{"v2.0.0", "v1.1.0", "v1.0.0"};

  auto run = [](const std::vector<std::string>& versions) {
    auto                repo = std::make_shared<MemoryRepository>();
    SymbolHistoryLedger ledger(repo);
    for (const auto& v : versions) {
      std::vector<modstore::model::Symbol> symbols{Sym("New")};
      if (v != "v1.0.0") symbols.push_back(Sym("Close", "Client", "Method"));
      if (v == "v2.0.0") symbols.push_back(Sym("Dial"));
      ledger.Merge(kModule, v, Linux(symbols));
    }
    return ledger.History(kModule, kPackage);
  };

  auto a = run(forward);
  auto b = run(backward);
  assert(a.size() == 3);
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    assert(a[i].symbol_name == b[i].symbol_name);
    assert(a[i].parent_name == b[i].parent_name);
    assert(a[i].since_version == b[i].since_version);
  }

  // ordered by (symbol_name, parent_name)
  assert(a[0].symbol_name == "Close" && a[0].parent_name == "Client" && a[0].since_version == "v1.1.0");
  assert(a[1].symbol_name == "Dial" && a[1].since_version == "v2.0.0");
  assert(a[2].symbol_name == "New" && a[2].since_version == "v1.0.0");
}

void TestBuildContextsAreTrackedSeparately() {
  auto                repo = std::make_shared<MemoryRepository>();
  SymbolHistoryLedger ledger(repo);

  std::vector<UnitSymbols> units{UnitSymbols{
      kPackage,
      {BuildContextSymbols{{"linux", "amd64"}, {Sym("Poll")}}, BuildContextSymbols{{"windows", "amd64"}, {}}}}};
  assert(ledger.Merge(kModule, "v1.0.0", units) == 1);

  units[0].contexts[1].symbols.push_back(Sym("Poll"));
  assert(ledger.Merge(kModule, "v1.1.0", units) == 1);

  auto history = ledger.History(kModule, kPackage);
  assert(history.size() == 2);
  assert(history[0].os == "linux" && history[0].since_version == "v1.0.0");
  assert(history[1].os == "windows" && history[1].since_version == "v1.1.0");
}

void TestCollectUnitSymbols() {
  auto graph = modstore::testing::Graph(kModule, "v1.0.0",
                                        {modstore::testing::Package(kModule, "lib", {Sym("New")}),
                                         modstore::testing::Directory(std::string(kModule) + "/internal"),
                                         modstore::testing::Package(kPackage, "pkg", {Sym("Run"), Sym("Stop")})});
  graph.units.push_back(modstore::testing::Package(std::string(kModule) + "/nodoc", "nodoc"));
  graph.units.back().documentation.clear();

  auto collected = modstore::symbols::CollectUnitSymbols(graph);
  assert(collected.size() == 2);
  assert(collected[0].package_path == kModule);
  assert(collected[1].package_path == kPackage);
  assert(collected[1].contexts.size() == 1);
  assert(collected[1].contexts[0].symbols.size() == 2);
}

} // namespace

int main() {
  TestAffectsHistory();
  TestSinceOnlyMovesEarlier();
  TestNonReleasesAreIgnored();
  TestMergeOrderConverges();
  TestBuildContextsAreTrackedSeparately();
  TestCollectUnitSymbols();

  std::cout << "modstore_unit_symbol_history: pass\n";
  return 0;
}
