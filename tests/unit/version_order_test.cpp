#include "internal/version/version_order.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace modstore::version;

std::vector<VersionMeta> Metas(const std::string& module_path, const std::vector<std::string>& versions) {
  std::vector<VersionMeta> out;
  for (const auto& v : versions) out.push_back(MakeVersionMeta(module_path, v));
  return out;
}

void TestReleaseBeatsIncompatibleAndPrerelease() {
  auto candidates = Metas("example.com/mod", {"v1.0.0-alpha", "v1.0.0", "v2.0.0+incompatible"});

  auto good = ResolveLatest(candidates, nullptr, "v1.0.0");
  assert(good.has_value());
  assert(*good == "v1.0.0");
}

void TestIncompatibleCookedLatestKeepsIncompatible() {
  auto candidates = Metas("example.com/mod", {"v1.0.0", "v2.0.0+incompatible"});

  auto good = ResolveLatest(candidates, nullptr, "v2.0.0+incompatible");
  assert(good.has_value());
  assert(*good == "v2.0.0+incompatible");
}

void TestOnlyIncompatibleStillResolves() {
  auto candidates = Metas("example.com/mod", {"v2.0.0+incompatible", "v3.0.0+incompatible"});

  auto good = ResolveLatest(candidates, nullptr, "");
  assert(good.has_value());
  assert(*good == "v3.0.0+incompatible");
}

void TestClassOrderBeforeSemver() {
  auto candidates = Metas("example.com/mod", {"v1.0.0", "v2.0.0-rc.1", "v3.0.0-0.20200101000000-abcdef123456"});

  auto good = ResolveLatest(candidates, nullptr, "");
  assert(good.has_value());
  assert(*good == "v1.0.0");

  auto no_release = Metas("example.com/mod", {"v2.0.0-rc.1", "v3.0.0-0.20200101000000-abcdef123456"});
  assert(*ResolveLatest(no_release, nullptr, "") == "v2.0.0-rc.1");
}

void TestRetractionsAreSkipped() {
  auto candidates = Metas("example.com/mod", {"v1.0.0", "v1.1.0", "v1.2.0"});

  RetractionSet retractions({{"v1.1.0", "v1.2.0", "broken build"}});
  assert(retractions.IsRetracted("v1.1.0"));
  assert(retractions.IsRetracted("v1.1.5"));
  assert(retractions.IsRetracted("v1.2.0"));
  assert(!retractions.IsRetracted("v1.0.0"));

  auto good = ResolveLatest(candidates, retractions.Predicate(), "v1.0.0");
  assert(good.has_value());
  assert(*good == "v1.0.0");
}

void TestSingleVersionRetraction() {
  RetractionSet retractions({{"v1.1.0", "", "typo"}});
  assert(retractions.IsRetracted("v1.1.0"));
  assert(!retractions.IsRetracted("v1.1.1"));
}

void TestEverythingRetractedMeansNoGoodVersion() {
  auto          candidates = Metas("example.com/mod", {"v1.0.0", "v1.1.0"});
  RetractionSet retractions({{"v1.0.0", "v1.9.9", "abandoned"}});

  assert(!ResolveLatest(candidates, retractions.Predicate(), "").has_value());
  assert(*LatestIgnoringRetractions(candidates, "") == "v1.1.0");
  assert(!ResolveLatest({}, nullptr, "").has_value());
}

void TestLongerModulePathWinsTie() {
  std::vector<VersionMeta> candidates = {
      MakeVersionMeta("example.com/mod", "v1.0.0"),
      MakeVersionMeta("example.com/mod/sub", "v1.0.0"),
  };
  assert(RanksBefore(candidates[1], candidates[0]));
  assert(!RanksBefore(candidates[0], candidates[1]));

  std::vector<VersionMeta> same_length = {
      MakeVersionMeta("example.com/bbb", "v1.0.0"),
      MakeVersionMeta("example.com/aaa", "v1.0.0"),
  };
  assert(RanksBefore(same_length[1], same_length[0]));
}

} // namespace

int main() {
  TestReleaseBeatsIncompatibleAndPrerelease();
  TestIncompatibleCookedLatestKeepsIncompatible();
  TestOnlyIncompatibleStillResolves();
  TestClassOrderBeforeSemver();
  TestRetractionsAreSkipped();
  TestSingleVersionRetraction();
  TestEverythingRetractedMeansNoGoodVersion();
  TestLongerModulePathWinsTie();

  std::cout << "modstore_unit_version_order: pass\n";
  return 0;
}
