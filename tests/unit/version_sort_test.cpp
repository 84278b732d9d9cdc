#include "internal/version/version.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/version/module_path.hpp"
#include "internal/version/semver.hpp"
#include "internal/version/stdlib.hpp"

namespace {

using namespace modstore::version;

void TestForSortingEncoding() {
  assert(ForSorting("v1.2.3") == "1,2,3~");
  assert(ForSorting("v0.9.3-alpha.1") == "0,9,3,~alpha,1");
  assert(ForSorting("v1.10.0") == "1,a10,0~");
  assert(ForSorting("v2.0.0+incompatible") == "2,0,0~");
  assert(ForSorting("").empty());
}

void TestForSortingMatchesSemverOrder() {
  std::vector<std::string> versions = {
      "v1.10.0", "v1.0.0", "v1.0.0-rc.1", "v0.0.0-20200101000000-abcdef123456", "v1.9.0",
      "v1.0.0-beta.11", "v1.0.0-beta.2", "v123.0.0", "v12.0.0",
  };

  auto by_semver = versions;
  std::sort(by_semver.begin(), by_semver.end(),
            [](const auto& a, const auto& b) { return semver::Compare(a, b) < 0; });

  auto by_key = versions;
  std::sort(by_key.begin(), by_key.end(), [](const auto& a, const auto& b) { return ForSorting(a) < ForSorting(b); });

  assert(by_semver == by_key);
}

void TestNumericPrefix() {
  std::string out;
  AppendNumericPrefix(out, 1);
  assert(out.empty());
  AppendNumericPrefix(out, 2);
  assert(out == "a");
  out.clear();
  AppendNumericPrefix(out, 27);
  assert(out == "z");
  out.clear();
  AppendNumericPrefix(out, 28);
  assert(out == "za");
}

void TestVersionTypes() {
  assert(ParseType("v1.0.0") == Type::kRelease);
  assert(ParseType("v1.0.0-rc.1") == Type::kPrerelease);
  assert(ParseType("v0.0.0-20200101000000-abcdef123456") == Type::kPseudo);
  assert(ParseType("v1.2.4-0.20200101000000-abcdef123456") == Type::kPseudo);
  assert(ParseType("v1.2.3-pre.0.20200101000000-abcdef123456") == Type::kPseudo);
  assert(std::string(TypeName(Type::kPseudo)) == "pseudo");
  assert(TypeFromName("prerelease") == Type::kPrerelease);

  bool threw = false;
  try {
    ParseType("latest");
  } catch (const modstore::util::InvalidModule&) {
    threw = true;
  }
  assert(threw);
}

void TestIncompatible() {
  assert(IsIncompatible("v2.0.0+incompatible"));
  assert(!IsIncompatible("v2.0.0"));
  assert(!IsIncompatible("v2.0.0+build"));
}

void TestLatestOf() {
  assert(LatestOf({}).empty());
  assert(LatestOf({"v1.0.0", "v1.1.0-rc.1", "v0.9.0"}) == "v1.0.0");
  assert(LatestOf({"v1.1.0-rc.1", "v0.0.0-20200101000000-abcdef123456"}) == "v1.1.0-rc.1");
  assert(LatestOf({"v0.0.0-20200101000000-abcdef123456", "v0.0.0-20210101000000-abcdef123456"}) ==
         "v0.0.0-20210101000000-abcdef123456");
}

void TestModulePaths() {
  assert(!CheckModulePath("example.com/mod").has_value());
  assert(!CheckModulePath("example.com/mod/v2").has_value());
  assert(!CheckModulePath("std").has_value());
  assert(CheckModulePath("").has_value());
  assert(CheckModulePath("nodot/mod").has_value());
  assert(CheckModulePath("example.com//mod").has_value());
  assert(CheckModulePath("example.com/mod/").has_value());
  assert(CheckModulePath("example.com/mod/v1").has_value());
  assert(CheckModulePath("example.com/mod with space").has_value());

  assert(IsWithinModule("example.com/mod/sub", "example.com/mod"));
  assert(IsWithinModule("example.com/mod", "example.com/mod"));
  assert(!IsWithinModule("example.com/modx", "example.com/mod"));
  assert(IsWithinModule("net/http", "std"));

  assert(SeriesPath("example.com/mod/v2") == "example.com/mod");
  assert(SeriesPath("example.com/mod") == "example.com/mod");
  assert(V1Path("example.com/mod/v2/sub", "example.com/mod/v2") == "example.com/mod/sub");
}

void TestStdlibTags() {
  assert(StdlibVersionForTag("go1") == "v1.0.0");
  assert(StdlibVersionForTag("go1.0").empty());
  assert(StdlibVersionForTag("go1.12") == "v1.12.0");
  assert(StdlibVersionForTag("go1.9.7") == "v1.9.7");
  assert(StdlibVersionForTag("go1.21.0") == "v1.21.0");
  assert(StdlibVersionForTag("go1.13beta1") == "v1.13.0-beta.1");
  assert(StdlibVersionForTag("go1.21rc2") == "v1.21.0-rc.2");
  assert(StdlibVersionForTag("go2.0") == "v2.0.0");
  assert(StdlibVersionForTag("go1.9beta").empty());
  assert(StdlibVersionForTag("master").empty());
  assert(StdlibVersionForTag("").empty());

  assert(StdlibSemanticVersion("v1.21.0") == "v1.21.0");
  assert(StdlibSemanticVersion("go1.21.0") == "v1.21.0");
  assert(ParseType(StdlibSemanticVersion("go1.21rc2")) == Type::kPrerelease);
}

} // namespace

int main() {
  TestForSortingEncoding();
  TestForSortingMatchesSemverOrder();
  TestNumericPrefix();
  TestVersionTypes();
  TestIncompatible();
  TestLatestOf();
  TestModulePaths();
  TestStdlibTags();

  std::cout << "modstore_unit_version_sort: pass\n";
  return 0;
}
