#include "internal/version/semver.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace semver = modstore::version::semver;

void TestValidity() {
  assert(semver::IsValid("v1.2.3"));
  assert(semver::IsValid("v1.2"));
  assert(semver::IsValid("v1"));
  assert(semver::IsValid("v1.0.0-alpha.1"));
  assert(semver::IsValid("v2.0.0+incompatible"));
  assert(semver::IsValid("v0.0.0-20200101000000-abcdef123456"));

  assert(!semver::IsValid(""));
  assert(!semver::IsValid("1.2.3"));
  assert(!semver::IsValid("v01.2.3"));
  assert(!semver::IsValid("v1.2.3-01"));
  assert(!semver::IsValid("v1.2.3-"));
  assert(!semver::IsValid("v1.2.3+"));
  assert(!semver::IsValid("v1.2.3.4"));
}

void TestShorthandsCompareAsFullForm() {
  assert(semver::Compare("v1", "v1.0.0") == 0);
  assert(semver::Compare("v1.2", "v1.2.0") == 0);
  assert(semver::Canonical("v1.2") == "v1.2.0");
  assert(semver::Canonical("v1.2.3+build.5") == "v1.2.3");
}

void TestOrdering() {
  const std::vector<std::string> ascending = {
      "v0.0.0-20200101000000-abcdef123456",
      "v0.1.0",
      "v1.0.0-alpha",
      "v1.0.0-alpha.1",
      "v1.0.0-alpha.beta",
      "v1.0.0-beta.2",
      "v1.0.0-beta.11",
      "v1.0.0-rc.1",
      "v1.0.0",
      "v1.9.0",
      "v1.10.0",
  };
  for (std::size_t i = 0; i + 1 < ascending.size(); ++i) {
    assert(semver::Compare(ascending[i], ascending[i + 1]) < 0);
    assert(semver::Compare(ascending[i + 1], ascending[i]) > 0);
  }
}

void TestBuildMetadataIsIgnored() {
  assert(semver::Compare("v2.0.0+incompatible", "v2.0.0") == 0);
  assert(semver::Build("v2.0.0+incompatible") == "+incompatible");
  assert(semver::Prerelease("v1.0.0-rc.1+meta") == "-rc.1");
}

void TestInvalidSortsLowest() {
  assert(semver::Compare("bogus", "v0.0.1") < 0);
  assert(semver::Compare("bogus", "also-bogus") == 0);
}

void TestMajor() {
  assert(semver::Major("v1.2.3") == "v1");
  assert(semver::Major("v0.0.0-20200101000000-abcdef123456") == "v0");
  assert(semver::Major("x").empty());
}

} // namespace

int main() {
  TestValidity();
  TestShorthandsCompareAsFullForm();
  TestOrdering();
  TestBuildMetadataIsIgnored();
  TestInvalidSortsLowest();
  TestMajor();

  std::cout << "modstore_unit_semver: pass\n";
  return 0;
}
