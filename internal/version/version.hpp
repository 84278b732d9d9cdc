#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace modstore::version {

enum class Type {
  kRelease,
  kPrerelease,
  kPseudo,
};

const char* TypeName(Type type);

// Throws util::InvalidModule for an unknown name.
Type TypeFromName(std::string_view name);

// Throws util::InvalidModule when v is not a valid semantic version.
Type ParseType(std::string_view v);

bool IsPseudo(std::string_view v);
bool IsIncompatible(std::string_view v);

/*
  ForSorting returns a string that sorts lexically in the same order as the
  semantic versions it was built from.

    - the leading "v" and any build metadata are dropped
    - '.' and the first '-' become ','
    - a numeric part is prefixed by a letter encoding its length
      (nothing for 1 digit, "a" for 2, ... "y" for 26, one "z" per extra 26)
    - a non-numeric part is prefixed by '~'
    - releases end in '~' so they sort after their prereleases

  "v1.2.3" -> "1,2,3~", "v0.9.3-alpha.1" -> "0,9,3,~alpha,1".
*/
std::string ForSorting(std::string_view v);

void AppendNumericPrefix(std::string& out, std::size_t digits);

// True when v1 sorts strictly after v2 by semver.
bool Later(std::string_view v1, std::string_view v2);

// Highest release, else highest prerelease, else highest pseudo-version.
// Empty when versions is empty.
std::string LatestOf(const std::vector<std::string>& versions);

} // namespace modstore::version
