#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace modstore::version::semver {

/*
  Semantic versions with a leading "v".

  Accepts the shorthands vMAJOR and vMAJOR.MINOR, which compare as
  vMAJOR.0.0 and vMAJOR.MINOR.0. Prerelease and build suffixes require the
  full three-component form.
*/

struct Parsed {
  std::string major;
  std::string minor;
  std::string patch;
  std::string short_suffix; // ".0.0" or ".0" when a shorthand was used
  std::string prerelease;   // includes the leading '-'
  std::string build;        // includes the leading '+'
};

std::optional<Parsed> Parse(std::string_view v);

bool IsValid(std::string_view v);

// vMAJOR.MINOR.PATCH[-PRERELEASE], build metadata dropped. Empty when invalid.
std::string Canonical(std::string_view v);

// "v1" for "v1.2.3". Empty when invalid.
std::string Major(std::string_view v);

std::string Prerelease(std::string_view v);
std::string Build(std::string_view v);

// Invalid versions compare equal to each other and lower than valid ones.
int Compare(std::string_view v, std::string_view w);

} // namespace modstore::version::semver
