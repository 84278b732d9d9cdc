#pragma once

#include <string>
#include <string_view>

namespace modstore::version {

/*
  Standard library release tags are not semver:

    "go1"            -> "v1.0.0"
    "go1.12"         -> "v1.12.0"
    "go1.21.3"       -> "v1.21.3"
    "go1.13beta1"    -> "v1.13.0-beta.1"
    "go1.21rc2"      -> "v1.21.0-rc.2"

  Returns the semantic version for tag, or an empty string when tag is not a
  release tag. "go1.0" was never tagged and maps to empty.
*/
std::string StdlibVersionForTag(std::string_view tag);

// The semver form of a standard library version: v itself when it is already
// valid semver, otherwise StdlibVersionForTag(v).
std::string StdlibSemanticVersion(std::string_view v);

} // namespace modstore::version
