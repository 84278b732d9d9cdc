#include "internal/version/stdlib.hpp"

#include <regex>

#include "internal/version/semver.hpp"

namespace modstore::version {
namespace {

// 1 major.minor, 2 ".patch" or empty, 3 prerelease type, 4 prerelease number
const std::regex& TagPattern() {
  static const std::regex kPattern(R"(^go(\d+\.\d+)(\.\d+)?(?:(beta|rc)(\d+))?$)");
  return kPattern;
}

} // namespace

std::string StdlibVersionForTag(std::string_view tag) {
  if (tag == "go1") {
    return "v1.0.0";
  }
  if (tag == "go1.0") {
    return {};
  }

  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_match(tag.begin(), tag.end(), m, TagPattern())) {
    return {};
  }

  std::string v = "v" + m[1].str();
  v += m[2].matched ? m[2].str() : std::string(".0");
  if (m[3].matched) {
    v += "-" + m[3].str() + "." + m[4].str();
  }
  return v;
}

std::string StdlibSemanticVersion(std::string_view v) {
  if (semver::IsValid(v)) {
    return std::string(v);
  }
  return StdlibVersionForTag(v);
}

} // namespace modstore::version
