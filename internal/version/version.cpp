#include "internal/version/version.hpp"

#include <regex>

#include "internal/util/errors.hpp"
#include "internal/version/semver.hpp"

namespace modstore::version {
namespace {

const std::regex& PseudoVersionPattern() {
  static const std::regex kPattern(
      R"(^v[0-9]+\.(0\.0-|\d+\.\d+-([^+]*\.)?0\.)\d{14}-[A-Za-z0-9]+(\+[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?$)");
  return kPattern;
}

int TypeRank(Type type) {
  switch (type) {
    case Type::kRelease:
      return 0;
    case Type::kPrerelease:
      return 1;
    case Type::kPseudo:
      return 2;
  }
  return 3;
}

} // namespace

const char* TypeName(Type type) {
  switch (type) {
    case Type::kRelease:
      return "release";
    case Type::kPrerelease:
      return "prerelease";
    case Type::kPseudo:
      return "pseudo";
  }
  return "unknown";
}

Type TypeFromName(std::string_view name) {
  if (name == "release") return Type::kRelease;
  if (name == "prerelease") return Type::kPrerelease;
  if (name == "pseudo") return Type::kPseudo;
  throw util::InvalidModule("unknown version type: " + std::string(name));
}

bool IsPseudo(std::string_view v) {
  std::size_t dashes = 0;
  for (char c : v) {
    if (c == '-') ++dashes;
  }
  if (dashes < 2 || !semver::IsValid(v)) {
    return false;
  }
  return std::regex_match(v.begin(), v.end(), PseudoVersionPattern());
}

bool IsIncompatible(std::string_view v) {
  return semver::Build(v) == "+incompatible";
}

Type ParseType(std::string_view v) {
  if (!semver::IsValid(v)) {
    throw util::InvalidModule("invalid semantic version: " + std::string(v));
  }
  if (IsPseudo(v)) {
    return Type::kPseudo;
  }
  if (!semver::Prerelease(v).empty()) {
    return Type::kPrerelease;
  }
  return Type::kRelease;
}

void AppendNumericPrefix(std::string& out, std::size_t digits) {
  std::size_t m = digits == 0 ? 0 : digits - 1;
  while (m > 26) {
    out.push_back('z');
    m -= 26;
  }
  if (m > 0) {
    out.push_back(static_cast<char>('a' + m - 1));
  }
}

std::string ForSorting(std::string_view v) {
  std::string out;
  if (v.empty()) {
    return out;
  }
  out.reserve(v.size() + 4);

  bool        prerelease = false;
  bool        nondigit   = false;
  std::size_t i          = 1;
  std::size_t start      = i;

  auto finish = [&] {
    auto part = v.substr(start, i - start);
    if (nondigit) {
      out.push_back('~');
    } else {
      AppendNumericPrefix(out, part.size());
    }
    out.append(part);
    nondigit = false;
  };

  for (; i < v.size(); ++i) {
    const char c = v[i];
    if (c == '+') {
      break;
    }
    if (c == '.' || (c == '-' && !prerelease)) {
      finish();
      start = i + 1;
      out.push_back(',');
      if (c == '-') {
        prerelease = true;
      }
    } else if (c < '0' || c > '9') {
      nondigit = true;
    }
  }
  finish();
  if (!prerelease) {
    out.push_back('~');
  }
  return out;
}

bool Later(std::string_view v1, std::string_view v2) {
  return semver::Compare(v1, v2) > 0;
}

std::string LatestOf(const std::vector<std::string>& versions) {
  const std::string* best = nullptr;
  int                best_rank = 0;
  for (const auto& v : versions) {
    if (!semver::IsValid(v)) {
      continue;
    }
    const int rank = TypeRank(ParseType(v));
    if (best == nullptr || rank < best_rank || (rank == best_rank && Later(v, *best))) {
      best      = &v;
      best_rank = rank;
    }
  }
  return best ? *best : std::string{};
}

} // namespace modstore::version
