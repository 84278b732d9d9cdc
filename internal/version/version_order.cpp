#include "internal/version/version_order.hpp"

#include <algorithm>

#include "internal/version/semver.hpp"

namespace modstore::version {
namespace {

int ClassRank(Type type) {
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

std::optional<std::string> Head(std::vector<VersionMeta> pool, const std::string& cooked_latest) {
  if (pool.empty()) {
    return std::nullopt;
  }

  if (!IsIncompatible(cooked_latest)) {
    const bool any_compatible = std::any_of(pool.begin(), pool.end(), [](const VersionMeta& m) { return !m.incompatible; });
    if (any_compatible) {
      pool.erase(std::remove_if(pool.begin(), pool.end(), [](const VersionMeta& m) { return m.incompatible; }), pool.end());
    }
  }

  auto best = std::min_element(pool.begin(), pool.end(), RanksBefore);
  return best->version;
}

} // namespace

VersionMeta MakeVersionMeta(std::string module_path, std::string version) {
  VersionMeta meta;
  meta.type         = ParseType(version);
  meta.incompatible = IsIncompatible(version);
  meta.module_path  = std::move(module_path);
  meta.version      = std::move(version);
  return meta;
}

bool RetractionSet::IsRetracted(const std::string& v) const {
  for (const auto& r : ranges_) {
    const auto& high = r.high.empty() ? r.low : r.high;
    if (semver::Compare(r.low, v) <= 0 && semver::Compare(v, high) <= 0) {
      return true;
    }
  }
  return false;
}

std::function<bool(const std::string&)> RetractionSet::Predicate() const {
  return [ranges = ranges_](const std::string& v) { return RetractionSet(ranges).IsRetracted(v); };
}

bool RanksBefore(const VersionMeta& a, const VersionMeta& b) {
  const int ra = ClassRank(a.type);
  const int rb = ClassRank(b.type);
  if (ra != rb) {
    return ra < rb;
  }
  if (int c = semver::Compare(a.version, b.version); c != 0) {
    return c > 0;
  }
  if (a.module_path.size() != b.module_path.size()) {
    return a.module_path.size() > b.module_path.size();
  }
  return a.module_path < b.module_path;
}

std::optional<std::string> ResolveLatest(const std::vector<VersionMeta>& candidates, const RetractedFn& retracted,
                                         const std::string& cooked_latest) {
  std::vector<VersionMeta> pool;
  pool.reserve(candidates.size());
  for (const auto& c : candidates) {
    if (retracted && retracted(c.version)) {
      continue;
    }
    pool.push_back(c);
  }
  return Head(std::move(pool), cooked_latest);
}

std::optional<std::string> LatestIgnoringRetractions(const std::vector<VersionMeta>& candidates,
                                                     const std::string& cooked_latest) {
  return Head(candidates, cooked_latest);
}

} // namespace modstore::version
