#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/version/version.hpp"

namespace modstore::version {

struct VersionMeta {
  std::string module_path;
  std::string version;
  Type        type         = Type::kRelease;
  bool        incompatible = false;
};

VersionMeta MakeVersionMeta(std::string module_path, std::string version);

// Inclusive [low, high] range of versions a module author has withdrawn.
struct RetractionRange {
  std::string low;
  std::string high; // empty means a single version
  std::string rationale;
};

class RetractionSet {
 public:
  RetractionSet() = default;
  explicit RetractionSet(std::vector<RetractionRange> ranges) : ranges_(std::move(ranges)) {
  }

  bool IsRetracted(const std::string& v) const;
  bool Empty() const {
    return ranges_.empty();
  }
  const std::vector<RetractionRange>& Ranges() const {
    return ranges_;
  }

  std::function<bool(const std::string&)> Predicate() const;

 private:
  std::vector<RetractionRange> ranges_;
};

using RetractedFn = std::function<bool(const std::string&)>;

/*
  ResolveLatest picks the authoritative version of a module.

    1. retracted candidates are dropped; nothing left means no good version
    2. unless cooked_latest is +incompatible, incompatible candidates are
       dropped while a compatible one remains
    3. release beats prerelease beats pseudo, then higher semver wins, then
       the longer (more specific) module path, then the lexically smaller one
*/
std::optional<std::string> ResolveLatest(const std::vector<VersionMeta>& candidates, const RetractedFn& retracted,
                                         const std::string& cooked_latest);

// Same ordering with no retraction filter. Used only for display fallbacks.
std::optional<std::string> LatestIgnoringRetractions(const std::vector<VersionMeta>& candidates,
                                                     const std::string& cooked_latest);

// Strict weak order: true when a ranks ahead of b.
bool RanksBefore(const VersionMeta& a, const VersionMeta& b);

} // namespace modstore::version
