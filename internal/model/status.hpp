#pragma once

#include <cstdint>

namespace modstore::model {

/*
  Processing status of a (module path, version).

  Codes follow HTTP conventions so they read naturally in operator tooling.
  Anything at or above 500 is retried; 0 means never attempted.
*/

enum class VersionStatus : int32_t {
  kNew                             = 0,
  kSuccess                         = 200,
  kHasIncompletePackages           = 290,
  kNotFound                        = 404,
  kValidationFailure               = 480,
  kBadModule                       = 490,
  kAlternativePath                 = 491,
  kCleaned                         = 493,
  kSoftFailure                     = 500,
  kSheddingLoad                    = 503,
  kReprocessSuccess                = 520,
  kReprocessHasIncompletePackages  = 521,
  kReprocessBadModule              = 540,
  kReprocessAlternative            = 541,
  kReprocessValidationFailure      = 542,
};

inline int32_t ToCode(VersionStatus s) {
  return static_cast<int32_t>(s);
}

inline VersionStatus FromCode(int32_t code) {
  return static_cast<VersionStatus>(code);
}

inline bool IsEligibleForProcessing(int32_t code) {
  return code == 0 || code >= 500;
}

// Reprocessing status for a status eligible for bulk reset, or kNew otherwise.
inline VersionStatus ToReprocessStatus(VersionStatus s) {
  switch (s) {
    case VersionStatus::kSuccess:
      return VersionStatus::kReprocessSuccess;
    case VersionStatus::kHasIncompletePackages:
      return VersionStatus::kReprocessHasIncompletePackages;
    case VersionStatus::kBadModule:
      return VersionStatus::kReprocessBadModule;
    case VersionStatus::kAlternativePath:
      return VersionStatus::kReprocessAlternative;
    case VersionStatus::kValidationFailure:
      return VersionStatus::kReprocessValidationFailure;
    default:
      return VersionStatus::kNew;
  }
}

inline const char* StatusName(VersionStatus s) {
  switch (s) {
    case VersionStatus::kNew: return "new";
    case VersionStatus::kSuccess: return "success";
    case VersionStatus::kHasIncompletePackages: return "has_incomplete_packages";
    case VersionStatus::kNotFound: return "not_found";
    case VersionStatus::kValidationFailure: return "validation_failure";
    case VersionStatus::kBadModule: return "bad_module";
    case VersionStatus::kAlternativePath: return "alternative_path";
    case VersionStatus::kCleaned: return "cleaned";
    case VersionStatus::kSoftFailure: return "soft_failure";
    case VersionStatus::kSheddingLoad: return "shedding_load";
    case VersionStatus::kReprocessSuccess: return "reprocess_success";
    case VersionStatus::kReprocessHasIncompletePackages: return "reprocess_has_incomplete_packages";
    case VersionStatus::kReprocessBadModule: return "reprocess_bad_module";
    case VersionStatus::kReprocessAlternative: return "reprocess_alternative";
    case VersionStatus::kReprocessValidationFailure: return "reprocess_validation_failure";
  }
  return "unknown";
}

} // namespace modstore::model
