#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

namespace modstore::queue {

struct BackoffPolicy {
  uint64_t min_ms = 60'000;
  uint64_t max_ms = 3'600'000;
};

// Next time a (module, version) may be retried, given the previous schedule.
// A first attempt waits min_ms; each later one doubles the previous interval
// up to max_ms.
inline uint64_t NextProcessedAfter(const BackoffPolicy& policy, std::optional<uint64_t> last_processed_at_ms,
                                   uint64_t next_processed_after_ms, uint64_t now_ms) {
  if (!last_processed_at_ms) {
    return now_ms + policy.min_ms;
  }
  const uint64_t previous =
      next_processed_after_ms > *last_processed_at_ms ? next_processed_after_ms - *last_processed_at_ms : 0;
  const uint64_t delay = std::clamp(previous * 2, policy.min_ms, policy.max_ms);
  return now_ms + delay;
}

} // namespace modstore::queue
