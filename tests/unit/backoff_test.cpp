#include "internal/queue/backoff.hpp"

#include <cassert>
#include <iostream>
#include <optional>

namespace {

using modstore::queue::BackoffPolicy;
using modstore::queue::NextProcessedAfter;

constexpr uint64_t kMinute = 60'000;

void TestFirstAttemptWaitsMinimum() {
  BackoffPolicy policy;
  assert(NextProcessedAfter(policy, std::nullopt, 0, 1'000) == 1'000 + kMinute);
}

void TestScheduleDoublesAndSaturates() {
  BackoffPolicy policy;

  uint64_t                now  = 10'000'000;
  std::optional<uint64_t> last = std::nullopt;
  uint64_t                next = now;

  const uint64_t expected_waits[] = {1, 2, 4, 8, 16, 32, 60, 60, 60};
  for (uint64_t minutes : expected_waits) {
    const uint64_t scheduled = NextProcessedAfter(policy, last, next, now);
    assert(scheduled - now == minutes * kMinute);

    // the worker picks the item up exactly when it becomes eligible
    last = now;
    next = scheduled;
    now  = scheduled;
  }
}

void TestCustomPolicy() {
  BackoffPolicy policy{1'000, 5'000};
  assert(NextProcessedAfter(policy, std::nullopt, 0, 0) == 1'000);
  assert(NextProcessedAfter(policy, uint64_t{0}, 1'000, 1'000) == 3'000);
  assert(NextProcessedAfter(policy, uint64_t{0}, 100'000, 100'000) == 105'000);
}

} // namespace

int main() {
  TestFirstAttemptWaitsMinimum();
  TestScheduleDoublesAndSaturates();
  TestCustomPolicy();

  std::cout << "modstore_unit_backoff: pass\n";
  return 0;
}
