#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace modstore::util {

/*
  Time utilities. Components that schedule work take a NowFn so tests can
  pin the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// A clock that only moves when told to.
class ManualClock {
 public:
  explicit ManualClock(TimePoint start = FromUnixMillis(1'700'000'000'000ULL)) : now_(start) {
  }

  TimePoint Now() const {
    return now_;
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ += delta;
  }

  void Set(TimePoint tp) {
    now_ = tp;
  }

  NowFn Fn() {
    return [this] { return now_; };
  }

 private:
  TimePoint now_;
};

} // namespace modstore::util
